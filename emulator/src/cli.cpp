#include <lemu/common/exceptions.hpp>
#include <lemu/emulator/config.hpp>
#include <lemu/emulator/server.hpp>

#include <csignal>

#include <spdlog/spdlog.h>

void signal_handler(int /*unused*/)
{
  lemu::emulator::Server::instance()->shutdown();
}

int main(int argc, char** argv)
{
  lemu::emulator::config::Config cfg;
  try {
    cfg = lemu::emulator::config::Config::deserialize(argc, argv);
  } catch (const lemu::common::InvalidConfigurationError& err) {
    spdlog::error("Invalid configuration: {}", err.what());
    return 1;
  }

  if (cfg.verbose) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::info);
  }
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  spdlog::info("Executing lemu emulator!");

  // Catch SIGINT
  struct sigaction sigIntHandler {};
  sigIntHandler.sa_handler = &signal_handler;
  sigemptyset(&sigIntHandler.sa_mask);
  sigIntHandler.sa_flags = 0;
  sigaction(SIGINT, &sigIntHandler, nullptr);
  sigaction(SIGTERM, &sigIntHandler, nullptr);

  try {
    lemu::emulator::Server::configure(cfg);
  } catch (const lemu::common::InvalidConfigurationError& err) {
    spdlog::error("Invalid configuration: {}", err.what());
    return 1;
  }
  lemu::emulator::Server::instance()->run();

  lemu::emulator::Server::instance()->wait();

  spdlog::info("Emulator is closing down");
  lemu::emulator::Server::destroy();
  return 0;
}
