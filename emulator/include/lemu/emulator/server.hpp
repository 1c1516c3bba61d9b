#ifndef LEMU_EMULATOR_SERVER_HPP
#define LEMU_EMULATOR_SERVER_HPP

#include <lemu/emulator/builder.hpp>
#include <lemu/emulator/config.hpp>
#include <lemu/emulator/discovery.hpp>
#include <lemu/emulator/http.hpp>
#include <lemu/emulator/launcher.hpp>
#include <lemu/emulator/registry.hpp>
#include <lemu/emulator/router.hpp>
#include <lemu/emulator/runtime_api.hpp>
#include <lemu/emulator/watcher.hpp>
#include <lemu/emulator/worker.hpp>

#include <memory>

#include <spdlog/spdlog.h>

namespace lemu::emulator {

  struct Server {

    void run();

    void shutdown();

    void wait();

    int http_port() const
    {
      return _http_server->port();
    }

    registry::Registry& registry()
    {
      return _registry;
    }

    router::Router& router()
    {
      return _router;
    }

    static void configure(config::Config& cfg)
    {
      _instance.reset(new Server{cfg});
    }

    static Server* instance()
    {
      return _instance.get();
    }

    static void destroy()
    {
      _instance.reset();
    }

  private:
    static std::shared_ptr<Server> _instance;

    Server(config::Config& cfg);

    std::shared_ptr<spdlog::logger> _logger;

    config::Config _config;

    worker::Workers _workers;

    discovery::Discovery _discovery;

    builder::CommandBuilder _builder;

    launcher::ProcessLauncher _launcher;

    registry::Registry _registry;

    router::Router _router;

    RuntimeApi _runtime_api;

    watcher::Watcher _watcher;

    // Shared pointer is required by drogon
    std::shared_ptr<HttpServer> _http_server;
  };

} // namespace lemu::emulator

#endif
