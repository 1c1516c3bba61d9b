#include <lemu/sdk/invoker.hpp>

#include <lemu/common/http.hpp>

#include <fstream>
#include <iostream>
#include <iterator>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

struct Options {
  std::string address;
  std::string function;
  std::string payload;
  std::optional<std::chrono::milliseconds> timeout;
  bool verbose;
};

Options opts(int argc, char** argv)
{
  cxxopts::Options options("lemu-invoke", "Invoke a function hosted by the lemu emulator.");
  options.add_options()(
      "a,address", "Emulator address", cxxopts::value<std::string>()->default_value("http://127.0.0.1:9000")
  )("f,function", "Function name", cxxopts::value<std::string>())(
      "d,data", "Event payload", cxxopts::value<std::string>()->default_value("{}")
  )("file", "Read the event payload from a file", cxxopts::value<std::string>())(
      "t,timeout", "Invocation timeout in milliseconds", cxxopts::value<int>()
  )("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))("h,help", "Print usage");
  auto parsed_options = options.parse(argc, argv);

  if (parsed_options.count("help")) {
    std::cout << options.help() << std::endl;
    exit(0);
  }

  Options result;
  result.address = parsed_options["address"].as<std::string>();
  result.function = parsed_options["function"].as<std::string>();
  result.verbose = parsed_options["verbose"].as<bool>();

  if (parsed_options.count("file")) {
    std::ifstream in{parsed_options["file"].as<std::string>()};
    if (!in.is_open()) {
      throw std::runtime_error{
          fmt::format("Cannot open payload file {}", parsed_options["file"].as<std::string>())};
    }
    result.payload = std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
  } else {
    result.payload = parsed_options["data"].as<std::string>();
  }

  if (parsed_options.count("timeout")) {
    result.timeout = std::chrono::milliseconds{parsed_options["timeout"].as<int>()};
  }

  return result;
}

int main(int argc, char** argv)
{
  Options options;
  try {
    options = opts(argc, argv);
  } catch (const std::exception& err) {
    spdlog::error("Incorrect arguments: {}", err.what());
    return 2;
  }

  if (options.verbose) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::warn);
  }
  spdlog::set_pattern("[%H:%M:%S:%f] [%l] %v ");

  lemu::sdk::InvocationResult result;
  {
    lemu::sdk::Invoker invoker{options.address, 1};
    spdlog::debug("Invoking {} at {}", options.function, options.address);
    result = invoker.invoke(options.function, options.payload, options.timeout);
  }
  lemu::common::http::HTTPClientFactory::shutdown();

  switch (result.status) {
  case lemu::sdk::Status::SUCCESS:
    std::cout << result.payload << std::endl;
    break;
  case lemu::sdk::Status::FUNCTION_ERROR:
    std::cout << result.payload << std::endl;
    spdlog::error("Function {} failed: {} {}", options.function, result.error_type, result.error_message);
    break;
  case lemu::sdk::Status::TOOL_ERROR:
    spdlog::error(
        "Invocation of {} failed with status {}: {} {}", options.function, result.status_code,
        result.error_type, result.error_message
    );
    break;
  }

  return result.exit_code();
}
