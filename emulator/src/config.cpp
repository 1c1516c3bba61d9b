#include <lemu/emulator/config.hpp>

#include <lemu/common/exceptions.hpp>
#include <lemu/common/util.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <cxxopts.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace lemu::emulator::config {

  int validate_memory(int memory)
  {
    if (memory < 128 || memory > 10240) {
      throw common::InvalidConfigurationError(fmt::format(
          "Invalid memory value {}, functions can use between 128 and 10240 MiB", memory
      ));
    }
    return memory;
  }

  void HTTPServer::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(threads));
    archive(CEREAL_NVP(port));
    common::util::cereal_try_load(archive, "address", address);
    common::util::cereal_try_load(archive, "max_payload_size", max_payload_size);
  }

  void HTTPServer::set_defaults()
  {
    address = "127.0.0.1";
    threads = DEFAULT_THREADS_NUMBER;
    port = DEFAULT_PORT;
    max_payload_size = DEFAULT_MAX_PAYLOAD_SIZE;
  }

  void Workers::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(threads));
  }

  void Workers::set_defaults()
  {
    threads = DEFAULT_THREADS_NUMBER;
  }

  void Build::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(command));
    archive(CEREAL_NVP(artifact));
    common::util::cereal_try_load(archive, "target", target);
    common::util::cereal_try_load(archive, "profile", profile);
    common::util::cereal_try_load(archive, "arm64", arm64);

    if (command.empty()) {
      throw common::InvalidConfigurationError("Build command cannot be empty!");
    }
  }

  void Build::set_defaults()
  {
    command = {"cmake", "--build", "{workspace}/build", "--target", "{function}"};
    artifact = "{workspace}/build/{function}";
    target = "";
    profile = "debug";
    arm64 = false;
  }

  void Watcher::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(enabled));
    archive(CEREAL_NVP(debounce));
    common::util::cereal_try_load(archive, "polling", polling);
    common::util::cereal_try_load(archive, "polling_interval", polling_interval);
    common::util::cereal_try_load(archive, "ignore", ignore);
  }

  void Watcher::set_defaults()
  {
    enabled = true;
    polling = false;
    debounce = DEFAULT_DEBOUNCE;
    polling_interval = DEFAULT_POLLING_INTERVAL;
    ignore = {"build", ".git", "target"};
  }

  void Lifecycle::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(retry_budget));
    archive(CEREAL_NVP(startup_timeout));
    common::util::cereal_try_load(archive, "shutdown_grace", shutdown_grace);
    common::util::cereal_try_load(archive, "invocation_timeout", invocation_timeout);
    common::util::cereal_try_load(archive, "memory", memory);

    if (retry_budget < 0 || startup_timeout <= 0 || shutdown_grace < 0 || invocation_timeout <= 0) {
      throw common::InvalidConfigurationError("Lifecycle limits must be positive!");
    }
    validate_memory(memory);
  }

  void Lifecycle::set_defaults()
  {
    retry_budget = DEFAULT_RETRY_BUDGET;
    startup_timeout = DEFAULT_STARTUP_TIMEOUT;
    shutdown_grace = DEFAULT_SHUTDOWN_GRACE;
    invocation_timeout = DEFAULT_INVOCATION_TIMEOUT;
    memory = DEFAULT_MEMORY;
  }

  void Function::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_try_load(archive, "source", source);
    common::util::cereal_load_optional(archive, "environment", environment);

    int value{};
    if (common::util::cereal_try_load(archive, "memory", value)) {
      memory = validate_memory(value);
    }
    if (common::util::cereal_try_load(archive, "timeout", value)) {
      if (value <= 0) {
        throw common::InvalidConfigurationError(fmt::format("Invalid timeout value {}", value));
      }
      timeout = value;
    }
  }

  void Functions::load(cereal::JSONInputArchive& archive)
  {
    functions.clear();

    while (true) {
      const char* name = archive.getNodeName();
      if (!name) {
        break;
      }

      std::string key{name};
      Function function;
      archive(function);
      functions[key] = std::move(function);
    }
  }

  void Functions::set_defaults()
  {
    functions.clear();
  }

  std::string Config::runtime_api_address() const
  {
    // Listening on all interfaces still needs a routable address for the children.
    std::string host = (http.address == "0.0.0.0") ? "127.0.0.1" : http.address;
    return fmt::format("{}:{}", host, http.port);
  }

  Config Config::deserialize(std::istream& in_stream)
  {
    Config cfg;
    cereal::JSONInputArchive archive_in(in_stream);
    cfg.load(archive_in);
    return cfg;
  }

  Config Config::deserialize(int argc, char** argv)
  {
    cxxopts::Options options("lemu-emulator", "Executes local serverless control plane.");
    options.add_options()("c,config", "JSON config.", cxxopts::value<std::string>()->default_value(""))(
        "w,workspace", "Workspace root, overrides config.",
        cxxopts::value<std::string>()->default_value("")
    )("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"));
    auto parsed_options = options.parse(argc, argv);

    std::string config_file{parsed_options["config"].as<std::string>()};

    Config cfg;
    if (config_file.length() > 0) {
      std::ifstream in_stream{config_file};
      if (!in_stream.is_open()) {
        spdlog::error("Could not open config file {}", config_file);
        exit(1);
      }

      cereal::JSONInputArchive archive_in(in_stream);
      cfg.load(archive_in);
    } else {

      cfg.set_defaults();
    }

    std::string workspace{parsed_options["workspace"].as<std::string>()};
    if (!workspace.empty()) {
      cfg.workspace = workspace;
    }
    cfg.workspace = std::filesystem::absolute(cfg.workspace).lexically_normal().string();

    if (parsed_options["verbose"].as<bool>()) {
      cfg.verbose = true;
    }

    return cfg;
  }

  void Config::set_defaults()
  {
    verbose = false;
    workspace = std::filesystem::current_path().string();
    functions_dir = "functions";
    log_directory = std::nullopt;

    http.set_defaults();
    workers.set_defaults();
    build.set_defaults();
    watcher.set_defaults();
    lifecycle.set_defaults();
    environment.set_defaults();
    functions.set_defaults();
  }

  void Config::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(verbose));
    archive(CEREAL_NVP(workspace));
    common::util::cereal_try_load(archive, "functions-dir", functions_dir);

    std::string log_dir;
    if (common::util::cereal_try_load(archive, "log-directory", log_dir)) {
      log_directory = std::move(log_dir);
    }

    common::util::cereal_load_optional(archive, "http", this->http);
    common::util::cereal_load_optional(archive, "workers", this->workers);
    common::util::cereal_load_optional(archive, "build", this->build);
    common::util::cereal_load_optional(archive, "watcher", this->watcher);
    common::util::cereal_load_optional(archive, "lifecycle", this->lifecycle);
    common::util::cereal_load_optional(archive, "environment", this->environment);
    common::util::cereal_load_optional(archive, "functions", this->functions);
  }

} // namespace lemu::emulator::config
