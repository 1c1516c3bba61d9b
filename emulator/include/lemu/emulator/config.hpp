#ifndef LEMU_EMULATOR_CONFIG_HPP
#define LEMU_EMULATOR_CONFIG_HPP

#include <lemu/emulator/environment.hpp>

#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace lemu::emulator::config {

  struct HTTPServer {

    static constexpr int DEFAULT_THREADS_NUMBER = 1;
    static constexpr int DEFAULT_PORT = 9000;
    // Lambda's synchronous payload limit, 6 MiB.
    static constexpr int DEFAULT_MAX_PAYLOAD_SIZE = 6 * 1024 * 1024;

    HTTPServer()
    {
      set_defaults();
    }

    std::string address;
    int port;
    int threads;
    int max_payload_size;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Workers {
    static constexpr int DEFAULT_THREADS_NUMBER = 4;

    Workers()
    {
      set_defaults();
    }

    int threads;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Build {

    Build()
    {
      set_defaults();
    }

    std::vector<std::string> command;
    std::string artifact;
    std::string target;
    std::string profile;
    bool arm64;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Watcher {

    static constexpr int DEFAULT_DEBOUNCE = 500;
    static constexpr int DEFAULT_POLLING_INTERVAL = 1000;

    Watcher()
    {
      set_defaults();
    }

    bool enabled;
    // Skips inotify and compares fingerprints periodically.
    bool polling;
    // Both in milliseconds.
    int debounce;
    int polling_interval;
    std::vector<std::string> ignore;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Lifecycle {

    static constexpr int DEFAULT_RETRY_BUDGET = 3;
    static constexpr int DEFAULT_STARTUP_TIMEOUT = 10000;
    static constexpr int DEFAULT_SHUTDOWN_GRACE = 2000;
    static constexpr int DEFAULT_INVOCATION_TIMEOUT = 30;
    static constexpr int DEFAULT_MEMORY = 4096;

    Lifecycle()
    {
      set_defaults();
    }

    int retry_budget;
    // Milliseconds.
    int startup_timeout;
    int shutdown_grace;
    // Seconds.
    int invocation_timeout;
    // MiB.
    int memory;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Function {

    std::string source;
    environment::Environment environment;
    std::optional<int> memory;
    std::optional<int> timeout;

    void load(cereal::JSONInputArchive& archive);
  };

  struct Functions {

    std::map<std::string, Function> functions;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Config {

    HTTPServer http;
    Workers workers;
    Build build;
    Watcher watcher;
    Lifecycle lifecycle;

    std::string workspace;
    std::string functions_dir;
    std::optional<std::string> log_directory;

    environment::Environment environment;
    Functions functions;

    bool verbose;

    Config()
    {
      set_defaults();
    }

    void set_defaults();

    void load(cereal::JSONInputArchive& archive);

    // Address handed to function processes as AWS_LAMBDA_RUNTIME_API, without the function suffix.
    std::string runtime_api_address() const;

    static Config deserialize(int argc, char** argv);
    static Config deserialize(std::istream& in);
  };

  int validate_memory(int memory);

} // namespace lemu::emulator::config

#endif
