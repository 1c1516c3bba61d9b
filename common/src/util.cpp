#include <lemu/common/util.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lemu::common::util {

  void traceback()
  {
    void* array[10];
    size_t size = backtrace(array, 10);
    char** trace = backtrace_symbols(array, size);
    for (size_t i = 0; i < size; ++i)
      spdlog::warn("Traceback {}: {}", i, trace[i]);
    free(trace);
  }

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    // Follow the global level selected by the executable.
    logger->set_level(spdlog::get_level());
    return logger;
  }

} // namespace lemu::common::util
