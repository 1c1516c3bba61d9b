#ifndef LEMU_SDK_INVOCATION_HPP
#define LEMU_SDK_INVOCATION_HPP

#include <string>

namespace lemu::sdk {

  enum class Status { SUCCESS = 0, FUNCTION_ERROR = 1, TOOL_ERROR = 2 };

  struct InvocationResult {

    Status status{Status::TOOL_ERROR};

    // HTTP status of the invoke endpoint; 0 when the request did not complete.
    int status_code{};

    // Function response, or the error document of a function error.
    std::string payload;

    std::string error_type{};

    std::string error_message{};

    // 0 on success, 1 on a function error or timeout, 2 on a tooling error.
    int exit_code() const
    {
      return static_cast<int>(status);
    }
  };

} // namespace lemu::sdk

#endif
