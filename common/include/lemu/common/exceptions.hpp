#ifndef LEMU_COMMON_EXCEPTIONS_HPP
#define LEMU_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace lemu::common {

  struct LemuException : std::runtime_error {

    LemuException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : LemuException {

    InvalidConfigurationError(const std::string& msg) : LemuException(msg) {}
  };

  struct UnknownFunction : LemuException {

    UnknownFunction(const std::string& name)
        : LemuException("Unknown function " + name), function_name(name)
    {
    }

    std::string function_name;
  };

  struct UnknownInvocationId : LemuException {

    UnknownInvocationId(const std::string& function, const std::string& id)
        : LemuException("Invocation " + id + " is not outstanding for function " + function),
          function_name(function), invocation_id(id)
    {
    }

    std::string function_name;
    std::string invocation_id;
  };

  struct CompileError : LemuException {

    CompileError(const std::string& function, int exit_status, std::string diagnostics)
        : LemuException("Build of function " + function + " failed"), function_name(function),
          exit_status(exit_status), diagnostics(std::move(diagnostics))
    {
    }

    std::string function_name;
    int exit_status;
    std::string diagnostics;
  };

} // namespace lemu::common

#endif
