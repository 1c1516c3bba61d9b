#ifndef LEMU_EMULATOR_RUNTIME_API_HPP
#define LEMU_EMULATOR_RUNTIME_API_HPP

#include <lemu/emulator/function.hpp>
#include <lemu/emulator/invocation.hpp>

#include <string>

#include <spdlog/spdlog.h>

namespace lemu::emulator::registry {
  class Registry;
} // namespace lemu::emulator::registry

namespace lemu::emulator {

  // Version segment of all Runtime API paths.
  static constexpr const char* RUNTIME_API_VERSION = "2018-06-01";

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Protocol operations of the Lambda Runtime API, independent of the HTTP
  /// transport. Each operation is addressed by the function name that is part of
  /// the AWS_LAMBDA_RUNTIME_API value of the process.
  ///
  /// Operations on unknown functions throw common::UnknownFunction; responses for
  /// invocations that are not outstanding throw common::UnknownInvocationId.
  ////////////////////////////////////////////////////////////////////////////////
  class RuntimeApi {
  public:
    using poller_t = function::InvocationQueue::poller_t;

    RuntimeApi(registry::Registry& registry);

    void next_invocation(const std::string& function, poller_t&& poller);

    void submit_response(const std::string& function, const std::string& id, std::string payload);

    void submit_error(
        const std::string& function, const std::string& id, const std::string& body,
        const std::string& error_type
    );

    void init_error(
        const std::string& function, const std::string& body, const std::string& error_type
    );

    // Error document of a request body; falls back to the raw body as the message.
    static invocation::ErrorInfo parse_error(const std::string& body, const std::string& error_type);

  private:
    registry::Registry& _registry;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lemu::emulator

#endif
