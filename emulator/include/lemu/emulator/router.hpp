#ifndef LEMU_EMULATOR_ROUTER_HPP
#define LEMU_EMULATOR_ROUTER_HPP

#include <lemu/common/uuid.hpp>
#include <lemu/emulator/invocation.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>
#include <trantor/net/EventLoopThread.h>

namespace lemu::emulator::registry {
  class Registry;
} // namespace lemu::emulator::registry

namespace lemu::emulator::router {

  class Router {
  public:
    using callback_t = invocation::Invocation::callback_t;

    Router(registry::Registry& registry);

    ~Router();

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Submits an invocation and delivers exactly one result through the
    /// callback: the function's response, its error, a timeout, or the tooling
    /// error that prevented the invocation.
    ///
    /// @param[in] function function name
    /// @param[in] payload opaque request body
    /// @param[in] timeout overrides the function's configured timeout
    /// @return invocation identifier; empty when the function is unknown
    ////////////////////////////////////////////////////////////////////////////////
    std::string submit(
        const std::string& function, std::string payload,
        std::optional<std::chrono::milliseconds> timeout, callback_t&& callback
    );

    std::future<invocation::InvocationResult> submit(
        const std::string& function, std::string payload,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    void shutdown();

  private:
    registry::Registry& _registry;

    common::UUID _uuid;

    std::atomic<bool> _stopped{false};

    // Invocation deadlines.
    trantor::EventLoopThread _loop_thread;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lemu::emulator::router

#endif
