#include <lemu/emulator/router.hpp>

#include <lemu/common/exceptions.hpp>
#include <lemu/common/util.hpp>
#include <lemu/emulator/registry.hpp>

#include <fmt/format.h>

namespace lemu::emulator::router {

  using invocation::ErrorKind;
  using invocation::InvocationResult;

  Router::Router(registry::Registry& registry) : _registry(registry), _loop_thread("Deadlines")
  {
    _logger = common::util::create_logger("Router");
    _loop_thread.run();
  }

  Router::~Router()
  {
    shutdown();
  }

  void Router::shutdown()
  {
    if (_stopped.exchange(true)) {
      return;
    }
    _loop_thread.getLoop()->quit();
    _loop_thread.wait();
  }

  std::string Router::submit(
      const std::string& function, std::string payload,
      std::optional<std::chrono::milliseconds> timeout, callback_t&& callback
  )
  {
    function::FunctionPtr fn;
    try {
      fn = _registry.resolve(function);
    } catch (const common::UnknownFunction& err) {
      _logger->warn("Invocation of unknown function {}", function);
      callback(InvocationResult::failure(ErrorKind::UNKNOWN_FUNCTION, err.what()));
      return "";
    }

    auto deadline = timeout.value_or(
        std::chrono::duration_cast<std::chrono::milliseconds>(fn->descriptor().timeout)
    );

    auto inv = std::make_shared<invocation::Invocation>(
        _uuid.generate_str(), function, std::move(payload), deadline, std::move(callback)
    );
    std::string id = inv->id();
    SPDLOG_LOGGER_DEBUG(_logger, "Submit invocation {} of {}, timeout {} ms", id, function, deadline.count());

    // The timer keeps no ownership; a completed invocation is released immediately.
    std::weak_ptr<invocation::Invocation> weak{inv};
    _loop_thread.getLoop()->runAfter(deadline.count() / 1000.0, [weak, deadline, logger = _logger]() {
      auto ptr = weak.lock();
      if (!ptr) {
        return;
      }

      bool expired = ptr->fulfill(InvocationResult::failure(
          ErrorKind::TIMEOUT,
          fmt::format("Task timed out after {:.2f} seconds", deadline.count() / 1000.0)
      ));
      if (expired) {
        logger->info("Invocation {} of {} timed out", ptr->id(), ptr->function());
      }
    });

    try {
      _registry.dispatch(inv);
    } catch (const common::UnknownFunction& err) {
      inv->fulfill(InvocationResult::failure(ErrorKind::UNKNOWN_FUNCTION, err.what()));
    }

    return id;
  }

  std::future<InvocationResult> Router::submit(
      const std::string& function, std::string payload,
      std::optional<std::chrono::milliseconds> timeout
  )
  {
    auto promise = std::make_shared<std::promise<InvocationResult>>();
    auto future = promise->get_future();
    submit(function, std::move(payload), timeout, [promise](InvocationResult&& result) {
      promise->set_value(std::move(result));
    });
    return future;
  }

} // namespace lemu::emulator::router
