#ifndef LEMU_EMULATOR_INVOCATION_HPP
#define LEMU_EMULATOR_INVOCATION_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Json {
  class Value;
} // namespace Json

namespace lemu::emulator::invocation {

  enum class ErrorKind {

    NONE = 0,
    UNKNOWN_FUNCTION,
    COMPILE_ERROR,
    STARTUP_TIMEOUT,
    INITIALIZATION_ERROR,
    FUNCTION_UNAVAILABLE,
    UNKNOWN_INVOCATION_ID,
    TIMEOUT,
    FUNCTION_ERROR

  };

  enum class Outcome { SUCCESS = 0, FUNCTION_ERROR, TOOL_ERROR };

  std::string to_string(ErrorKind kind);

  struct Error {
    ErrorKind kind{ErrorKind::NONE};
    std::string message;
  };

  // Error document reported by a function through the Runtime API.
  struct ErrorInfo {
    std::string error_type;
    std::string error_message;
    std::vector<std::string> stack_trace;

    static ErrorInfo from_json(const Json::Value& value);
    Json::Value to_json() const;
  };

  struct InvocationResult {

    ErrorKind kind{ErrorKind::NONE};
    // Function payload on success, raw error document on function error.
    std::string payload;
    ErrorInfo error;

    Outcome outcome() const;

    bool ok() const
    {
      return kind == ErrorKind::NONE;
    }

    static InvocationResult success(std::string payload);
    static InvocationResult function_error(ErrorInfo info, std::string raw);
    static InvocationResult failure(ErrorKind kind, const std::string& message);
    static InvocationResult failure(const Error& error);
  };

  struct Invocation {

    using clock_t = std::chrono::system_clock;
    using callback_t = std::function<void(InvocationResult&&)>;

    Invocation(
        std::string id, std::string function, std::string payload, std::chrono::milliseconds timeout,
        callback_t&& callback
    );

    const std::string& id() const
    {
      return _id;
    }

    const std::string& function() const
    {
      return _function;
    }

    const std::string& payload() const
    {
      return _payload;
    }

    clock_t::time_point enqueued() const
    {
      return _enqueued;
    }

    clock_t::time_point deadline() const
    {
      return _deadline;
    }

    // Milliseconds since the epoch, as sent in Lambda-Runtime-Deadline-Ms.
    int64_t deadline_ms() const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Delivers the result to the caller. The slot is single-use: only the
    /// first call invokes the callback.
    ///
    /// @return false if the invocation had already been fulfilled
    ////////////////////////////////////////////////////////////////////////////////
    bool fulfill(InvocationResult&& result);

    bool fulfilled() const
    {
      return _fulfilled.load();
    }

  private:
    std::string _id;
    std::string _function;
    std::string _payload;
    clock_t::time_point _enqueued;
    clock_t::time_point _deadline;

    std::atomic<bool> _fulfilled{false};
    callback_t _callback;
  };

  using InvocationPtr = std::shared_ptr<Invocation>;

} // namespace lemu::emulator::invocation

#endif
