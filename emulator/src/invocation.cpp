#include <lemu/emulator/invocation.hpp>

#include <json/value.h>

namespace lemu::emulator::invocation {

  std::string to_string(ErrorKind kind)
  {
    switch (kind) {
    case ErrorKind::NONE:
      return "None";
    case ErrorKind::UNKNOWN_FUNCTION:
      return "UnknownFunction";
    case ErrorKind::COMPILE_ERROR:
      return "CompileError";
    case ErrorKind::STARTUP_TIMEOUT:
      return "StartupTimeout";
    case ErrorKind::INITIALIZATION_ERROR:
      return "InitializationError";
    case ErrorKind::FUNCTION_UNAVAILABLE:
      return "FunctionUnavailable";
    case ErrorKind::UNKNOWN_INVOCATION_ID:
      return "UnknownInvocationId";
    case ErrorKind::TIMEOUT:
      return "Timeout";
    case ErrorKind::FUNCTION_ERROR:
      return "FunctionError";
    }
    return "Unknown";
  }

  ErrorInfo ErrorInfo::from_json(const Json::Value& value)
  {
    ErrorInfo info;
    if (!value.isObject()) {
      return info;
    }

    info.error_type = value.get("errorType", "").asString();
    info.error_message = value.get("errorMessage", "").asString();
    const Json::Value& trace = value["stackTrace"];
    if (trace.isArray()) {
      for (const auto& line : trace) {
        info.stack_trace.emplace_back(line.asString());
      }
    }
    return info;
  }

  Json::Value ErrorInfo::to_json() const
  {
    Json::Value json;
    json["errorType"] = error_type;
    json["errorMessage"] = error_message;
    if (!stack_trace.empty()) {
      Json::Value trace{Json::arrayValue};
      for (const auto& line : stack_trace) {
        trace.append(line);
      }
      json["stackTrace"] = trace;
    }
    return json;
  }

  Outcome InvocationResult::outcome() const
  {
    switch (kind) {
    case ErrorKind::NONE:
      return Outcome::SUCCESS;
    case ErrorKind::FUNCTION_ERROR:
    case ErrorKind::TIMEOUT:
      return Outcome::FUNCTION_ERROR;
    default:
      return Outcome::TOOL_ERROR;
    }
  }

  InvocationResult InvocationResult::success(std::string payload)
  {
    InvocationResult result;
    result.kind = ErrorKind::NONE;
    result.payload = std::move(payload);
    return result;
  }

  InvocationResult InvocationResult::function_error(ErrorInfo info, std::string raw)
  {
    InvocationResult result;
    result.kind = ErrorKind::FUNCTION_ERROR;
    result.error = std::move(info);
    result.payload = std::move(raw);
    return result;
  }

  InvocationResult InvocationResult::failure(ErrorKind kind, const std::string& message)
  {
    InvocationResult result;
    result.kind = kind;
    result.error.error_type = to_string(kind);
    result.error.error_message = message;
    return result;
  }

  InvocationResult InvocationResult::failure(const Error& error)
  {
    return failure(error.kind, error.message);
  }

  Invocation::Invocation(
      std::string id, std::string function, std::string payload, std::chrono::milliseconds timeout,
      callback_t&& callback
  )
      : _id(std::move(id)), _function(std::move(function)), _payload(std::move(payload)),
        _enqueued(clock_t::now()), _callback(std::move(callback))
  {
    _deadline = _enqueued + timeout;
  }

  int64_t Invocation::deadline_ms() const
  {
    return std::chrono::duration_cast<std::chrono::milliseconds>(_deadline.time_since_epoch())
        .count();
  }

  bool Invocation::fulfill(InvocationResult&& result)
  {
    bool expected = false;
    if (!_fulfilled.compare_exchange_strong(expected, true)) {
      return false;
    }

    if (_callback) {
      auto callback = std::move(_callback);
      callback(std::move(result));
    }
    return true;
  }

} // namespace lemu::emulator::invocation
