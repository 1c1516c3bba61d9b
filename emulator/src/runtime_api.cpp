#include <lemu/emulator/runtime_api.hpp>

#include <lemu/common/exceptions.hpp>
#include <lemu/common/util.hpp>
#include <lemu/emulator/registry.hpp>

#include <memory>

#include <json/reader.h>
#include <json/value.h>
#include <json/writer.h>

namespace lemu::emulator {

  RuntimeApi::RuntimeApi(registry::Registry& registry) : _registry(registry)
  {
    _logger = common::util::create_logger("RuntimeApi");
  }

  invocation::ErrorInfo RuntimeApi::parse_error(const std::string& body, const std::string& error_type)
  {
    Json::Value json;
    std::string errors;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

    invocation::ErrorInfo info;
    if (!body.empty() && reader->parse(body.data(), body.data() + body.size(), &json, &errors) &&
        json.isObject()) {
      info = invocation::ErrorInfo::from_json(json);
    } else {
      info.error_message = body;
    }

    if (info.error_type.empty()) {
      info.error_type = error_type.empty() ? "Unhandled" : error_type;
    }
    return info;
  }

  void RuntimeApi::next_invocation(const std::string& function, poller_t&& poller)
  {
    SPDLOG_LOGGER_DEBUG(_logger, "Next invocation request from {}", function);
    _registry.next_invocation(function, std::move(poller));
  }

  void
  RuntimeApi::submit_response(const std::string& function, const std::string& id, std::string payload)
  {
    SPDLOG_LOGGER_DEBUG(_logger, "Response of invocation {} from {}", id, function);
    _registry.complete(function, id, invocation::InvocationResult::success(std::move(payload)));
  }

  void RuntimeApi::submit_error(
      const std::string& function, const std::string& id, const std::string& body,
      const std::string& error_type
  )
  {
    auto info = parse_error(body, error_type);
    _logger->info("Function {} reported error {} for invocation {}", function, info.error_type, id);

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    std::string raw = Json::writeString(writer, info.to_json());
    _registry.complete(function, id, invocation::InvocationResult::function_error(std::move(info), raw));
  }

  void RuntimeApi::init_error(
      const std::string& function, const std::string& body, const std::string& error_type
  )
  {
    auto info = parse_error(body, error_type);
    _logger->error(
        "Function {} failed to initialize: {}: {}", function, info.error_type, info.error_message
    );
    _registry.init_error(function, info);
  }

} // namespace lemu::emulator
