#include <lemu/emulator/http.hpp>

#include <lemu/common/exceptions.hpp>
#include <lemu/common/util.hpp>
#include <lemu/emulator/config.hpp>
#include <lemu/emulator/registry.hpp>
#include <lemu/emulator/router.hpp>
#include <lemu/emulator/runtime_api.hpp>

#include <chrono>
#include <random>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpTypes.h>
#include <fmt/format.h>
#include <json/value.h>
#include <json/writer.h>

namespace lemu::emulator {

  using invocation::ErrorKind;
  using invocation::InvocationResult;
  using invocation::Outcome;

  namespace {

    std::string trace_id()
    {
      thread_local std::mt19937_64 generator{std::random_device{}()};
      auto now = std::chrono::duration_cast<std::chrono::seconds>(
                     std::chrono::system_clock::now().time_since_epoch()
      )
                     .count();
      return fmt::format(
          "Root=1-{:08x}-{:012x}{:012x};Parent={:016x};Sampled=0", now,
          generator() & 0xFFFFFFFFFFFF, generator() & 0xFFFFFFFFFFFF, generator()
      );
    }

    std::string function_arn(const std::string& function)
    {
      return fmt::format("arn:aws:lambda:us-east-1:012345678912:function:{}", function);
    }

  } // namespace

  HttpServer::HttpServer(
      const config::HTTPServer& cfg, RuntimeApi& runtime_api, router::Router& router,
      registry::Registry& registry
  )
      : _address(cfg.address), _port(cfg.port), _threads(cfg.threads), _runtime_api(runtime_api),
        _router(router), _registry(registry)
  {
    _logger = common::util::create_logger("HttpServer");
    drogon::app().setClientMaxBodySize(cfg.max_payload_size);
    // Next-invocation polls stay open until work arrives.
    drogon::app().setIdleConnectionTimeout(0);
  }

  void HttpServer::run()
  {
    drogon::app().disableSigtermHandling();
    drogon::app().registerController(shared_from_this());
    drogon::app().setThreadNum(_threads);
    _logger->info("Listening on {}:{}", _address, _port);
    _server_thread =
        std::thread{[this]() { drogon::app().addListener(_address, _port).run(); }};
  }

  void HttpServer::shutdown()
  {
    _logger->info("Stopping HTTP server");
    if (drogon::app().isRunning()) {
      drogon::app().getLoop()->queueInLoop([]() { drogon::app().quit(); });
    }
  }

  void HttpServer::wait()
  {
    if (_server_thread.joinable()) {
      _server_thread.join();
    }
    _logger->info("Stopped HTTP server");
  }

  drogon::HttpResponsePtr HttpServer::failed_response(
      const std::string& error_type, const std::string& message, drogon::HttpStatusCode code
  )
  {
    Json::Value json;
    json["errorType"] = error_type;
    json["errorMessage"] = message;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
    resp->setStatusCode(code);
    return resp;
  }

  drogon::HttpResponsePtr HttpServer::accepted_response()
  {
    Json::Value json;
    json["status"] = "OK";
    auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
    resp->setStatusCode(drogon::k202Accepted);
    return resp;
  }

  drogon::HttpStatusCode HttpServer::status_code(ErrorKind kind)
  {
    switch (kind) {
    case ErrorKind::NONE:
    case ErrorKind::FUNCTION_ERROR:
    case ErrorKind::TIMEOUT:
      return drogon::k200OK;
    case ErrorKind::UNKNOWN_FUNCTION:
      return drogon::k404NotFound;
    case ErrorKind::UNKNOWN_INVOCATION_ID:
      return drogon::k400BadRequest;
    case ErrorKind::COMPILE_ERROR:
      return drogon::k500InternalServerError;
    case ErrorKind::STARTUP_TIMEOUT:
    case ErrorKind::INITIALIZATION_ERROR:
    case ErrorKind::FUNCTION_UNAVAILABLE:
      return drogon::k503ServiceUnavailable;
    }
    return drogon::k500InternalServerError;
  }

  drogon::HttpResponsePtr HttpServer::invoke_response(const InvocationResult& result)
  {
    switch (result.outcome()) {
    case Outcome::SUCCESS: {
      auto resp = drogon::HttpResponse::newHttpResponse();
      resp->setStatusCode(drogon::k200OK);
      resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
      resp->addHeader("X-Amz-Executed-Version", "$LATEST");
      resp->setBody(result.payload);
      return resp;
    }
    case Outcome::FUNCTION_ERROR: {
      auto resp = drogon::HttpResponse::newHttpResponse();
      resp->setStatusCode(drogon::k200OK);
      resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
      resp->addHeader("X-Amz-Executed-Version", "$LATEST");
      resp->addHeader("X-Amz-Function-Error", result.error.error_type);
      if (!result.payload.empty()) {
        resp->setBody(result.payload);
      } else {
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        resp->setBody(Json::writeString(writer, result.error.to_json()));
      }
      return resp;
    }
    case Outcome::TOOL_ERROR:
    default:
      return failed_response(
          invocation::to_string(result.kind), result.error.error_message, status_code(result.kind)
      );
    }
  }

  void HttpServer::next_invocation(
      const request_t&, callback_t&& callback, const std::string& function
  )
  {
    auto poller = [callback, function](
                      invocation::InvocationPtr inv, std::optional<invocation::Error> error
                  ) {
      if (error.has_value() || !inv) {
        callback(failed_response(
            invocation::to_string(ErrorKind::FUNCTION_UNAVAILABLE),
            error.has_value() ? error->message : "No invocation", drogon::k410Gone
        ));
        return;
      }

      auto resp = drogon::HttpResponse::newHttpResponse();
      resp->setStatusCode(drogon::k200OK);
      resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
      resp->addHeader("Lambda-Runtime-Aws-Request-Id", inv->id());
      resp->addHeader("Lambda-Runtime-Deadline-Ms", std::to_string(inv->deadline_ms()));
      resp->addHeader("Lambda-Runtime-Invoked-Function-Arn", function_arn(function));
      resp->addHeader("Lambda-Runtime-Trace-Id", trace_id());
      resp->setBody(inv->payload());
      callback(resp);
    };

    try {
      _runtime_api.next_invocation(function, std::move(poller));
    } catch (const common::UnknownFunction& err) {
      _logger->warn("Poll for unknown function {}", function);
      callback(failed_response("UnknownFunction", err.what(), drogon::k404NotFound));
    }
  }

  void HttpServer::invocation_response(
      const request_t& request, callback_t&& callback, const std::string& function,
      const std::string& id
  )
  {
    try {
      _runtime_api.submit_response(function, id, std::string{request->body()});
      callback(accepted_response());
    } catch (const common::UnknownFunction& err) {
      callback(failed_response("UnknownFunction", err.what(), drogon::k404NotFound));
    } catch (const common::UnknownInvocationId& err) {
      _logger->warn("Response for unknown invocation {} of {}", id, function);
      callback(failed_response("UnknownInvocationId", err.what(), drogon::k400BadRequest));
    }
  }

  void HttpServer::invocation_error(
      const request_t& request, callback_t&& callback, const std::string& function,
      const std::string& id
  )
  {
    try {
      _runtime_api.submit_error(
          function, id, std::string{request->body()},
          request->getHeader("Lambda-Runtime-Function-Error-Type")
      );
      callback(accepted_response());
    } catch (const common::UnknownFunction& err) {
      callback(failed_response("UnknownFunction", err.what(), drogon::k404NotFound));
    } catch (const common::UnknownInvocationId& err) {
      _logger->warn("Error for unknown invocation {} of {}", id, function);
      callback(failed_response("UnknownInvocationId", err.what(), drogon::k400BadRequest));
    }
  }

  void HttpServer::init_error(
      const request_t& request, callback_t&& callback, const std::string& function
  )
  {
    try {
      _runtime_api.init_error(
          function, std::string{request->body()},
          request->getHeader("Lambda-Runtime-Function-Error-Type")
      );
      callback(accepted_response());
    } catch (const common::UnknownFunction& err) {
      callback(failed_response("UnknownFunction", err.what(), drogon::k404NotFound));
    }
  }

  void HttpServer::invoke(
      const request_t& request, callback_t&& callback, const std::string& function
  )
  {
    std::optional<std::chrono::milliseconds> timeout;
    std::string timeout_str = request->getParameter("timeout");
    if (!timeout_str.empty()) {
      try {
        long long value = std::stoll(timeout_str);
        if (value <= 0) {
          throw std::invalid_argument{timeout_str};
        }
        timeout = std::chrono::milliseconds{value};
      } catch (const std::logic_error&) {
        callback(failed_response(
            "InvalidParameterValue", fmt::format("Invalid timeout {}", timeout_str),
            drogon::k400BadRequest
        ));
        return;
      }
    }

    _logger->info("Invoke function {}", function);
    _router.submit(
        function, std::string{request->body()}, timeout,
        [callback = std::move(callback)](InvocationResult&& result) {
          callback(invoke_response(result));
        }
    );
  }

  void HttpServer::list_functions(const request_t&, callback_t&& callback)
  {
    Json::Value functions{Json::arrayValue};
    for (const auto& [name, state] : _registry.functions()) {
      Json::Value fn;
      fn["name"] = name;
      fn["state"] = function::to_string(state);
      functions.append(fn);
    }

    Json::Value json;
    json["functions"] = functions;
    callback(drogon::HttpResponse::newHttpJsonResponse(json));
  }

} // namespace lemu::emulator
