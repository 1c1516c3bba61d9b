#include <lemu/sdk/invoker.hpp>

#include <drogon/HttpClient.h>
#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>
#include <fmt/format.h>
#include <json/value.h>

namespace lemu::sdk {

  Invoker::Invoker(const std::string& emulator_addr, int thread_num)
  {
    common::http::HTTPClientFactory::initialize(thread_num);

    for (int i = 0; i < thread_num; ++i) {
      _clients.emplace(common::http::HTTPClientFactory::create_client(emulator_addr));
    }
  }

  common::http::HTTPClient Invoker::_get_client()
  {
    std::unique_lock<std::mutex> lock{_clients_mutex};
    _cv.wait(lock, [this]() { return !_clients.empty(); });

    auto client = std::move(_clients.front());
    _clients.pop();

    return client;
  }

  void Invoker::_return_client(common::http::HTTPClient& client)
  {
    {
      std::unique_lock<std::mutex> lock{_clients_mutex};
      _clients.push(std::move(client));
    }
    _cv.notify_one();
  }

  InvocationResult Invoker::invoke(
      const std::string& function_name, const std::string& payload,
      std::optional<std::chrono::milliseconds> timeout
  )
  {
    return invoke_async(function_name, payload, timeout).get();
  }

  std::future<InvocationResult> Invoker::invoke_async(
      const std::string& function_name, const std::string& payload,
      std::optional<std::chrono::milliseconds> timeout
  )
  {
    // Drogon callbacks must be copy constructible.
    auto p = std::make_shared<std::promise<InvocationResult>>();
    auto fut = p->get_future();

    std::string timeout_ms = timeout.has_value() ? std::to_string(timeout->count()) : "";

    auto http_client = _get_client();
    http_client.post(
        fmt::format("/2015-03-31/functions/{}/invocations", function_name),
        {{"timeout", timeout_ms}}, payload,
        [p](drogon::ReqResult result, const drogon::HttpResponsePtr& response) mutable {
          InvocationResult res;

          if (result != drogon::ReqResult::Ok || !response) {
            res.status = Status::TOOL_ERROR;
            res.error_type = "RequestFailed";
            res.error_message = fmt::format("Request to the emulator failed: {}", to_string(result));
            p->set_value(std::move(res));
            return;
          }

          res.status_code = response->getStatusCode();
          res.payload = std::string{response->body()};

          const std::string& function_error = response->getHeader("X-Amz-Function-Error");
          if (response->getStatusCode() == drogon::k200OK && function_error.empty()) {
            res.status = Status::SUCCESS;
            p->set_value(std::move(res));
            return;
          }

          res.status = response->getStatusCode() == drogon::k200OK ? Status::FUNCTION_ERROR
                                                                    : Status::TOOL_ERROR;
          res.error_type = function_error;

          auto json = response->getJsonObject();
          if (json) {
            if (res.error_type.empty()) {
              res.error_type = (*json)["errorType"].asString();
            }
            res.error_message = (*json)["errorMessage"].asString();
          }

          p->set_value(std::move(res));
        }
    );
    _return_client(http_client);

    return fut;
  }

} // namespace lemu::sdk
