#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include <drogon/HttpClient.h>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <trantor/net/EventLoopThread.h>

// Function used by integration tests. The event selects the behavior:
//   {"action": "fail"}               reports an invocation error
//   {"action": "sleep", "ms": N}     sleeps before echoing the event
//   {"action": "exit"}               exits without responding
// Any other event is echoed back, with "seq" set to the number of invocations
// served by this process.

// Empty when the variable is not set.
static std::string runtime_api()
{
  const char* api = std::getenv("AWS_LAMBDA_RUNTIME_API");
  return api == nullptr ? "" : api;
}

static std::string base_path()
{
  std::string addr = runtime_api();
  auto pos = addr.find('/');
  std::string prefix = pos == std::string::npos ? "" : addr.substr(pos);
  return prefix + "/2018-06-01/runtime";
}

static std::string host()
{
  std::string addr = runtime_api();
  auto pos = addr.find('/');
  return "http://" + (pos == std::string::npos ? addr : addr.substr(0, pos));
}

static drogon::HttpResponsePtr
post(drogon::HttpClientPtr& client, const std::string& path, const std::string& body, const std::string& error_type = "")
{
  auto req = drogon::HttpRequest::newHttpRequest();
  req->setMethod(drogon::Post);
  req->setPath(path);
  req->setBody(body);
  req->setContentTypeCode(drogon::ContentType::CT_APPLICATION_JSON);
  if (!error_type.empty()) {
    req->addHeader("Lambda-Runtime-Function-Error-Type", error_type);
  }

  auto [result, response] = client->sendRequest(req);
  if (result != drogon::ReqResult::Ok) {
    spdlog::error("Request to {} failed", path);
    return nullptr;
  }
  return response;
}

static std::string error_document(const std::string& type, const std::string& message)
{
  Json::Value err;
  err["errorType"] = type;
  err["errorMessage"] = message;
  err["stackTrace"] = Json::Value{Json::arrayValue};

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, err);
}

int main()
{
  if (runtime_api().empty()) {
    spdlog::error("AWS_LAMBDA_RUNTIME_API is not set");
    return 1;
  }

  trantor::EventLoopThread loop_thread{"EchoFunction"};
  loop_thread.run();
  auto client = drogon::HttpClient::newHttpClient(host(), loop_thread.getLoop());

  const std::string base = base_path();

  const char* init_error = std::getenv("ECHO_INIT_ERROR");
  if (init_error != nullptr) {
    post(client, base + "/init/error", error_document("Runtime.InitError", init_error), "Runtime.InitError");
    return 1;
  }

  Json::CharReaderBuilder reader_builder;
  Json::StreamWriterBuilder writer_builder;
  writer_builder["indentation"] = "";

  int seq = 0;
  while (true) {

    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPath(base + "/invocation/next");

    auto [result, response] = client->sendRequest(req);
    if (result != drogon::ReqResult::Ok || !response) {
      spdlog::error("Polling for the next invocation failed");
      return 1;
    }
    if (response->getStatusCode() != drogon::k200OK) {
      spdlog::info("Poll rejected with status {}", static_cast<int>(response->getStatusCode()));
      return 0;
    }

    std::string id = response->getHeader("Lambda-Runtime-Aws-Request-Id");
    std::string body{response->body()};

    Json::Value event;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader{reader_builder.newCharReader()};
    bool parsed = reader->parse(body.data(), body.data() + body.size(), &event, &errors);

    std::string action = parsed && event.isObject() ? event.get("action", "").asString() : "";
    ++seq;

    if (action == "fail") {
      post(
          client, base + "/invocation/" + id + "/error",
          error_document("HandlerError", "Requested failure"), "HandlerError"
      );
      continue;
    }
    if (action == "exit") {
      return 3;
    }
    if (action == "sleep") {
      std::this_thread::sleep_for(std::chrono::milliseconds{event.get("ms", 0).asInt()});
    }

    std::string output = body;
    if (parsed && event.isObject()) {
      event["seq"] = seq;
      output = Json::writeString(writer_builder, event);
    }
    post(client, base + "/invocation/" + id + "/response", output);
  }
}
