#include "../mocks.hpp"

#include <lemu/emulator/config.hpp>
#include <lemu/emulator/launcher.hpp>
#include <lemu/emulator/server.hpp>

#include <thread>

#include <sys/wait.h>

#include <drogon/HttpClient.h>
#include <drogon/HttpTypes.h>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <trantor/net/EventLoopThread.h>

static constexpr int TEST_PORT = 9876;

// One emulator for the whole suite: drogon's application can only be started once.
class EmulatorEnvironment : public ::testing::Environment {
public:
  void SetUp() override
  {
    spdlog::set_level(spdlog::level::debug);

    workspace = std::make_unique<TemporaryWorkspace>(
        std::vector<std::string>{"echo", "broken", "init-fail"}
    );

    auto cfg = workspace->config();
    cfg.http.port = TEST_PORT;
    cfg.build.command = {"sh", "-c", "echo 'building {function}'; test {function} != broken"};
    cfg.build.artifact = LEMU_ECHO_FUNCTION;
    cfg.lifecycle.startup_timeout = 5000;
    cfg.lifecycle.shutdown_grace = 500;

    config::Function init_fail;
    init_fail.environment.variables["ECHO_INIT_ERROR"] = "missing configuration";
    cfg.functions.functions["init-fail"] = init_fail;

    Server::configure(cfg);
    Server::instance()->run();

    std::this_thread::sleep_for(std::chrono::milliseconds(250));
  }

  void TearDown() override
  {
    Server::instance()->shutdown();
    Server::instance()->wait();
    Server::destroy();
    workspace.reset();
  }

  std::unique_ptr<TemporaryWorkspace> workspace;
};

class HttpIntegration : public ::testing::Test {
protected:
  void SetUp() override
  {
    _loop.run();
    client = drogon::HttpClient::newHttpClient(
        fmt::format("http://127.0.0.1:{}/", TEST_PORT), _loop.getLoop(), false, false
    );
  }

  drogon::HttpResponsePtr invoke(const std::string& function, const std::string& body, const std::string& timeout = "")
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPath(fmt::format("/2015-03-31/functions/{}/invocations", function));
    req->setBody(body);
    req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    if (!timeout.empty()) {
      req->setParameter("timeout", timeout);
    }
    return send(req);
  }

  drogon::HttpResponsePtr send(const drogon::HttpRequestPtr& req)
  {
    auto [result, response] = client->sendRequest(req, 30.0);
    EXPECT_EQ(result, drogon::ReqResult::Ok);
    return response;
  }

  static Json::Value json(const drogon::HttpResponsePtr& response)
  {
    Json::Value value;
    std::string errors;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
    std::string body{response->body()};
    reader->parse(body.data(), body.data() + body.size(), &value, &errors);
    return value;
  }

  trantor::EventLoopThread _loop;
  drogon::HttpClientPtr client;
};

TEST_F(HttpIntegration, Invoke)
{
  auto response = invoke("echo", R"({"message":"hello"})");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_EQ(response->getHeader("X-Amz-Function-Error"), "");

  auto body = json(response);
  EXPECT_EQ(body["message"].asString(), "hello");
  int seq = body["seq"].asInt();
  EXPECT_GE(seq, 1);

  // The warm process serves the next invocation.
  response = invoke("echo", R"({"message":"again"})");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(json(response)["seq"].asInt(), seq + 1);
  EXPECT_EQ(Server::instance()->registry().state("echo"), function::State::READY);
}

TEST_F(HttpIntegration, FunctionError)
{
  auto response = invoke("echo", R"({"action":"fail"})");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_EQ(response->getHeader("X-Amz-Function-Error"), "HandlerError");
  EXPECT_EQ(json(response)["errorMessage"].asString(), "Requested failure");
}

TEST_F(HttpIntegration, Timeout)
{
  auto response = invoke("echo", R"({"action":"sleep","ms":1000})", "200");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_EQ(response->getHeader("X-Amz-Function-Error"), "Timeout");

  // The late response is dropped and the process keeps serving.
  response = invoke("echo", R"({"message":"after"})");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_EQ(json(response)["message"].asString(), "after");

  response = invoke("echo", "{}", "soon");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k400BadRequest);
  EXPECT_EQ(json(response)["errorType"].asString(), "InvalidParameterValue");
}

TEST_F(HttpIntegration, Crash)
{
  auto response = invoke("echo", R"({"action":"exit"})");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k503ServiceUnavailable);
  EXPECT_EQ(json(response)["errorType"].asString(), "FunctionUnavailable");

  // A new process is started on demand.
  response = invoke("echo", R"({"message":"restarted"})");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_EQ(json(response)["seq"].asInt(), 1);
}

TEST_F(HttpIntegration, ToolErrors)
{
  auto response = invoke("missing", "{}");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k404NotFound);
  EXPECT_EQ(json(response)["errorType"].asString(), "UnknownFunction");

  response = invoke("broken", "{}");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k500InternalServerError);
  EXPECT_EQ(json(response)["errorType"].asString(), "CompileError");
  EXPECT_NE(json(response)["errorMessage"].asString().find("building broken"), std::string::npos);

  response = invoke("init-fail", "{}");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k503ServiceUnavailable);
  EXPECT_EQ(json(response)["errorType"].asString(), "InitializationError");
  EXPECT_NE(
      json(response)["errorMessage"].asString().find("missing configuration"), std::string::npos
  );
}

TEST_F(HttpIntegration, RuntimeApi)
{
  // Make sure the function has an entry.
  ASSERT_NE(invoke("echo", "{}"), nullptr);

  auto req = drogon::HttpRequest::newHttpRequest();
  req->setMethod(drogon::Post);
  req->setPath("/echo/2018-06-01/runtime/invocation/unknown-id/response");
  req->setBody("{}");
  auto response = send(req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k400BadRequest);
  EXPECT_EQ(json(response)["errorType"].asString(), "UnknownInvocationId");

  req = drogon::HttpRequest::newHttpRequest();
  req->setMethod(drogon::Get);
  req->setPath("/missing/2018-06-01/runtime/invocation/next");
  response = send(req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k404NotFound);
}

TEST_F(HttpIntegration, ListFunctions)
{
  auto req = drogon::HttpRequest::newHttpRequest();
  req->setMethod(drogon::Get);
  req->setPath("/lemu/functions");
  auto response = send(req);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k200OK);

  auto functions = json(response)["functions"];
  ASSERT_EQ(functions.size(), 3);
  EXPECT_EQ(functions[0]["name"].asString(), "broken");
  EXPECT_EQ(functions[1]["name"].asString(), "echo");
  EXPECT_EQ(functions[2]["name"].asString(), "init-fail");
}

TEST(EchoFunction, MissingRuntimeApi)
{
  launcher::ProcessLauncher launcher;
  launcher::LaunchSpec spec;
  spec.function = "echo";
  spec.executable = LEMU_ECHO_FUNCTION;

  Slot<int> status;
  auto proc = launcher.launch(spec, [&status](int code) { status.set(std::move(code)); });
  ASSERT_TRUE(status.ready());

  int code = status.get();
  ASSERT_TRUE(WIFEXITED(code));
  EXPECT_EQ(WEXITSTATUS(code), 1);
}

int main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new EmulatorEnvironment);
  return RUN_ALL_TESTS();
}
