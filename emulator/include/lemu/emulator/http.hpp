#ifndef LEMU_EMULATOR_HTTP_HPP
#define LEMU_EMULATOR_HTTP_HPP

#include <lemu/emulator/invocation.hpp>

#include <memory>
#include <string>
#include <thread>

#include <drogon/HttpTypes.h>
#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

namespace lemu::emulator {

  class RuntimeApi;

  namespace router {
    class Router;
  } // namespace router

  namespace registry {
    class Registry;
  } // namespace registry

  namespace config {
    struct HTTPServer;
  } // namespace config

  struct HttpServer : public drogon::HttpController<HttpServer, false>,
                      std::enable_shared_from_this<HttpServer> {
    using request_t = drogon::HttpRequestPtr;
    using callback_t = std::function<void(const drogon::HttpResponsePtr&)>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(HttpServer::next_invocation, "/{1}/2018-06-01/runtime/invocation/next", drogon::Get);
    ADD_METHOD_TO(
        HttpServer::invocation_response, "/{1}/2018-06-01/runtime/invocation/{2}/response",
        drogon::Post
    );
    ADD_METHOD_TO(
        HttpServer::invocation_error, "/{1}/2018-06-01/runtime/invocation/{2}/error", drogon::Post
    );
    ADD_METHOD_TO(HttpServer::init_error, "/{1}/2018-06-01/runtime/init/error", drogon::Post);
    ADD_METHOD_TO(HttpServer::invoke, "/2015-03-31/functions/{1}/invocations", drogon::Post);
    ADD_METHOD_TO(HttpServer::list_functions, "/lemu/functions", drogon::Get);
    METHOD_LIST_END

    HttpServer(
        const config::HTTPServer& cfg, RuntimeApi& runtime_api, router::Router& router,
        registry::Registry& registry
    );

    void run();
    void shutdown();
    void wait();

    void next_invocation(const request_t& request, callback_t&& callback, const std::string& function);

    void invocation_response(
        const request_t& request, callback_t&& callback, const std::string& function,
        const std::string& id
    );

    void invocation_error(
        const request_t& request, callback_t&& callback, const std::string& function,
        const std::string& id
    );

    void init_error(const request_t& request, callback_t&& callback, const std::string& function);

    void invoke(const request_t& request, callback_t&& callback, const std::string& function);

    void list_functions(const request_t& request, callback_t&& callback);

    static drogon::HttpResponsePtr failed_response(
        const std::string& error_type, const std::string& message,
        drogon::HttpStatusCode code = drogon::k500InternalServerError
    );

    static drogon::HttpResponsePtr accepted_response();

    // Response of the invoke endpoint for a finished invocation.
    static drogon::HttpResponsePtr invoke_response(const invocation::InvocationResult& result);

    static drogon::HttpStatusCode status_code(invocation::ErrorKind kind);

    int port() const
    {
      return _port;
    }

  private:
    std::string _address;
    int _port;
    int _threads;

    RuntimeApi& _runtime_api;
    router::Router& _router;
    registry::Registry& _registry;

    std::shared_ptr<spdlog::logger> _logger;
    std::thread _server_thread;
  };

} // namespace lemu::emulator

#endif
