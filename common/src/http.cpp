#include <lemu/common/http.hpp>

#include <lemu/common/exceptions.hpp>

#include <drogon/HttpClient.h>
#include <drogon/HttpRequest.h>
#include <trantor/net/EventLoop.h>
#include <trantor/net/EventLoopThreadPool.h>

namespace lemu::common::http {

  std::unique_ptr<trantor::EventLoopThreadPool> HTTPClientFactory::_pool = nullptr;

  HTTPClient::HTTPClient() : _http_client(nullptr) {}

  HTTPClient::HTTPClient(const std::string& address, trantor::EventLoop* loop)
      : _address(address)
  {
    this->_http_client = drogon::HttpClient::newHttpClient(address, loop, false, false);
  }

  HTTPClient::request_ptr_t HTTPClient::post(
      const std::string& path, parameters_t&& params, const std::string& body,
      callback_t&& callback, double timeout
  )
  {
    if (!_http_client) {
      throw common::LemuException("HTTP client is not connected to any address!");
    }

    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPath(path);
    req->setBody(body);
    req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    for (const auto& [key, value] : params) {
      if (!value.empty()) {
        req->setParameter(key, value);
      }
    }

    _http_client->sendRequest(req, std::move(callback), timeout);
    return req;
  }

  void HTTPClientFactory::initialize(int thread_num)
  {
    if (_pool) {
      return;
    }
    _pool = std::make_unique<trantor::EventLoopThreadPool>(thread_num, "HTTPClients");
    _pool->start();
  }

  void HTTPClientFactory::shutdown()
  {
    _pool.reset();
  }

  bool HTTPClientFactory::initialized()
  {
    return _pool != nullptr;
  }

  HTTPClient HTTPClientFactory::create_client(const std::string& address)
  {
    if (!_pool) {
      throw common::LemuException("Uninitialized HTTPClientFactory!");
    }
    return HTTPClient{address, _pool->getNextLoop()};
  }

} // namespace lemu::common::http
