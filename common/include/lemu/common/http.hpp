#ifndef LEMU_COMMON_HTTP_HPP
#define LEMU_COMMON_HTTP_HPP

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace drogon {
  struct HttpRequest;
  struct HttpResponse;
  enum class ReqResult;
  struct HttpClient;
} // namespace drogon

namespace trantor {
  struct EventLoop;
  struct EventLoopThreadPool;
} // namespace trantor

namespace lemu::common::http {

  struct HTTPClient {

    using request_ptr_t = std::shared_ptr<drogon::HttpRequest>;
    using parameters_t = std::initializer_list<std::pair<std::string, std::string>>;
    using callback_t =
        std::function<void(drogon::ReqResult, const std::shared_ptr<drogon::HttpResponse>&)>;

    HTTPClient();

    HTTPClient(const std::string& address, trantor::EventLoop* loop);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Sends a JSON body verbatim. Parameters with an empty value are
    /// skipped. A zero timeout waits for the response indefinitely.
    ////////////////////////////////////////////////////////////////////////////////
    request_ptr_t post(
        const std::string& path, parameters_t&& params, const std::string& body,
        callback_t&& callback, double timeout = 0
    );

    const std::string& address() const
    {
      return _address;
    }

  private:
    std::string _address;
    std::shared_ptr<drogon::HttpClient> _http_client;
  };

  // Event loops shared by all clients of the process.
  struct HTTPClientFactory {

    static void initialize(int thread_num);
    static void shutdown();

    static bool initialized();

    static HTTPClient create_client(const std::string& address);

  private:
    static std::unique_ptr<trantor::EventLoopThreadPool> _pool;
  };

} // namespace lemu::common::http

#endif
