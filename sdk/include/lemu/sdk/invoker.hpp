#ifndef LEMU_SDK_INVOKER_HPP
#define LEMU_SDK_INVOKER_HPP

#include <lemu/common/http.hpp>
#include <lemu/sdk/invocation.hpp>

#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace lemu::sdk {

  struct Invoker {

    Invoker(const std::string& emulator_addr, int thread_num = 2);

    InvocationResult invoke(
        const std::string& function_name, const std::string& payload,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    std::future<InvocationResult> invoke_async(
        const std::string& function_name, const std::string& payload,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

  private:
    std::mutex _clients_mutex;
    std::condition_variable _cv;
    std::queue<common::http::HTTPClient> _clients;

    common::http::HTTPClient _get_client();
    void _return_client(common::http::HTTPClient& client);
  };

} // namespace lemu::sdk

#endif
