#ifndef LEMU_EMULATOR_WORKER_HPP
#define LEMU_EMULATOR_WORKER_HPP

#include <lemu/common/util.hpp>
#include <lemu/emulator/config.hpp>

#include <BS_thread_pool.hpp>

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace lemu::emulator::worker {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Background execution for the registry.
  ///
  /// Short tasks, such as stopping retired processes, share a fixed pool.
  /// Provisioning (building and starting a function) blocks for as long as the
  /// build runs; each such task gets its own thread, so a slow build of one
  /// function never delays another function. The registry runs at most one
  /// provisioning task per function at a time.
  ////////////////////////////////////////////////////////////////////////////////
  class Workers {
  public:
    Workers(const config::Workers& config) : _pool(config.threads)
    {
      _logger = common::util::create_logger("Workers");
    }

    template <typename F, typename... Args>
    void add_task(F&& func, Args&&... args)
    {
      _pool.detach_task([func, ... args = std::forward<Args>(args)]() mutable {
        std::invoke(func, std::forward<Args>(args)...);
      });
    }

    template <typename F>
    void add_task(F&& func)
    {
      _pool.detach_task(std::forward<F>(func));
    }

    template <typename F>
    void add_provisioning_task(F&& func)
    {
      {
        std::lock_guard<std::mutex> lock{_mutex};
        ++_provisioning;
      }

      std::thread{[this, func = std::forward<F>(func)]() mutable {
        func();

        std::lock_guard<std::mutex> lock{_mutex};
        --_provisioning;
        _cv.notify_all();
      }}.detach();
    }

    // Blocks until all submitted tasks have finished.
    void wait()
    {
      // Provisioning may submit pool tasks, never the other way around.
      {
        std::unique_lock<std::mutex> lock{_mutex};
        _cv.wait(lock, [this]() { return _provisioning == 0; });
      }
      _pool.wait();
    }

    ~Workers()
    {
      wait();
    }

  private:
    BS::thread_pool _pool;

    std::mutex _mutex;
    std::condition_variable _cv;
    int _provisioning{0};

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lemu::emulator::worker

#endif
