#ifndef LEMU_EMULATOR_WATCHER_HPP
#define LEMU_EMULATOR_WATCHER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

namespace lemu::emulator::config {
  struct Watcher;
} // namespace lemu::emulator::config

namespace lemu::emulator::discovery {
  class Discovery;
} // namespace lemu::emulator::discovery

namespace lemu::emulator::watcher {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Coalesces bursts of change notifications. Paths are collected until no
  /// new path has arrived for the length of the window; the whole set is then
  /// delivered at once from the debouncer thread.
  ////////////////////////////////////////////////////////////////////////////////
  class Debouncer {
  public:
    using callback_t = std::function<void(std::set<std::string>&&)>;

    Debouncer(std::chrono::milliseconds window, callback_t&& callback);

    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    void push(const std::string& path);

    // Pending paths are dropped.
    void shutdown();

  private:
    void _run();

    std::chrono::milliseconds _window;
    callback_t _callback;

    std::mutex _mutex;
    std::condition_variable _cv;
    std::set<std::string> _paths;
    std::chrono::steady_clock::time_point _last_event;
    bool _ending{false};

    std::thread _thread;
  };

  class Watcher {
  public:
    using invalidate_t = std::function<void(const std::string&)>;
    using invalidate_all_t = std::function<void()>;

    Watcher(
        const config::Watcher& cfg, discovery::Discovery& discovery, invalidate_t&& invalidate,
        invalidate_all_t&& invalidate_all
    );

    ~Watcher();

    void run();

    void shutdown();

    void wait();

    // True once the watcher has degraded to periodic fingerprint comparison.
    bool polling() const
    {
      return _polling;
    }

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Invalidates the functions affected by a set of changed paths. A path
    /// under the source root of a function affects that function only. Any other
    /// path in the workspace is shared and affects every function. Paths in
    /// ignored directories are skipped.
    ////////////////////////////////////////////////////////////////////////////////
    void dispatch(std::set<std::string>&& paths);

  private:
    void _watch();
    bool _inotify();
    void _poll();
    bool _add_watches(const std::filesystem::path& root);
    std::map<std::string, std::string> _snapshot() const;

    bool _enabled;
    bool _force_polling;
    std::chrono::milliseconds _polling_interval;

    discovery::Discovery& _discovery;
    invalidate_t _invalidate;
    invalidate_all_t _invalidate_all;

    Debouncer _debouncer;

    int _fd{-1};
    std::map<int, std::filesystem::path> _watches;

    std::atomic<bool> _polling{false};
    std::atomic<bool> _ending{false};
    std::mutex _mutex;
    std::condition_variable _cv;
    std::thread _thread;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lemu::emulator::watcher

#endif
