#include <lemu/emulator/watcher.hpp>

#include <lemu/common/util.hpp>
#include <lemu/emulator/config.hpp>
#include <lemu/emulator/discovery.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace lemu::emulator::watcher {

  // Marker of shared, non-function files in fingerprint snapshots.
  static constexpr const char* SHARED = "";

  Debouncer::Debouncer(std::chrono::milliseconds window, callback_t&& callback)
      : _window(window), _callback(std::move(callback))
  {
    _thread = std::thread{&Debouncer::_run, this};
  }

  Debouncer::~Debouncer()
  {
    shutdown();
  }

  void Debouncer::push(const std::string& path)
  {
    {
      std::lock_guard<std::mutex> lock{_mutex};
      _paths.insert(path);
      _last_event = std::chrono::steady_clock::now();
    }
    _cv.notify_one();
  }

  void Debouncer::shutdown()
  {
    {
      std::lock_guard<std::mutex> lock{_mutex};
      _ending = true;
    }
    _cv.notify_one();

    if (_thread.joinable()) {
      _thread.join();
    }
  }

  void Debouncer::_run()
  {
    std::unique_lock<std::mutex> lock{_mutex};
    while (true) {

      _cv.wait(lock, [this]() { return _ending || !_paths.empty(); });
      if (_ending) {
        break;
      }

      // Every new event extends the quiet period.
      while (!_ending) {
        auto deadline = _last_event + _window;
        if (std::chrono::steady_clock::now() >= deadline) {
          break;
        }
        _cv.wait_until(lock, deadline);
      }
      if (_ending) {
        break;
      }

      std::set<std::string> paths;
      paths.swap(_paths);

      lock.unlock();
      _callback(std::move(paths));
      lock.lock();
    }
  }

  Watcher::Watcher(
      const config::Watcher& cfg, discovery::Discovery& discovery, invalidate_t&& invalidate,
      invalidate_all_t&& invalidate_all
  )
      : _enabled(cfg.enabled), _force_polling(cfg.polling),
        _polling_interval(cfg.polling_interval), _discovery(discovery),
        _invalidate(std::move(invalidate)), _invalidate_all(std::move(invalidate_all)),
        _debouncer(
            std::chrono::milliseconds{cfg.debounce},
            [this](std::set<std::string>&& paths) { dispatch(std::move(paths)); }
        )
  {
    _logger = common::util::create_logger("Watcher");
  }

  Watcher::~Watcher()
  {
    shutdown();
    wait();
  }

  void Watcher::run()
  {
    if (!_enabled) {
      _logger->info("Source watching is disabled");
      return;
    }
    _thread = std::thread{&Watcher::_watch, this};
  }

  void Watcher::shutdown()
  {
    _ending = true;
    _cv.notify_all();
    _debouncer.shutdown();
  }

  void Watcher::wait()
  {
    if (_thread.joinable()) {
      _thread.join();
    }
  }

  void Watcher::dispatch(std::set<std::string>&& paths)
  {
    std::set<std::string> functions;
    bool shared = false;

    const auto& workspace = _discovery.workspace();
    for (const auto& path_str : paths) {

      std::filesystem::path path{path_str};
      if (_discovery.ignored(path)) {
        continue;
      }

      auto owner = _discovery.owner(path);
      if (owner.has_value()) {
        functions.insert(owner.value());
        continue;
      }

      auto relative = path.lexically_normal().lexically_relative(workspace);
      if (!relative.empty() && *relative.begin() != "..") {
        shared = true;
      }
    }

    if (shared) {
      _logger->info("Shared workspace files changed, invalidating all functions");
      _invalidate_all();
      return;
    }

    for (const auto& name : functions) {
      _logger->info("Sources of function {} changed", name);
      _invalidate(name);
    }
  }

  void Watcher::_watch()
  {
    if (!_force_polling && _inotify()) {
      return;
    }

    if (!_ending) {
      _poll();
    }
  }

  bool Watcher::_add_watches(const std::filesystem::path& root)
  {
    constexpr uint32_t MASK = IN_CREATE | IN_DELETE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_FROM |
                              IN_MOVED_TO | IN_ATTRIB | IN_DELETE_SELF | IN_MOVE_SELF;

    auto add = [this](const std::filesystem::path& dir) {
      int wd = inotify_add_watch(_fd, dir.c_str(), MASK);
      if (wd == -1) {
        _logger->warn("Cannot watch {}, reason {}", dir.string(), strerror(errno));
        return false;
      }
      _watches[wd] = dir;
      return true;
    };

    if (!add(root)) {
      return false;
    }

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it{
        root, std::filesystem::directory_options::skip_permission_denied, ec};
    std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {

      std::error_code entry_ec;
      if (!it->is_directory(entry_ec) || it->is_symlink(entry_ec)) {
        continue;
      }

      if (_discovery.ignored(it->path())) {
        it.disable_recursion_pending();
        continue;
      }

      if (!add(it->path())) {
        return false;
      }
    }
    return true;
  }

  bool Watcher::_inotify()
  {
    _fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (_fd == -1) {
      _logger->warn("inotify is not available, reason {}, falling back to polling", strerror(errno));
      return false;
    }

    const auto& workspace = _discovery.workspace();
    bool healthy = _add_watches(workspace);
    if (healthy) {
      _logger->info("Watching {} with {} directories", workspace.string(), _watches.size());
    }

    alignas(struct inotify_event) char buffer[16 * 1024];
    while (healthy && !_ending) {

      pollfd pfd{_fd, POLLIN, 0};
      int ret = poll(&pfd, 1, 200);
      if (ret == -1 && errno != EINTR) {
        _logger->warn("Polling inotify failed, reason {}", strerror(errno));
        healthy = false;
        break;
      }
      if (ret <= 0) {
        continue;
      }

      ssize_t len = read(_fd, buffer, sizeof(buffer));
      if (len <= 0) {
        continue;
      }

      for (char* ptr = buffer; ptr < buffer + len;) {

        auto* event = reinterpret_cast<struct inotify_event*>(ptr);
        ptr += sizeof(struct inotify_event) + event->len;

        if (event->mask & IN_Q_OVERFLOW) {
          _logger->warn("inotify queue overflow");
          healthy = false;
          break;
        }

        auto it = _watches.find(event->wd);
        if (it == _watches.end()) {
          continue;
        }
        std::filesystem::path dir = it->second;

        if (event->mask & IN_IGNORED) {
          _watches.erase(it);
          if (dir == workspace) {
            _logger->warn("Workspace root is no longer watched");
            healthy = false;
            break;
          }
          continue;
        }

        if ((event->mask & (IN_DELETE_SELF | IN_MOVE_SELF)) && dir == workspace) {
          _logger->warn("Workspace root has been removed");
          healthy = false;
          break;
        }

        std::filesystem::path path = event->len > 0 ? dir / event->name : dir;
        if (_discovery.ignored(path)) {
          continue;
        }

        if ((event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO))) {
          if (!_add_watches(path)) {
            healthy = false;
            break;
          }
        }

        SPDLOG_LOGGER_DEBUG(_logger, "Change of {}", path.string());
        _debouncer.push(path.string());
      }
    }

    close(_fd);
    _fd = -1;
    _watches.clear();

    if (!healthy && !_ending) {
      // Events lost before the polling baseline cannot be attributed to a function.
      _logger->warn(
          "Falling back to polling every {} ms, invalidating all functions",
          _polling_interval.count()
      );
      _debouncer.push((workspace / ".").string());
      return false;
    }
    return true;
  }

  std::map<std::string, std::string> Watcher::_snapshot() const
  {
    std::map<std::string, std::string> result;
    std::vector<std::filesystem::path> roots;

    for (const auto& desc : _discovery.discover()) {
      result[desc.source_root.string()] =
          discovery::fingerprint(desc.source_root, _discovery.ignore_list());
      roots.emplace_back(desc.source_root);
    }

    result[SHARED] = discovery::fingerprint(_discovery.workspace(), _discovery.ignore_list(), roots);
    return result;
  }

  void Watcher::_poll()
  {
    _polling = true;
    _logger->info("Polling {} for changes", _discovery.workspace().string());

    auto previous = _snapshot();
    while (!_ending) {

      {
        std::unique_lock<std::mutex> lock{_mutex};
        _cv.wait_for(lock, _polling_interval, [this]() { return _ending.load(); });
      }
      if (_ending) {
        break;
      }

      auto current = _snapshot();
      for (const auto& [root, digest] : current) {

        auto it = previous.find(root);
        if (it != previous.end() && it->second == digest) {
          continue;
        }

        if (root == SHARED) {
          // Reported as a change of the workspace itself.
          _debouncer.push((_discovery.workspace() / ".").string());
        } else {
          _debouncer.push(root);
        }
      }
      previous = std::move(current);
    }
  }

} // namespace lemu::emulator::watcher
