#include <lemu/emulator/discovery.hpp>

#include <lemu/common/util.hpp>
#include <lemu/emulator/config.hpp>

#include <algorithm>
#include <map>
#include <system_error>

#include <fmt/format.h>

namespace lemu::emulator::discovery {

  namespace {

    constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
    constexpr uint64_t FNV_PRIME = 1099511628211ULL;

    void hash_bytes(uint64_t& hash, const void* data, size_t len)
    {
      const auto* bytes = static_cast<const unsigned char*>(data);
      for (size_t i = 0; i < len; ++i) {
        hash ^= bytes[i];
        hash *= FNV_PRIME;
      }
    }

    bool contains(const std::filesystem::path& root, const std::filesystem::path& path)
    {
      auto root_it = root.begin();
      auto path_it = path.begin();
      for (; root_it != root.end(); ++root_it, ++path_it) {
        // Trailing separator produces an empty last component.
        if (root_it->empty()) {
          continue;
        }
        if (path_it == path.end() || *root_it != *path_it) {
          return false;
        }
      }
      return true;
    }

    bool valid_name(const std::string& name)
    {
      return !name.empty() && name[0] != '.' && name.find('/') == std::string::npos;
    }

  } // namespace

  Discovery::Discovery(const config::Config& cfg)
      : _config(cfg), _workspace(std::filesystem::path{cfg.workspace}.lexically_normal()),
        _ignore(cfg.watcher.ignore)
  {
    _functions_dir = (_workspace / cfg.functions_dir).lexically_normal();
    _logger = common::util::create_logger("Discovery");
  }

  Descriptor Discovery::_descriptor(const std::string& name, std::filesystem::path source_root) const
  {
    Descriptor desc;
    desc.name = name;
    desc.source_root = std::move(source_root);
    desc.memory = _config.lifecycle.memory;
    desc.timeout = std::chrono::seconds{_config.lifecycle.invocation_timeout};
    desc.environment = _config.environment;

    auto it = _config.functions.functions.find(name);
    if (it != _config.functions.functions.end()) {
      const auto& fn = it->second;
      desc.environment = environment::merge(_config.environment, fn.environment);
      if (fn.memory.has_value()) {
        desc.memory = fn.memory.value();
      }
      if (fn.timeout.has_value()) {
        desc.timeout = std::chrono::seconds{fn.timeout.value()};
      }
    }

    return desc;
  }

  std::optional<Descriptor> Discovery::find(const std::string& name) const
  {
    if (!valid_name(name)) {
      return std::nullopt;
    }

    auto it = _config.functions.functions.find(name);
    if (it != _config.functions.functions.end()) {

      std::filesystem::path source = it->second.source.empty() ? _functions_dir / name
                                                               : std::filesystem::path{it->second.source};
      if (source.is_relative()) {
        source = _workspace / source;
      }
      return _descriptor(name, source.lexically_normal());
    }

    if (std::find(_ignore.begin(), _ignore.end(), name) != _ignore.end()) {
      return std::nullopt;
    }

    std::error_code ec;
    auto path = _functions_dir / name;
    if (std::filesystem::is_directory(path, ec)) {
      return _descriptor(name, path.lexically_normal());
    }

    return std::nullopt;
  }

  std::vector<Descriptor> Discovery::discover() const
  {
    std::map<std::string, Descriptor> functions;

    std::error_code ec;
    std::filesystem::directory_iterator it{_functions_dir, ec};
    if (ec) {
      SPDLOG_LOGGER_DEBUG(
          _logger, "Cannot list functions directory {}, reason {}", _functions_dir.string(),
          ec.message()
      );
    } else {
      for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (!entry.is_directory(ec) || !valid_name(name) ||
            std::find(_ignore.begin(), _ignore.end(), name) != _ignore.end()) {
          continue;
        }
        functions.emplace(name, _descriptor(name, entry.path().lexically_normal()));
      }
    }

    for (const auto& [name, fn] : _config.functions.functions) {
      auto desc = find(name);
      if (desc.has_value()) {
        functions.insert_or_assign(name, std::move(desc.value()));
      }
    }

    std::vector<Descriptor> result;
    result.reserve(functions.size());
    for (auto& [name, desc] : functions) {
      result.emplace_back(std::move(desc));
    }
    return result;
  }

  std::optional<std::string> Discovery::owner(const std::filesystem::path& path) const
  {
    auto normalized = path.lexically_normal();

    std::optional<std::string> result;
    size_t longest = 0;
    for (const auto& desc : discover()) {

      if (!contains(desc.source_root, normalized)) {
        continue;
      }

      // Nested source roots: the innermost one owns the path.
      size_t length = desc.source_root.string().length();
      if (!result.has_value() || length > longest) {
        result = desc.name;
        longest = length;
      }
    }
    return result;
  }

  bool Discovery::ignored(const std::filesystem::path& path) const
  {
    auto relative = path.lexically_normal().lexically_relative(_workspace);
    for (const auto& component : relative) {
      if (std::find(_ignore.begin(), _ignore.end(), component.string()) != _ignore.end()) {
        return true;
      }
    }
    return false;
  }

  std::string fingerprint(
      const std::filesystem::path& root, const std::vector<std::string>& ignore,
      const std::vector<std::filesystem::path>& excluded
  )
  {
    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) {
      return "";
    }

    // Directory iteration order is unspecified; sort for a stable digest.
    std::map<std::string, std::pair<int64_t, uintmax_t>> files;

    std::filesystem::recursive_directory_iterator it{
        root, std::filesystem::directory_options::skip_permission_denied, ec};
    std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {

      const auto& entry = *it;
      std::string name = entry.path().filename().string();

      std::error_code entry_ec;
      if (entry.is_directory(entry_ec)) {
        bool skip = std::find(ignore.begin(), ignore.end(), name) != ignore.end();
        for (const auto& path : excluded) {
          skip |= entry.path().lexically_normal() == path.lexically_normal();
        }
        if (skip) {
          it.disable_recursion_pending();
        }
        continue;
      }

      if (!entry.is_regular_file(entry_ec)) {
        continue;
      }

      auto mtime = entry.last_write_time(entry_ec);
      auto size = entry.file_size(entry_ec);
      if (entry_ec) {
        // Removed while iterating.
        continue;
      }

      files.emplace(
          entry.path().lexically_relative(root).string(),
          std::make_pair(static_cast<int64_t>(mtime.time_since_epoch().count()), size)
      );
    }

    uint64_t hash = FNV_OFFSET;
    for (const auto& [path, stat] : files) {
      hash_bytes(hash, path.data(), path.size());
      hash_bytes(hash, &stat.first, sizeof(stat.first));
      hash_bytes(hash, &stat.second, sizeof(stat.second));
    }

    return fmt::format("{:016x}", hash);
  }

} // namespace lemu::emulator::discovery
