#include <lemu/emulator/environment.hpp>

#include <cereal/archives/json.hpp>
#include <cereal/types/string.hpp>
#include <fmt/format.h>

#include <string_view>

extern char** environ;

namespace lemu::emulator::environment {

  void Environment::load(cereal::JSONInputArchive& archive)
  {
    variables.clear();

    // Keys are not known in advance; walk the object members in order.
    while (true) {
      const char* name = archive.getNodeName();
      if (!name) {
        break;
      }

      std::string key{name};
      std::string value;
      archive(value);
      variables[key] = std::move(value);
    }
  }

  void Environment::set_defaults()
  {
    variables.clear();
  }

  Environment merge(const Environment& defaults, const Environment& overrides)
  {
    Environment result{defaults};
    for (const auto& [key, value] : overrides.variables) {
      result.variables[key] = value;
    }
    return result;
  }

  Environment inherited()
  {
    Environment result;
    for (char** var = environ; var && *var; ++var) {

      std::string_view entry{*var};
      auto pos = entry.find('=');
      if (pos == std::string_view::npos) {
        continue;
      }
      result.variables.emplace(entry.substr(0, pos), entry.substr(pos + 1));
    }
    return result;
  }

  std::vector<std::string> serialize(const Environment& env)
  {
    std::vector<std::string> result;
    result.reserve(env.variables.size());
    for (const auto& [key, value] : env.variables) {
      result.emplace_back(fmt::format("{}={}", key, value));
    }
    return result;
  }

} // namespace lemu::emulator::environment
