#ifndef LEMU_EMULATOR_ENVIRONMENT_HPP
#define LEMU_EMULATOR_ENVIRONMENT_HPP

#include <map>
#include <string>
#include <vector>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace lemu::emulator::environment {

  struct Environment {

    std::map<std::string, std::string> variables;

    // JSON objects with arbitrary keys: { "NAME": "value", ... }
    void load(cereal::JSONInputArchive& archive);
    void set_defaults();

    bool empty() const
    {
      return variables.empty();
    }
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Merges package-wide defaults with per-function overrides.
  /// Entries of the override take precedence.
  ////////////////////////////////////////////////////////////////////////////////
  Environment merge(const Environment& defaults, const Environment& overrides);

  // Environment of the current process.
  Environment inherited();

  // NAME=value strings, in the form expected by execve.
  std::vector<std::string> serialize(const Environment& env);

} // namespace lemu::emulator::environment

#endif
