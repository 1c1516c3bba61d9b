#ifndef LEMU_COMMON_UTIL_HPP
#define LEMU_COMMON_UTIL_HPP

#include <lemu/common/exceptions.hpp>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

#include <execinfo.h>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace lemu::common::util {

  void traceback();

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  template <typename U>
  bool expect_zero(U&& u)
  {
    if (u) {
      spdlog::error("Expected zero, found: {}, errno {}, message {}", u, errno, strerror(errno));
      traceback();
      return false;
    }
    return true;
  }

  inline bool is_missing_field(const cereal::Exception& exc, const std::string& name)
  {
    return std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
           std::string::npos;
  }

  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {

    // Unfortunately, Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (is_missing_field(exc, name)) {

        archive.setNextName(nullptr);
        obj.set_defaults();

      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration of {}, reason: {}", name, exc.what())
        );
      }
    }
  }

  // Loads a scalar field when present; the value is left untouched otherwise.
  template <typename T>
  bool cereal_try_load(cereal::JSONInputArchive& archive, const std::string& name, T& value)
  {
    try {
      archive(cereal::make_nvp(name, value));
      return true;
    } catch (cereal::Exception& exc) {

      if (is_missing_field(exc, name)) {
        archive.setNextName(nullptr);
        return false;
      }

      throw common::InvalidConfigurationError(
          fmt::format("Could not parse field {}, reason: {}", name, exc.what())
      );
    }
  }

} // namespace lemu::common::util

#endif
