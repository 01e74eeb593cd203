#ifndef LLMBRIDGE_COMMON_UTIL_HPP
#define LLMBRIDGE_COMMON_UTIL_HPP

#include <llmbridge/common/exceptions.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace llmbridge::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  // Symbolized frames of the current call stack, innermost first.
  std::vector<std::string> stacktrace(int depth = 10);

  // Nanoseconds on the steady clock. Only differences are meaningful.
  int64_t monotonic_time();

  // Nanoseconds since the Unix epoch.
  int64_t system_time();

  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {

    // Unfortunately, Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {

        archive.setNextName(nullptr);
        obj.set_defaults();

      } else {
        throw common::InvalidConfigurationError(
            "Could not parse configuration, reason: " + std::string{exc.what()}
        );
      }
    }
  }

  // Loads a single value if present, keeps the current one otherwise.
  template <typename T>
  bool cereal_load_value(cereal::JSONInputArchive& archive, const std::string& name, T& value)
  {
    try {
      archive(cereal::make_nvp(name, value));
      return true;
    } catch (cereal::Exception& exc) {

      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {
        archive.setNextName(nullptr);
        return false;
      }

      throw common::InvalidConfigurationError(
          fmt::format("Could not parse option {}, reason: {}", name, exc.what())
      );
    }
  }

} // namespace llmbridge::common::util

#endif
