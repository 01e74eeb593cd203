#ifndef LLMBRIDGE_TELEMETRY_EVENTS_HPP
#define LLMBRIDGE_TELEMETRY_EVENTS_HPP

#include <llmbridge/engine/value.hpp>
#include <llmbridge/telemetry/config.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace llmbridge::telemetry {

  // Times and durations are in nanoseconds.
  struct Measurements {
    std::optional<int64_t> system_time;
    std::optional<int64_t> monotonic_time;
    std::optional<int64_t> duration;
    std::optional<int64_t> input_tokens;
    std::optional<int64_t> output_tokens;
    std::optional<int64_t> total_tokens;
  };

  // Identity of one call; identical on every event of that call.
  struct CallMetadata {
    std::string resource;
    std::string action;
    std::string function_name;
    std::string collector_name;

    // Context entries opted into by the configuration.
    std::map<std::string, std::string> context;

    bool operator==(const CallMetadata&) const = default;
  };

  struct ExceptionInfo {
    std::string kind;
    std::string reason;
    std::vector<std::string> stacktrace;
  };

  struct Metadata {
    CallMetadata call;

    // Stop events only.
    std::optional<engine::Diagnostics> observability;

    // Exception events only.
    std::optional<ExceptionInfo> exception;
  };

  struct Event {
    std::vector<std::string> name;
    EventKind kind;
    Measurements measurements;
    Metadata metadata;

    // Dot-separated name, e.g., "llmbridge.call.stop".
    std::string name_str() const;
  };

  std::string join_name(const std::vector<std::string>& name);

} // namespace llmbridge::telemetry

#endif
