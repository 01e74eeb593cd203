#ifndef LLMBRIDGE_TELEMETRY_CONFIG_HPP
#define LLMBRIDGE_TELEMETRY_CONFIG_HPP

#include <functional>
#include <istream>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace llmbridge::telemetry {

  struct Invocation;

  enum class EventKind { START = 0, STOP, EXCEPTION };

  std::string kind_to_string(EventKind kind);

  EventKind string_to_kind(const std::string& kind);

  struct Config {

    static constexpr double DEFAULT_SAMPLE_RATE = 1.0;
    static constexpr char DEFAULT_PREFIX[] = "llmbridge";

    Config()
    {
      set_defaults();
    }

    bool enabled;

    // Fraction of calls publishing events, between 0 and 1.
    double sample_rate;

    std::set<EventKind> events;

    // Event names are prefix + ["call", kind].
    std::vector<std::string> prefix;

    // Optional context entries attached to event metadata: "llm_client", "stream".
    std::set<std::string> metadata;

    std::optional<std::string> collector_name;

    // Names the collector of each call; set only in code, overrides collector_name.
    std::function<std::string(const Invocation&)> collector_name_generator;

    bool emits(EventKind kind) const
    {
      return events.find(kind) != events.end();
    }

    std::vector<std::string> event_name(EventKind kind) const;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
    void validate() const;

    static Config deserialize(std::istream& in_stream);
  };

} // namespace llmbridge::telemetry

#endif
