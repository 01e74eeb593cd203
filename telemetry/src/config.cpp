#include <llmbridge/telemetry/config.hpp>

#include <llmbridge/common/exceptions.hpp>
#include <llmbridge/common/util.hpp>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include <fmt/format.h>

namespace llmbridge::telemetry {

  std::string kind_to_string(EventKind kind)
  {
    switch (kind) {
    case EventKind::START:
      return "start";
    case EventKind::STOP:
      return "stop";
    case EventKind::EXCEPTION:
      return "exception";
    }
    return "";
  }

  EventKind string_to_kind(const std::string& kind)
  {
    if (kind == "start") {
      return EventKind::START;
    }
    if (kind == "stop") {
      return EventKind::STOP;
    }
    if (kind == "exception") {
      return EventKind::EXCEPTION;
    }
    throw common::InvalidConfigurationError{fmt::format("Unknown telemetry event {}", kind)};
  }

  std::vector<std::string> Config::event_name(EventKind kind) const
  {
    std::vector<std::string> name{prefix};
    name.emplace_back("call");
    name.emplace_back(kind_to_string(kind));
    return name;
  }

  void Config::load(cereal::JSONInputArchive& archive)
  {
    // All arguments are optional

    common::util::cereal_load_value(archive, "enabled", enabled);
    common::util::cereal_load_value(archive, "sample_rate", sample_rate);

    std::vector<std::string> events;
    if (common::util::cereal_load_value(archive, "events", events)) {
      this->events.clear();
      for (const auto& event : events) {
        this->events.insert(string_to_kind(event));
      }
    }

    common::util::cereal_load_value(archive, "prefix", prefix);
    if (prefix.empty()) {
      throw common::InvalidConfigurationError{"Telemetry prefix cannot be empty"};
    }

    std::vector<std::string> metadata;
    if (common::util::cereal_load_value(archive, "metadata", metadata)) {
      this->metadata = std::set<std::string>(metadata.begin(), metadata.end());
    }

    std::string collector_name;
    if (common::util::cereal_load_value(archive, "collector_name", collector_name)) {
      this->collector_name = std::move(collector_name);
    }

    validate();
  }

  void Config::set_defaults()
  {
    enabled = true;
    sample_rate = DEFAULT_SAMPLE_RATE;
    events = {EventKind::START, EventKind::STOP, EventKind::EXCEPTION};
    prefix = {DEFAULT_PREFIX};
    metadata.clear();
    collector_name = std::nullopt;
    collector_name_generator = nullptr;
  }

  void Config::validate() const
  {
    if (sample_rate < 0.0 || sample_rate > 1.0) {
      throw common::InvalidConfigurationError{
          fmt::format("Sample rate must be between 0 and 1, got {}", sample_rate)};
    }

    for (const auto& key : metadata) {
      if (key != "llm_client" && key != "stream") {
        throw common::InvalidConfigurationError{
            fmt::format("Unknown telemetry metadata key {}", key)};
      }
    }
  }

  Config Config::deserialize(std::istream& in_stream)
  {
    Config cfg;
    cereal::JSONInputArchive archive_in(in_stream);
    cfg.load(archive_in);
    return cfg;
  }

} // namespace llmbridge::telemetry
