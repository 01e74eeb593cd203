#ifndef LLMBRIDGE_BRIDGE_CONFIG_HPP
#define LLMBRIDGE_BRIDGE_CONFIG_HPP

#include <llmbridge/telemetry/config.hpp>

#include <istream>
#include <optional>
#include <string>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace llmbridge::bridge::config {

  struct Stream {

    static constexpr int DEFAULT_READ_TIMEOUT_MS = 300;
    static constexpr int DEFAULT_DRAIN_LIMIT = 1024;
    static constexpr char DEFAULT_CONTENT_FIELD[] = "content";

    Stream()
    {
      set_defaults();
    }

    // Maximal wait for a single message of the stream.
    int read_timeout_ms;

    // Maximal number of late messages discarded at cleanup.
    int drain_limit;

    // Chunks whose content field is null or empty are not yielded.
    std::string content_field;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Workers {

    static constexpr int DEFAULT_THREADS_NUMBER = 4;

    Workers()
    {
      set_defaults();
    }

    int threads;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Bridge {

    bool verbose;

    telemetry::Config telemetry;
    Stream stream;
    Workers workers;

    // Engine script used by the command-line runner.
    std::optional<std::string> engine_script;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();

    static Bridge deserialize(int argc, char** argv);
    static Bridge deserialize(std::istream& in_stream);
  };

} // namespace llmbridge::bridge::config

#endif
