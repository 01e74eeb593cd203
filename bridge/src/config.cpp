#include <llmbridge/bridge/config.hpp>

#include <llmbridge/common/exceptions.hpp>
#include <llmbridge/common/util.hpp>

#include <fstream>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <cereal/types/string.hpp>
#include <cxxopts.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace llmbridge::bridge::config {

  void Stream::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_value(archive, "read-timeout-ms", read_timeout_ms);
    common::util::cereal_load_value(archive, "drain-limit", drain_limit);
    common::util::cereal_load_value(archive, "content-field", content_field);

    if (read_timeout_ms < 0) {
      throw common::InvalidConfigurationError{
          fmt::format("Read timeout cannot be negative, got {}", read_timeout_ms)};
    }
    if (drain_limit <= 0) {
      throw common::InvalidConfigurationError{
          fmt::format("Drain limit must be positive, got {}", drain_limit)};
    }
  }

  void Stream::set_defaults()
  {
    read_timeout_ms = DEFAULT_READ_TIMEOUT_MS;
    drain_limit = DEFAULT_DRAIN_LIMIT;
    content_field = DEFAULT_CONTENT_FIELD;
  }

  void Workers::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(threads));

    if (threads <= 0) {
      throw common::InvalidConfigurationError{
          fmt::format("Number of worker threads must be positive, got {}", threads)};
    }
  }

  void Workers::set_defaults()
  {
    threads = DEFAULT_THREADS_NUMBER;
  }

  void Bridge::set_defaults()
  {
    verbose = false;
    engine_script = std::nullopt;

    telemetry.set_defaults();
    stream.set_defaults();
    workers.set_defaults();
  }

  void Bridge::load(cereal::JSONInputArchive& archive)
  {
    set_defaults();

    common::util::cereal_load_value(archive, "verbose", verbose);

    std::string script;
    if (common::util::cereal_load_value(archive, "engine-script", script)) {
      engine_script = std::move(script);
    }

    common::util::cereal_load_optional(archive, "telemetry", this->telemetry);
    common::util::cereal_load_optional(archive, "stream", this->stream);
    common::util::cereal_load_optional(archive, "workers", this->workers);
  }

  Bridge Bridge::deserialize(std::istream& in_stream)
  {
    Bridge cfg;
    cereal::JSONInputArchive archive_in(in_stream);
    cfg.load(archive_in);
    return cfg;
  }

  Bridge Bridge::deserialize(int argc, char** argv)
  {
    cxxopts::Options options("llmbridge", "Executes LLM-backed functions through the bridge.");
    options.add_options(
    )("c,config", "JSON config.", cxxopts::value<std::string>()->default_value(""));
    options.allow_unrecognised_options();
    auto parsed_options = options.parse(argc, argv);

    std::string config_file{parsed_options["config"].as<std::string>()};

    Bridge cfg;
    if (config_file.length() > 0) {
      std::ifstream in_stream{config_file};
      if (!in_stream.is_open()) {
        spdlog::error("Could not open config file {}", config_file);
        throw common::InvalidConfigurationError{
            fmt::format("Could not open config file {}", config_file)};
      }

      cereal::JSONInputArchive archive_in(in_stream);
      cfg.load(archive_in);
    } else {

      cfg.set_defaults();
    }

    return cfg;
  }

} // namespace llmbridge::bridge::config
