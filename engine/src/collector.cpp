#include <llmbridge/engine/collector.hpp>

#include <spdlog/spdlog.h>

namespace llmbridge::engine {

  Usage extract_usage(const Collector* collector)
  {
    if (!collector) {
      return Usage::zero();
    }

    try {
      auto usage = collector->usage();
      if (!usage.has_value()) {
        return Usage::zero();
      }
      // Engines report raw counts, the total is always recomputed.
      return Usage::from_tokens(usage->input_tokens, usage->output_tokens);
    } catch (const std::exception& exc) {
      spdlog::debug(
          "Failed to extract token usage from collector {}: {}", collector->name(), exc.what()
      );
      return Usage::zero();
    }
  }

  Diagnostics extract_diagnostics(const Collector* collector)
  {
    if (!collector) {
      return Diagnostics{};
    }

    try {
      auto log = collector->last_function_log();
      if (!log.has_value()) {
        return Diagnostics{};
      }
      return Diagnostics::from_log(log.value());
    } catch (const std::exception& exc) {
      spdlog::debug(
          "Failed to extract observability data from collector {}: {}", collector->name(),
          exc.what()
      );
      return Diagnostics{};
    }
  }

} // namespace llmbridge::engine
