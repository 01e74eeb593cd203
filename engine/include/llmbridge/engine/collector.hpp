#ifndef LLMBRIDGE_ENGINE_COLLECTOR_HPP
#define LLMBRIDGE_ENGINE_COLLECTOR_HPP

#include <llmbridge/engine/value.hpp>

#include <optional>
#include <string>

namespace llmbridge::engine {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Per-call accumulator populated by the engine.
  ///
  /// A collector is created right before a call, passed into exactly one engine
  /// invocation, and queried after that invocation returned. Queries may throw
  /// when the engine fails to produce the data; callers are expected to tolerate it.
  ////////////////////////////////////////////////////////////////////////////////
  struct Collector {

    virtual ~Collector() = default;

    virtual const std::string& name() const = 0;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Token usage of the calls executed with this collector.
    ///
    /// @return usage; empty optional if the engine recorded no usage.
    ////////////////////////////////////////////////////////////////////////////////
    virtual std::optional<Usage> usage() const = 0;

    virtual std::optional<FunctionLog> last_function_log() const = 0;
  };

  // Never throws: missing usage, a null collector and query failures give zero usage.
  Usage extract_usage(const Collector* collector);

  // Never throws: failures give empty diagnostics.
  Diagnostics extract_diagnostics(const Collector* collector);

} // namespace llmbridge::engine

#endif
