#ifndef LLMBRIDGE_BRIDGE_RESPONSE_HPP
#define LLMBRIDGE_BRIDGE_RESPONSE_HPP

#include <llmbridge/engine/collector.hpp>
#include <llmbridge/engine/value.hpp>

#include <memory>
#include <optional>
#include <variant>

namespace llmbridge::bridge {

  struct Response;

  // Result of a single-shot call: envelope on success, the engine's error otherwise.
  using CallResult = std::variant<Response, engine::Error>;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Successful call result together with its usage metadata.
  ///
  /// Data is the engine's value, untouched except for union tagging applied
  /// before wrapping.
  ////////////////////////////////////////////////////////////////////////////////
  struct Response {

    engine::Value data;

    // Empty only when no collector was attached to the call.
    std::optional<engine::Usage> usage;

    std::shared_ptr<engine::Collector> collector;

    engine::Diagnostics diagnostics;

    static Response create(engine::Value&& data, std::shared_ptr<engine::Collector> collector);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Wraps a successful outcome; errors are passed through unchanged.
    ///
    /// Never throws on collector failures: usage degrades to zero, diagnostics
    /// to empty fields.
    ////////////////////////////////////////////////////////////////////////////////
    static CallResult wrap(engine::Outcome&& outcome, std::shared_ptr<engine::Collector> collector);
  };

  const engine::Value& unwrap(const Response& response);

  const engine::Value& unwrap(const engine::Value& value);

  engine::Outcome unwrap(const CallResult& result);

  const engine::Outcome& unwrap(const engine::Outcome& outcome);

  std::optional<engine::Usage> usage(const Response& response);

  std::optional<engine::Usage> usage(const engine::Value& value);

  std::optional<engine::Usage> usage(const CallResult& result);

} // namespace llmbridge::bridge

#endif
