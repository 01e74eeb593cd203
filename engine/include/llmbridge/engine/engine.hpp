#ifndef LLMBRIDGE_ENGINE_ENGINE_HPP
#define LLMBRIDGE_ENGINE_ENGINE_HPP

#include <llmbridge/engine/collector.hpp>
#include <llmbridge/engine/value.hpp>

#include <functional>
#include <memory>
#include <stop_token>
#include <string>

namespace llmbridge::engine {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief External prompt-execution engine evaluating typed, LLM-backed functions.
  ///
  /// Both entry points are synchronous. Faults that are not a reported error
  /// outcome (transport, malformed response) are thrown.
  ////////////////////////////////////////////////////////////////////////////////
  struct Engine {

    using chunk_callback_t = std::function<void(Value&&)>;

    virtual ~Engine() = default;

    virtual std::shared_ptr<Collector> create_collector(const std::string& name) = 0;

    virtual Outcome
    invoke(const std::string& function_name, const Arguments& args, Collector* collector) = 0;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Executes a function and reports each partial result through the callback.
    ///
    /// The callback is invoked on the calling thread, in production order, before
    /// the final outcome is returned. Engines supporting cooperative cancellation
    /// stop early once a stop is requested.
    ////////////////////////////////////////////////////////////////////////////////
    virtual Outcome invoke_stream(
        const std::string& function_name, const Arguments& args, Collector* collector,
        const chunk_callback_t& on_chunk, std::stop_token stop
    ) = 0;

    virtual bool supports_cancellation() const
    {
      return false;
    }
  };

} // namespace llmbridge::engine

#endif
