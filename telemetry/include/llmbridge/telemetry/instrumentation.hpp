#ifndef LLMBRIDGE_TELEMETRY_INSTRUMENTATION_HPP
#define LLMBRIDGE_TELEMETRY_INSTRUMENTATION_HPP

#include <llmbridge/common/util.hpp>
#include <llmbridge/engine/collector.hpp>
#include <llmbridge/engine/engine.hpp>
#include <llmbridge/telemetry/config.hpp>
#include <llmbridge/telemetry/event_bus.hpp>
#include <llmbridge/telemetry/events.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace llmbridge::telemetry {

  struct Context {
    std::optional<std::string> llm_client;
    bool stream{};
  };

  // Identifies one call. Resource and action are reported only as event metadata.
  struct Invocation {
    std::string resource;
    std::string action;
    std::string function_name;
    engine::Arguments arguments;
    Config telemetry;
    Context context;
  };

  template <typename R>
  struct Instrumented {
    R result;
    std::shared_ptr<engine::Collector> collector;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Wraps engine calls with start/stop/exception events.
  ///
  /// Every call receives a collector, whether events are published or not.
  /// The wrapped call's result and exceptions are passed through unchanged.
  ////////////////////////////////////////////////////////////////////////////////
  class Instrumentation {
  public:
    using sampler_t = std::function<double()>;

    Instrumentation(engine::Engine& engine, EventBus& bus = NullEventBus::instance());

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Executes the call with an attached collector.
    ///
    /// @param[in] invocation call descriptor
    /// @param[in] func callable receiving engine::Collector&, performs the engine call
    /// @param[in] collector existing collector to reuse; a new one is created when null
    /// @return the call's own result and the collector used by the call
    ////////////////////////////////////////////////////////////////////////////////
    template <typename F>
    auto execute(
        const Invocation& invocation, F&& func,
        std::shared_ptr<engine::Collector> collector = nullptr
    ) -> Instrumented<std::invoke_result_t<F, engine::Collector&>>
    {
      if (!collector) {
        collector = create_collector(invocation);
      }

      if (!enabled(invocation) || !sample(invocation)) {
        return {std::invoke(std::forward<F>(func), *collector), std::move(collector)};
      }

      CallMetadata metadata = call_metadata(invocation, *collector);
      int64_t start = common::util::monotonic_time();
      _emit_start(invocation, metadata, start);

      std::optional<std::invoke_result_t<F, engine::Collector&>> result;
      try {
        result.emplace(std::invoke(std::forward<F>(func), *collector));
      } catch (const std::exception& exc) {
        _emit_exception(invocation, metadata, start, exc.what());
        throw;
      } catch (...) {
        _emit_exception(invocation, metadata, start, "unknown exception");
        throw;
      }

      // Only faults of the call itself reach the exception event.
      _emit_stop(invocation, metadata, start, *collector);
      return {std::move(result.value()), std::move(collector)};
    }

    bool enabled(const Invocation& invocation) const;

    bool sample(const Invocation& invocation) const;

    std::shared_ptr<engine::Collector> create_collector(const Invocation& invocation);

    CallMetadata call_metadata(const Invocation& invocation, const engine::Collector& collector) const;

    // Replaces the uniform [0, 1) random draw used for sampling.
    void sampler(sampler_t sampler)
    {
      _sampler = std::move(sampler);
    }

  private:
    void _emit_start(const Invocation& invocation, const CallMetadata& metadata, int64_t start);

    void _emit_stop(
        const Invocation& invocation, const CallMetadata& metadata, int64_t start,
        const engine::Collector& collector
    );

    void _emit_exception(
        const Invocation& invocation, const CallMetadata& metadata, int64_t start,
        const std::string& reason
    );

    void _publish(Event&& event);

    engine::Engine& _engine;

    EventBus& _bus;

    sampler_t _sampler;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace llmbridge::telemetry

#endif
