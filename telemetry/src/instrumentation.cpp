#include <llmbridge/telemetry/instrumentation.hpp>

#include <atomic>
#include <random>

#include <fmt/format.h>

namespace llmbridge::telemetry {

  namespace {

    double uniform()
    {
      thread_local std::mt19937_64 generator{std::random_device{}()};
      thread_local std::uniform_real_distribution<double> distribution{0.0, 1.0};
      return distribution(generator);
    }

    std::atomic<uint64_t> collector_counter{0};

  } // namespace

  Instrumentation::Instrumentation(engine::Engine& engine, EventBus& bus)
      : _engine(engine), _bus(bus), _sampler(uniform)
  {
    _logger = common::util::create_logger("Telemetry");
  }

  bool Instrumentation::enabled(const Invocation& invocation) const
  {
    return invocation.telemetry.enabled;
  }

  bool Instrumentation::sample(const Invocation& invocation) const
  {
    double rate = invocation.telemetry.sample_rate;
    if (rate >= 1.0) {
      return true;
    }
    if (rate <= 0.0) {
      return false;
    }
    return _sampler() < rate;
  }

  std::shared_ptr<engine::Collector> Instrumentation::create_collector(const Invocation& invocation)
  {
    std::string name;
    if (invocation.telemetry.collector_name_generator) {
      name = invocation.telemetry.collector_name_generator(invocation);
    } else if (invocation.telemetry.collector_name.has_value()) {
      name = invocation.telemetry.collector_name.value();
    } else {
      name = fmt::format(
          "{}-{}-{}", invocation.resource, invocation.function_name, ++collector_counter
      );
    }

    return _engine.create_collector(name);
  }

  CallMetadata Instrumentation::call_metadata(
      const Invocation& invocation, const engine::Collector& collector
  ) const
  {
    CallMetadata metadata{
        invocation.resource, invocation.action, invocation.function_name, collector.name(), {}};

    const auto& allowed = invocation.telemetry.metadata;
    if (allowed.count("llm_client") && invocation.context.llm_client.has_value()) {
      metadata.context.emplace("llm_client", invocation.context.llm_client.value());
    }
    if (allowed.count("stream")) {
      metadata.context.emplace("stream", invocation.context.stream ? "true" : "false");
    }

    return metadata;
  }

  void Instrumentation::_emit_start(
      const Invocation& invocation, const CallMetadata& metadata, int64_t start
  )
  {
    if (!invocation.telemetry.emits(EventKind::START)) {
      return;
    }

    Event event{invocation.telemetry.event_name(EventKind::START), EventKind::START, {}, {metadata}};
    event.measurements.monotonic_time = start;
    event.measurements.system_time = common::util::system_time();

    _publish(std::move(event));
  }

  void Instrumentation::_emit_stop(
      const Invocation& invocation, const CallMetadata& metadata, int64_t start,
      const engine::Collector& collector
  )
  {
    if (!invocation.telemetry.emits(EventKind::STOP)) {
      return;
    }

    int64_t end = common::util::monotonic_time();
    engine::Usage usage = engine::extract_usage(&collector);

    Event event{invocation.telemetry.event_name(EventKind::STOP), EventKind::STOP, {}, {metadata}};
    event.measurements.duration = end - start;
    event.measurements.monotonic_time = end;
    event.measurements.input_tokens = usage.input_tokens;
    event.measurements.output_tokens = usage.output_tokens;
    event.measurements.total_tokens = usage.total_tokens;
    event.metadata.observability = engine::extract_diagnostics(&collector);

    _publish(std::move(event));
  }

  void Instrumentation::_emit_exception(
      const Invocation& invocation, const CallMetadata& metadata, int64_t start,
      const std::string& reason
  )
  {
    if (!invocation.telemetry.emits(EventKind::EXCEPTION)) {
      return;
    }

    int64_t end = common::util::monotonic_time();

    Event event{
        invocation.telemetry.event_name(EventKind::EXCEPTION), EventKind::EXCEPTION, {}, {metadata}};
    event.measurements.duration = end - start;
    event.measurements.monotonic_time = end;
    event.metadata.exception = ExceptionInfo{"error", reason, common::util::stacktrace()};

    _publish(std::move(event));
  }

  void Instrumentation::_publish(Event&& event)
  {
    try {
      _bus.publish(event);
    } catch (const std::exception& exc) {
      _logger->error("Publishing event {} failed, reason: {}", event.name_str(), exc.what());
    } catch (...) {
      _logger->error("Publishing event {} failed with an unknown exception", event.name_str());
    }
  }

} // namespace llmbridge::telemetry
