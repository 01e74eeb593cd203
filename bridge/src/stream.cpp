#include <llmbridge/bridge/stream.hpp>

#include <llmbridge/common/exceptions.hpp>
#include <llmbridge/common/uuid.hpp>

#include <chrono>

#include <cereal/external/rapidjson/document.h>
#include <fmt/format.h>

namespace llmbridge::bridge {

  namespace {

    // Body of the background worker: runs the engine call and forwards its output.
    void forward_stream(
        engine::Engine& engine, const std::string& function_name, const engine::Arguments& args,
        const uuids::uuid& token, const std::weak_ptr<Mailbox>& receiver,
        std::stop_source worker, const std::shared_ptr<engine::Collector>& collector
    )
    {
      auto forward = [&](Message&& msg) {
        auto mailbox = receiver.lock();
        return mailbox && mailbox->send(std::move(msg));
      };

      engine::Outcome outcome;
      try {
        outcome = engine.invoke_stream(
            function_name, args, collector.get(),
            [&](engine::Value&& chunk) {
              // Nobody is listening anymore, let the engine stop early.
              if (!forward(Message{token, Chunk{std::move(chunk)}})) {
                worker.request_stop();
              }
            },
            worker.get_token()
        );
      } catch (const std::exception& exc) {
        outcome = engine::Error{exc.what()};
      } catch (...) {
        outcome = engine::Error{"unknown engine fault"};
      }

      if (!forward(Message{token, Done{std::move(outcome)}})) {
        SPDLOG_DEBUG("Discarded the result of stream {}", common::UUID::str(token));
      }
    }

  } // namespace

  std::string phase_to_string(Phase phase)
  {
    switch (phase) {
    case Phase::STREAMING:
      return "streaming";
    case Phase::COMPLETED:
      return "completed";
    case Phase::FAILED:
      return "failed";
    case Phase::ABANDONED:
      return "abandoned";
    case Phase::TIMED_OUT:
      return "timed_out";
    }
    return "";
  }

  std::optional<Phase> Stream::phase() const
  {
    const auto& state = _generator.state();
    if (!state.has_value()) {
      return std::nullopt;
    }
    return state->phase;
  }

  std::optional<std::string> Stream::error() const
  {
    const auto& state = _generator.state();
    if (!state.has_value()) {
      return std::nullopt;
    }
    return state->error;
  }

  std::optional<uuids::uuid> Stream::token() const
  {
    const auto& state = _generator.state();
    if (!state.has_value()) {
      return std::nullopt;
    }
    return state->token;
  }

  std::optional<engine::Usage> Stream::usage() const
  {
    const auto& state = _generator.state();
    if (!state.has_value() || state->phase != Phase::COMPLETED) {
      return std::nullopt;
    }
    // The worker wrote the collector before sending the final message.
    return engine::extract_usage(state->collector.get());
  }

  std::shared_ptr<engine::Collector> Stream::collector() const
  {
    const auto& state = _generator.state();
    if (!state.has_value()) {
      return nullptr;
    }
    return state->collector;
  }

  StreamingBridge::StreamingBridge(
      engine::Engine& engine, WorkerPool& workers, config::Stream cfg
  )
      : _engine(engine), _workers(workers), _config(std::move(cfg))
  {
    _logger = common::util::create_logger("Stream");
  }

  Stream StreamingBridge::open(
      const std::string& function_name, engine::Arguments args, std::shared_ptr<Mailbox> mailbox
  )
  {
    if (!mailbox) {
      throw common::InvalidStreamState{
          fmt::format("Stream of function {} has no mailbox to receive from", function_name)};
    }

    // The stream keeps its own copy, it may outlive this bridge.
    auto bridge = std::make_shared<const StreamingBridge>(*this);

    return Stream{Stream::generator_t{
        [bridge, function_name, args = std::move(args), mailbox = std::move(mailbox)]() {
          return bridge->init(function_name, args, mailbox);
        },
        [bridge](StreamSession&& session) { return bridge->step(std::move(session)); },
        [bridge](StreamSession& session) { bridge->cleanup(session); }}};
  }

  StreamSession StreamingBridge::init(
      const std::string& function_name, const engine::Arguments& args,
      std::shared_ptr<Mailbox> mailbox
  ) const
  {
    thread_local common::UUID generator;
    uuids::uuid token = generator.generate();

    auto collector = _engine.create_collector(
        fmt::format("{}-stream-{}", function_name, common::UUID::str(token))
    );

    std::stop_source worker;
    std::weak_ptr<Mailbox> receiver = mailbox;

    _workers.add_task([&engine = _engine, function_name, args, token, receiver, worker,
                       collector]() {
      forward_stream(engine, function_name, args, token, receiver, worker, collector);
    });
    _logger->debug("Started stream {} of function {}", common::UUID::str(token), function_name);

    return StreamSession{
        token, Phase::STREAMING, worker, std::move(mailbox), std::move(collector), std::nullopt};
  }

  StreamStep StreamingBridge::step(StreamSession&& session) const
  {
    if (session.phase != Phase::STREAMING) {
      return StreamStep{std::nullopt, std::move(session), Control::HALT};
    }

    auto timeout = std::chrono::milliseconds{_config.read_timeout_ms};

    // Content-less chunks are consumed within the same step.
    while (true) {

      auto msg = session.mailbox->receive(session.token, timeout);
      if (!msg.has_value()) {
        _logger->warn(
            "Stream {} received no message within {} ms", common::UUID::str(session.token),
            _config.read_timeout_ms
        );
        session.phase = Phase::TIMED_OUT;
        session.error = "timeout";
        return StreamStep{std::nullopt, std::move(session), Control::HALT};
      }

      if (auto* chunk = std::get_if<Chunk>(&msg->body)) {

        if (is_empty_chunk(chunk->value, _config.content_field)) {
          SPDLOG_LOGGER_DEBUG(_logger, "Dropped empty chunk of stream {}", common::UUID::str(session.token));
          continue;
        }
        return StreamStep{std::move(chunk->value), std::move(session), Control::CONTINUE};
      }

      auto& outcome = std::get<Done>(msg->body).outcome;
      if (auto* value = std::get_if<engine::Value>(&outcome)) {
        session.phase = Phase::COMPLETED;
        return StreamStep{std::move(*value), std::move(session), Control::LAST};
      }

      session.phase = Phase::FAILED;
      session.error = std::get<engine::Error>(outcome).reason;
      _logger->error(
          "Stream {} failed, reason: {}", common::UUID::str(session.token), session.error.value()
      );
      return StreamStep{std::nullopt, std::move(session), Control::HALT};
    }
  }

  void StreamingBridge::cleanup(StreamSession& session) const
  {
    // Without the final message, the worker may still deliver output.
    bool worker_active = session.phase == Phase::STREAMING || session.phase == Phase::TIMED_OUT;
    if (session.phase == Phase::STREAMING) {
      session.phase = Phase::ABANDONED;
    }

    if (worker_active) {
      session.mailbox->reject(session.token);
    }

    int drained = session.mailbox->drain(session.token, _config.drain_limit);

    if (worker_active && _engine.supports_cancellation()) {
      session.worker.request_stop();
    }

    _logger->debug(
        "Closed stream {} in phase {}, discarded {} messages", common::UUID::str(session.token),
        phase_to_string(session.phase), drained
    );
  }

  bool StreamingBridge::is_empty_chunk(const engine::Value& chunk, const std::string& content_field)
  {
    CEREAL_RAPIDJSON_NAMESPACE::Document doc;
    doc.Parse(chunk.json.c_str(), chunk.json.length());

    if (doc.HasParseError()) {
      // Blank payload; any other unparsable payload is passed through.
      return chunk.json.find_first_not_of(" \t\r\n") == std::string::npos;
    }

    if (doc.IsNull()) {
      return true;
    }
    if (doc.IsString()) {
      return doc.GetStringLength() == 0;
    }
    if (!doc.IsObject()) {
      return false;
    }

    auto it = doc.FindMember(content_field.c_str());
    if (it == doc.MemberEnd()) {
      return false;
    }
    return it->value.IsNull() || (it->value.IsString() && it->value.GetStringLength() == 0);
  }

} // namespace llmbridge::bridge
