#ifndef LLMBRIDGE_BRIDGE_STREAM_HPP
#define LLMBRIDGE_BRIDGE_STREAM_HPP

#include <llmbridge/bridge/config.hpp>
#include <llmbridge/bridge/generator.hpp>
#include <llmbridge/bridge/mailbox.hpp>
#include <llmbridge/bridge/workers.hpp>
#include <llmbridge/engine/collector.hpp>
#include <llmbridge/engine/engine.hpp>

#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include <spdlog/spdlog.h>
#include <uuid.h>

namespace llmbridge::bridge {

  enum class Phase { STREAMING = 0, COMPLETED, FAILED, ABANDONED, TIMED_OUT };

  std::string phase_to_string(Phase phase);

  // State of one streaming call, threaded through every step.
  struct StreamSession {
    uuids::uuid token;
    Phase phase;

    // Requests cooperative cancellation of the worker.
    std::stop_source worker;

    std::shared_ptr<Mailbox> mailbox;
    std::shared_ptr<engine::Collector> collector;

    std::optional<std::string> error;
  };

  using StreamStep = Step<engine::Value, StreamSession>;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Pull-based sequence of partial results followed by the final value.
  ///
  /// Finite, single-pass and not restartable. Destroying or closing the stream
  /// before exhaustion abandons it; the session is cleaned up either way.
  ////////////////////////////////////////////////////////////////////////////////
  class Stream {
  public:
    using generator_t = Generator<engine::Value, StreamSession>;
    using iterator = generator_t::iterator;

    Stream(generator_t&& generator) : _generator(std::move(generator)) {}

    std::optional<engine::Value> next()
    {
      return _generator.next();
    }

    iterator begin()
    {
      return _generator.begin();
    }

    iterator end()
    {
      return _generator.end();
    }

    void close()
    {
      _generator.close();
    }

    bool finished() const
    {
      return _generator.finished();
    }

    // Empty before the first pull.
    std::optional<Phase> phase() const;

    // Reason of a failed or timed out stream.
    std::optional<std::string> error() const;

    std::optional<uuids::uuid> token() const;

    // Usage of the engine call; available only for completed streams.
    std::optional<engine::Usage> usage() const;

    std::shared_ptr<engine::Collector> collector() const;

  private:
    generator_t _generator;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Converts the engine's pushed stream chunks into a pull-based Stream.
  ///
  /// A worker task runs the engine call and forwards correlation-tagged messages
  /// to the consumer's mailbox. Streams hold a copy of the bridge and may outlive
  /// it; the engine and the worker pool must outlive every stream opened here.
  ////////////////////////////////////////////////////////////////////////////////
  class StreamingBridge {
  public:
    StreamingBridge(engine::Engine& engine, WorkerPool& workers, config::Stream cfg);

    // Session is initialized on the first pull.
    Stream open(
        const std::string& function_name, engine::Arguments args,
        std::shared_ptr<Mailbox> mailbox = Mailbox::current()
    );

    StreamSession init(
        const std::string& function_name, const engine::Arguments& args,
        std::shared_ptr<Mailbox> mailbox
    ) const;

    StreamStep step(StreamSession&& session) const;

    void cleanup(StreamSession& session) const;

    // Chunks without content are not yielded to the consumer.
    static bool is_empty_chunk(const engine::Value& chunk, const std::string& content_field);

    const config::Stream& config() const
    {
      return _config;
    }

  private:
    engine::Engine& _engine;

    WorkerPool& _workers;

    config::Stream _config;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace llmbridge::bridge

#endif
