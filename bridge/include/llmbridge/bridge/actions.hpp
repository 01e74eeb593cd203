#ifndef LLMBRIDGE_BRIDGE_ACTIONS_HPP
#define LLMBRIDGE_BRIDGE_ACTIONS_HPP

#include <llmbridge/bridge/client.hpp>
#include <llmbridge/bridge/config.hpp>
#include <llmbridge/bridge/response.hpp>
#include <llmbridge/bridge/stream.hpp>
#include <llmbridge/bridge/union.hpp>
#include <llmbridge/bridge/workers.hpp>
#include <llmbridge/telemetry/config.hpp>
#include <llmbridge/telemetry/event_bus.hpp>
#include <llmbridge/telemetry/instrumentation.hpp>

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <spdlog/spdlog.h>

namespace llmbridge::bridge {

  // Action of a resource backed by an engine function.
  struct Action {
    std::string resource;
    std::string name;
    std::string function;

    // Set when the function returns one of several schema types.
    std::optional<UnionType> returns_union{};

    telemetry::Config telemetry{};
  };

  engine::Error function_not_found(const Action& action, const Client& client);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Single-shot action: instrumented engine call wrapped in a Response.
  ////////////////////////////////////////////////////////////////////////////////
  class FunctionCall {
  public:
    FunctionCall(Client& client, telemetry::EventBus& bus = telemetry::NullEventBus::instance());

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Runs the action's function.
    ///
    /// Engine exceptions propagate unchanged; error outcomes are returned unwrapped.
    ///
    /// @param[in] action action descriptor
    /// @param[in] args function arguments
    /// @param[in] context telemetry context of the call
    /// @param[in] collector existing collector to reuse
    /// @return Response on success, engine::Error otherwise
    ////////////////////////////////////////////////////////////////////////////////
    CallResult run(
        const Action& action, const engine::Arguments& args, telemetry::Context context = {},
        std::shared_ptr<engine::Collector> collector = nullptr
    );

    telemetry::Instrumentation& instrumentation()
    {
      return _instrumentation;
    }

  private:
    Client& _client;

    telemetry::Instrumentation _instrumentation;

    std::shared_ptr<spdlog::logger> _logger;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Streaming action: opens a pull-based stream of the function's results.
  ////////////////////////////////////////////////////////////////////////////////
  class StreamCall {
  public:
    StreamCall(Client& client, WorkerPool& workers, config::Stream cfg);

    // Messages of the stream are delivered to the calling thread's mailbox.
    // The returned stream does not depend on this object.
    std::variant<Stream, engine::Error> run(const Action& action, engine::Arguments args);

    StreamingBridge& bridge()
    {
      return _bridge;
    }

  private:
    Client& _client;

    StreamingBridge _bridge;
  };

} // namespace llmbridge::bridge

#endif
