#include <llmbridge/bridge/actions.hpp>

#include <llmbridge/bridge/mailbox.hpp>

#include <fmt/format.h>

namespace llmbridge::bridge {

  engine::Error function_not_found(const Action& action, const Client& client)
  {
    return engine::Error{fmt::format(
        "Function not found: {}\n\n"
        "Resource: {}\n"
        "Function: {}\n"
        "Client: {}\n\n"
        "Make sure that the client {} exports a function named {}.",
        action.function, action.resource, action.function, client.name(), client.name(),
        action.function
    )};
  }

  FunctionCall::FunctionCall(Client& client, telemetry::EventBus& bus)
      : _client(client), _instrumentation(client.engine(), bus)
  {
    _logger = common::util::create_logger("FunctionCall");
  }

  CallResult FunctionCall::run(
      const Action& action, const engine::Arguments& args, telemetry::Context context,
      std::shared_ptr<engine::Collector> collector
  )
  {
    if (!_client.has_function(action.function)) {
      _logger->error(
          "Action {} of resource {} calls unknown function {}", action.name, action.resource,
          action.function
      );
      return function_not_found(action, _client);
    }

    telemetry::Invocation invocation{
        action.resource, action.name, action.function, args, action.telemetry, std::move(context)};

    auto [outcome, used_collector] = _instrumentation.execute(
        invocation,
        [&](engine::Collector& call_collector) {
          return _client.engine().invoke(action.function, args, &call_collector);
        },
        std::move(collector)
    );

    // Union tag must be part of the data before it is wrapped.
    if (auto* value = std::get_if<engine::Value>(&outcome); value && action.returns_union) {
      *value = action.returns_union->resolve(std::move(*value));
    }

    if (auto* error = std::get_if<engine::Error>(&outcome)) {
      _logger->debug("Function {} returned error: {}", action.function, error->reason);
    }

    return Response::wrap(std::move(outcome), std::move(used_collector));
  }

  StreamCall::StreamCall(Client& client, WorkerPool& workers, config::Stream cfg)
      : _client(client), _bridge(client.engine(), workers, std::move(cfg))
  {
  }

  std::variant<Stream, engine::Error> StreamCall::run(const Action& action, engine::Arguments args)
  {
    if (!_client.has_function(action.function)) {
      return function_not_found(action, _client);
    }

    return _bridge.open(action.function, std::move(args), Mailbox::current());
  }

} // namespace llmbridge::bridge
