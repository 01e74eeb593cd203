#include <llmbridge/bridge/response.hpp>

#include <spdlog/spdlog.h>

namespace llmbridge::bridge {

  Response Response::create(engine::Value&& data, std::shared_ptr<engine::Collector> collector)
  {
    Response response{std::move(data), std::nullopt, std::move(collector), {}};

    if (response.collector) {
      response.usage = engine::extract_usage(response.collector.get());
      response.diagnostics = engine::extract_diagnostics(response.collector.get());
    } else {
      SPDLOG_DEBUG("Wrapping value of type {} without a collector", response.data.type_name);
    }

    return response;
  }

  CallResult Response::wrap(engine::Outcome&& outcome, std::shared_ptr<engine::Collector> collector)
  {
    return std::visit(
        engine::overloaded{
            [&](engine::Value& value) -> CallResult {
              return Response::create(std::move(value), std::move(collector));
            },
            [](engine::Error& error) -> CallResult { return std::move(error); }},
        outcome
    );
  }

  const engine::Value& unwrap(const Response& response)
  {
    return response.data;
  }

  const engine::Value& unwrap(const engine::Value& value)
  {
    return value;
  }

  engine::Outcome unwrap(const CallResult& result)
  {
    return std::visit(
        engine::overloaded{
            [](const Response& response) -> engine::Outcome { return response.data; },
            [](const engine::Error& error) -> engine::Outcome { return error; }},
        result
    );
  }

  const engine::Outcome& unwrap(const engine::Outcome& outcome)
  {
    return outcome;
  }

  std::optional<engine::Usage> usage(const Response& response)
  {
    return response.usage;
  }

  std::optional<engine::Usage> usage(const engine::Value&)
  {
    return std::nullopt;
  }

  std::optional<engine::Usage> usage(const CallResult& result)
  {
    if (auto* response = std::get_if<Response>(&result)) {
      return response->usage;
    }
    return std::nullopt;
  }

} // namespace llmbridge::bridge
