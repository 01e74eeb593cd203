#include <llmbridge/bridge/actions.hpp>
#include <llmbridge/bridge/client.hpp>
#include <llmbridge/bridge/config.hpp>
#include <llmbridge/bridge/workers.hpp>
#include <llmbridge/common/exceptions.hpp>
#include <llmbridge/engine/scripted.hpp>
#include <llmbridge/telemetry/event_bus.hpp>

#include <exception>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

struct Options {
  std::string function;
  std::string resource;
  std::vector<std::string> arguments;
  std::optional<std::string> script;
  bool stream;
};

Options parse_options(int argc, char** argv)
{
  cxxopts::Options options("llmbridge-cli", "Runs a function of a scripted engine.");
  options.add_options()("f,function", "Function name.", cxxopts::value<std::string>())(
      "r,resource", "Resource name reported in events.",
      cxxopts::value<std::string>()->default_value("cli")
  )("a,arg", "Argument as name=json, can be repeated.",
    cxxopts::value<std::vector<std::string>>()->default_value("")
  )("s,script", "Engine script, overrides the config.", cxxopts::value<std::string>())(
      "stream", "Consume the function as a stream.",
      cxxopts::value<bool>()->default_value("false")
  );
  options.allow_unrecognised_options();
  auto parsed = options.parse(argc, argv);

  if (!parsed.count("function")) {
    throw llmbridge::common::InvalidConfigurationError{"Missing function name (-f/--function)"};
  }

  Options result{
      parsed["function"].as<std::string>(), parsed["resource"].as<std::string>(),
      parsed["arg"].as<std::vector<std::string>>(), std::nullopt, parsed["stream"].as<bool>()};
  if (parsed.count("script")) {
    result.script = parsed["script"].as<std::string>();
  }
  return result;
}

llmbridge::engine::Arguments parse_arguments(const std::vector<std::string>& args)
{
  llmbridge::engine::Arguments result;
  for (const auto& arg : args) {

    if (arg.empty()) {
      continue;
    }

    auto pos = arg.find('=');
    if (pos == std::string::npos) {
      throw llmbridge::common::InvalidConfigurationError{
          fmt::format("Argument {} is not in the form name=json", arg)};
    }
    result[arg.substr(0, pos)] = arg.substr(pos + 1);
  }
  return result;
}

int run_stream(
    llmbridge::bridge::Client& client, const llmbridge::bridge::config::Bridge& cfg,
    const llmbridge::bridge::Action& action, llmbridge::engine::Arguments&& args
)
{
  llmbridge::bridge::WorkerPool workers{cfg.workers};
  llmbridge::bridge::StreamCall call{client, workers, cfg.stream};

  auto result = call.run(action, std::move(args));
  if (auto* error = std::get_if<llmbridge::engine::Error>(&result)) {
    spdlog::error("Stream could not be opened: {}", error->reason);
    return 1;
  }

  auto& stream = std::get<llmbridge::bridge::Stream>(result);
  for (const auto& element : stream) {
    spdlog::info("Received {}: {}", element.type_name, element.json);
  }

  auto phase = stream.phase();
  if (phase != llmbridge::bridge::Phase::COMPLETED) {
    spdlog::error(
        "Stream ended in phase {}, reason: {}",
        phase.has_value() ? llmbridge::bridge::phase_to_string(phase.value()) : "none",
        stream.error().value_or("none")
    );
    return 1;
  }

  auto usage = stream.usage().value_or(llmbridge::engine::Usage::zero());
  spdlog::info(
      "Usage: input {}, output {}, total {}", usage.input_tokens, usage.output_tokens,
      usage.total_tokens
  );
  return 0;
}

int run_function(
    llmbridge::bridge::Client& client, const llmbridge::bridge::Action& action,
    llmbridge::engine::Arguments&& args
)
{
  auto& bus = llmbridge::telemetry::LocalEventBus::global();
  auto event_name = action.telemetry.event_name(llmbridge::telemetry::EventKind::STOP);
  bus.attach("cli-stop", event_name, [](const llmbridge::telemetry::Event& event) {
    spdlog::debug(
        "Event {}: function {}, duration {} ns", event.name_str(),
        event.metadata.call.function_name, event.measurements.duration.value_or(0)
    );
  });

  llmbridge::bridge::FunctionCall call{client, bus};
  auto result = call.run(action, args);
  bus.detach("cli-stop");

  if (auto* error = std::get_if<llmbridge::engine::Error>(&result)) {
    spdlog::error("Function {} failed: {}", action.function, error->reason);
    return 1;
  }

  auto& response = std::get<llmbridge::bridge::Response>(result);
  spdlog::info("Result {}: {}", response.data.type_name, response.data.json);
  if (response.data.variant.has_value()) {
    spdlog::info("Union member: {}", response.data.variant.value());
  }

  auto usage = response.usage.value_or(llmbridge::engine::Usage::zero());
  spdlog::info(
      "Usage: input {}, output {}, total {}", usage.input_tokens, usage.output_tokens,
      usage.total_tokens
  );
  if (response.diagnostics.model_name.has_value()) {
    spdlog::info("Model: {}", response.diagnostics.model_name.value());
  }
  return 0;
}

int main(int argc, char** argv)
{
  try {

    auto cfg = llmbridge::bridge::config::Bridge::deserialize(argc, argv);
    if (cfg.verbose) {
      spdlog::set_level(spdlog::level::debug);
    } else {
      spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");

    Options opts = parse_options(argc, argv);
    if (opts.script.has_value()) {
      cfg.engine_script = opts.script;
    }
    if (!cfg.engine_script.has_value()) {
      spdlog::error("No engine script provided, use -s/--script or engine-script in the config");
      return 1;
    }

    auto engine = llmbridge::engine::ScriptedEngine::deserialize(cfg.engine_script.value());
    llmbridge::bridge::Client client{"cli", engine, engine.functions()};

    llmbridge::bridge::Action action{
        opts.resource, opts.stream ? "stream" : "call", opts.function, std::nullopt,
        cfg.telemetry};

    auto args = parse_arguments(opts.arguments);
    if (opts.stream) {
      return run_stream(client, cfg, action, std::move(args));
    }
    return run_function(client, action, std::move(args));

  } catch (const llmbridge::common::LLMBridgeException& exc) {
    spdlog::error("Execution failed: {}", exc.what());
    return 1;
  } catch (const std::exception& exc) {
    // Malformed config files and invalid command-line values.
    spdlog::error("Execution failed: {}", exc.what());
    return 1;
  }
}
