#ifndef LLMBRIDGE_ENGINE_SCRIPTED_HPP
#define LLMBRIDGE_ENGINE_SCRIPTED_HPP

#include <llmbridge/engine/collector.hpp>
#include <llmbridge/engine/engine.hpp>

#include <atomic>
#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmbridge::engine {

  // Behavior of one function of the scripted engine.
  struct ScriptedFunction {

    std::string type_name;

    // JSON of the final value; ignored when error is set.
    std::string result{"null"};

    // Reported as an error outcome.
    std::optional<std::string> error;

    // Thrown as an engine fault.
    std::optional<std::string> fault;

    // JSON of every partial result, in emission order.
    std::vector<std::string> chunks;

    std::optional<int64_t> input_tokens;
    std::optional<int64_t> output_tokens;

    std::optional<FunctionLog> log;

    int chunk_delay_ms{};

    // Time spent before emitting anything.
    int silent_ms{};
  };

  class ScriptedCollector : public Collector {
  public:
    ScriptedCollector(std::string name) : _name(std::move(name)) {}

    const std::string& name() const override
    {
      return _name;
    }

    std::optional<Usage> usage() const override;

    std::optional<FunctionLog> last_function_log() const override;

    void record(const ScriptedFunction& function);

  private:
    std::string _name;

    bool _recorded{};
    std::optional<int64_t> _input_tokens;
    std::optional<int64_t> _output_tokens;
    std::optional<FunctionLog> _log;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Deterministic engine replaying scripted results.
  ///
  /// Used by the command-line runner and by tests. A script is a JSON document:
  ///
  /// {
  ///   "functions": {
  ///     "ChatAgent": {
  ///       "type": "Reply",
  ///       "result": {"content": "Paris"},
  ///       "chunks": [{"content": "Pa"}, {"content": null}],
  ///       "usage": {"input_tokens": 10, "output_tokens": 5},
  ///       "log": {
  ///         "id": "req_1", "raw_llm_response": "Paris",
  ///         "calls": [{"provider": "openai", "client_name": "GPT4", "selected": true,
  ///                    "request": {"body": "{\"model\": \"gpt-4\"}"}}]
  ///       }
  ///     }
  ///   }
  /// }
  ///
  /// Optional keys: "error" (error outcome), "fault" (thrown), "chunk-delay-ms",
  /// "silent-ms".
  ////////////////////////////////////////////////////////////////////////////////
  class ScriptedEngine : public Engine {
  public:
    ScriptedEngine() = default;

    static ScriptedEngine deserialize(std::istream& in_stream);

    static ScriptedEngine deserialize(const std::string& path);

    ScriptedEngine(ScriptedEngine&& obj) noexcept : _functions(std::move(obj._functions)) {}

    void add_function(const std::string& name, ScriptedFunction function);

    bool has_function(const std::string& name) const;

    std::vector<std::string> functions() const;

    int invocations() const
    {
      return _invocations.load();
    }

    std::shared_ptr<Collector> create_collector(const std::string& name) override;

    Outcome
    invoke(const std::string& function_name, const Arguments& args, Collector* collector) override;

    Outcome invoke_stream(
        const std::string& function_name, const Arguments& args, Collector* collector,
        const chunk_callback_t& on_chunk, std::stop_token stop
    ) override;

    bool supports_cancellation() const override
    {
      return true;
    }

  private:
    std::optional<ScriptedFunction> _get(const std::string& name) const;

    static Outcome _finish(const ScriptedFunction& function, Collector* collector);

    mutable std::mutex _lock;

    std::unordered_map<std::string, ScriptedFunction> _functions;

    std::atomic<int> _invocations{};
  };

} // namespace llmbridge::engine

#endif
