#ifndef LLMBRIDGE_ENGINE_VALUE_HPP
#define LLMBRIDGE_ENGINE_VALUE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace llmbridge::engine {

  template <class... Ts>
  struct overloaded : Ts... {
    using Ts::operator()...;
  };
  template <class... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;

  // Structured result produced by the engine: the name of the schema type
  // and its JSON serialization.
  struct Value {

    std::string type_name;

    std::string json;

    // Name of the union member selected for this value, if any.
    std::optional<std::string> variant{};

    bool operator==(const Value&) const = default;
  };

  struct Error {

    std::string reason;

    bool operator==(const Error&) const = default;
  };

  using Outcome = std::variant<Value, Error>;

  // Argument name -> JSON text.
  using Arguments = std::map<std::string, std::string>;

  struct Usage {

    int64_t input_tokens{};

    int64_t output_tokens{};

    int64_t total_tokens{};

    static Usage from_tokens(std::optional<int64_t> input, std::optional<int64_t> output)
    {
      int64_t in = input.value_or(0);
      int64_t out = output.value_or(0);
      return Usage{in, out, in + out};
    }

    static Usage zero()
    {
      return Usage{};
    }

    bool operator==(const Usage&) const = default;
  };

  struct HttpRequest {
    std::optional<std::string> url;
    std::optional<std::string> method;
    std::optional<std::map<std::string, std::string>> headers;
    std::optional<std::string> body;

    bool empty() const
    {
      return !url && !method && !headers && !body;
    }
  };

  struct HttpResponse {
    std::optional<int> status_code;
    std::optional<std::map<std::string, std::string>> headers;
    std::optional<std::string> body;

    bool empty() const
    {
      return !status_code && !headers && !body;
    }
  };

  // One attempt at calling an LLM provider within a function call.
  struct LLMCall {
    std::optional<std::string> provider;
    std::optional<std::string> client_name;
    bool selected{};
    std::optional<HttpRequest> request;
    std::optional<HttpResponse> response;
  };

  struct Timing {
    int64_t start_time_ms{};
    std::optional<int64_t> duration_ms;
  };

  // The engine's record of the last function executed with a collector.
  struct FunctionLog {
    std::optional<std::string> id;
    std::optional<std::string> function_name;
    std::optional<std::string> log_type;
    std::optional<std::string> raw_llm_response;
    std::map<std::string, std::string> tags;
    std::optional<Timing> timing;
    std::vector<LLMCall> calls;

    const LLMCall* selected_call() const;
  };

  struct Diagnostics {
    std::optional<std::string> model_name;
    std::optional<std::string> provider;
    std::optional<std::string> client_name;
    // Absent when the log recorded no calls.
    std::optional<int> num_attempts;
    std::optional<std::string> request_id;
    std::optional<std::string> raw_response;
    std::optional<std::map<std::string, std::string>> tags;
    std::optional<std::string> log_type;
    std::optional<HttpRequest> http_request;
    std::optional<HttpResponse> http_response;
    std::optional<Timing> timing;

    static Diagnostics from_log(const FunctionLog& log);

    // Extracts the "model" field from a JSON request body.
    static std::optional<std::string> model_from_body(const std::string& body);
  };

} // namespace llmbridge::engine

#endif
