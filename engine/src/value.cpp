#include <llmbridge/engine/value.hpp>

#include <cereal/archives/json.hpp>

namespace llmbridge::engine {

  const LLMCall* FunctionLog::selected_call() const
  {
    for (const auto& call : calls) {
      if (call.selected) {
        return &call;
      }
    }
    return calls.empty() ? nullptr : &calls.front();
  }

  std::optional<std::string> Diagnostics::model_from_body(const std::string& body)
  {
    // Cereal bundles rapidjson under its own namespace.
    CEREAL_RAPIDJSON_NAMESPACE::Document doc;
    doc.Parse(body.c_str(), body.length());

    if (doc.HasParseError() || !doc.IsObject()) {
      return std::nullopt;
    }

    auto it = doc.FindMember("model");
    if (it == doc.MemberEnd() || !it->value.IsString()) {
      return std::nullopt;
    }

    return std::string{it->value.GetString(), it->value.GetStringLength()};
  }

  Diagnostics Diagnostics::from_log(const FunctionLog& log)
  {
    Diagnostics diag;

    diag.request_id = log.id;
    diag.raw_response = log.raw_llm_response;
    diag.log_type = log.log_type;
    diag.timing = log.timing;
    if (!log.calls.empty()) {
      diag.num_attempts = static_cast<int>(log.calls.size());
    }
    if (!log.tags.empty()) {
      diag.tags = log.tags;
    }

    const LLMCall* call = log.selected_call();
    if (!call) {
      return diag;
    }

    diag.provider = call->provider;
    diag.client_name = call->client_name;

    if (call->request.has_value() && !call->request->empty()) {
      diag.http_request = call->request;

      if (call->request->body.has_value()) {
        diag.model_name = model_from_body(call->request->body.value());
      }
    }

    if (call->response.has_value() && !call->response->empty()) {
      diag.http_response = call->response;
    }

    return diag;
  }

} // namespace llmbridge::engine
