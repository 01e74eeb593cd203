#include <llmbridge/engine/collector.hpp>
#include <llmbridge/engine/value.hpp>

#include <stdexcept>

#include <gtest/gtest.h>

using namespace llmbridge::engine;

namespace {

  struct FailingCollector : Collector {

    const std::string& name() const override
    {
      return _name;
    }

    std::optional<Usage> usage() const override
    {
      throw std::runtime_error{"usage unavailable"};
    }

    std::optional<FunctionLog> last_function_log() const override
    {
      throw std::runtime_error{"log unavailable"};
    }

    std::string _name{"failing"};
  };

  struct FixedCollector : Collector {

    const std::string& name() const override
    {
      return _name;
    }

    std::optional<Usage> usage() const override
    {
      return _usage;
    }

    std::optional<FunctionLog> last_function_log() const override
    {
      return _log;
    }

    std::string _name{"fixed"};
    std::optional<Usage> _usage;
    std::optional<FunctionLog> _log;
  };

  LLMCall make_call(const std::string& provider, bool selected, const std::string& body)
  {
    LLMCall call;
    call.provider = provider;
    call.client_name = provider + "-client";
    call.selected = selected;
    call.request = HttpRequest{"https://api.example.com", "POST", std::nullopt, body};
    return call;
  }

} // namespace

TEST(Diagnostics, ModelFromBody)
{
  EXPECT_EQ(Diagnostics::model_from_body(R"({"model": "gpt-4o", "messages": []})"), "gpt-4o");
  EXPECT_FALSE(Diagnostics::model_from_body(R"({"messages": []})").has_value());
  EXPECT_FALSE(Diagnostics::model_from_body(R"({"model": 4})").has_value());
  EXPECT_FALSE(Diagnostics::model_from_body("not json").has_value());
}

TEST(Diagnostics, FromLog)
{
  FunctionLog log;
  log.id = "req_7";
  log.raw_llm_response = "{}";
  log.timing = Timing{1000, 250};
  log.calls.push_back(make_call("anthropic", false, R"({"model": "haiku-3"})"));
  log.calls.push_back(make_call("openai", true, R"({"model": "gpt-4"})"));

  auto diag = Diagnostics::from_log(log);
  EXPECT_EQ(diag.request_id, "req_7");
  EXPECT_EQ(diag.raw_response, "{}");
  EXPECT_EQ(diag.num_attempts, 2);
  EXPECT_EQ(diag.provider, "openai");
  EXPECT_EQ(diag.client_name, "openai-client");
  EXPECT_EQ(diag.model_name, "gpt-4");
  ASSERT_TRUE(diag.timing.has_value());
  EXPECT_EQ(diag.timing->duration_ms, 250);
  EXPECT_FALSE(diag.tags.has_value());
  EXPECT_FALSE(diag.http_response.has_value());
}

TEST(Diagnostics, FirstCallWithoutSelection)
{
  FunctionLog log;
  log.calls.push_back(make_call("anthropic", false, R"({"model": "haiku-3"})"));
  log.calls.push_back(make_call("openai", false, R"({"model": "gpt-4"})"));

  auto diag = Diagnostics::from_log(log);
  EXPECT_EQ(diag.provider, "anthropic");
  EXPECT_EQ(diag.model_name, "haiku-3");

  auto empty = Diagnostics::from_log(FunctionLog{});
  EXPECT_FALSE(empty.num_attempts.has_value());
  EXPECT_FALSE(empty.provider.has_value());
}

TEST(Collector, ExtractUsage)
{
  EXPECT_EQ(extract_usage(nullptr), Usage::zero());

  FailingCollector failing;
  EXPECT_EQ(extract_usage(&failing), Usage::zero());

  FixedCollector fixed;
  EXPECT_EQ(extract_usage(&fixed), Usage::zero());

  // Total reported by the engine is not trusted.
  fixed._usage = Usage{10, 5, 100};
  auto usage = extract_usage(&fixed);
  EXPECT_EQ(usage.input_tokens, 10);
  EXPECT_EQ(usage.output_tokens, 5);
  EXPECT_EQ(usage.total_tokens, 15);
}

TEST(Collector, ExtractDiagnostics)
{
  EXPECT_FALSE(extract_diagnostics(nullptr).request_id.has_value());

  FailingCollector failing;
  auto diag = extract_diagnostics(&failing);
  EXPECT_FALSE(diag.request_id.has_value());
  EXPECT_FALSE(diag.num_attempts.has_value());

  FixedCollector fixed;
  fixed._log = FunctionLog{};
  fixed._log->id = "req_2";
  EXPECT_EQ(extract_diagnostics(&fixed).request_id, "req_2");
}
