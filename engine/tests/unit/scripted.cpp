#include <llmbridge/common/exceptions.hpp>
#include <llmbridge/engine/scripted.hpp>

#include <sstream>
#include <vector>

#include <gtest/gtest.h>

using namespace llmbridge::engine;

namespace {

  const char* SCRIPT = R"(
    {
      "functions": {
        "ChatAgent": {
          "type": "Reply",
          "result": {"content": "Paris"},
          "chunks": [{"content": "Pa"}, {"content": null}, {"content": "ris"}],
          "usage": {"input_tokens": 12, "output_tokens": 30},
          "log": {
            "id": "req_1",
            "raw_llm_response": "Paris",
            "calls": [
              {"provider": "openai", "client_name": "GPT4", "selected": true,
               "request": {"method": "POST", "body": "{\"model\": \"gpt-4\"}"},
               "response": {"status_code": 200}}
            ]
          }
        },
        "Broken": {
          "type": "Reply",
          "error": "provider rejected the request"
        },
        "Faulty": {
          "type": "Reply",
          "fault": "connection reset"
        }
      }
    }
  )";

  ScriptedEngine load()
  {
    std::stringstream stream{SCRIPT};
    return ScriptedEngine::deserialize(stream);
  }

} // namespace

TEST(ScriptedEngine, Deserialize)
{
  auto engine = load();

  EXPECT_TRUE(engine.has_function("ChatAgent"));
  EXPECT_TRUE(engine.has_function("Broken"));
  EXPECT_TRUE(engine.has_function("Faulty"));
  EXPECT_FALSE(engine.has_function("Unknown"));
  EXPECT_EQ(engine.functions().size(), 3);
}

TEST(ScriptedEngine, DeserializeInvalid)
{
  {
    std::stringstream stream{"{"};
    EXPECT_THROW(ScriptedEngine::deserialize(stream), llmbridge::common::InvalidJSON);
  }

  {
    std::stringstream stream{R"({"function": {}})"};
    EXPECT_THROW(ScriptedEngine::deserialize(stream), llmbridge::common::InvalidJSON);
  }

  {
    std::stringstream stream{R"({"functions": {"Fn": {"chunks": 5}}})"};
    EXPECT_THROW(ScriptedEngine::deserialize(stream), llmbridge::common::InvalidJSON);
  }

  EXPECT_THROW(
      ScriptedEngine::deserialize(std::string{"/nonexistent/script.json"}),
      llmbridge::common::ObjectDoesNotExist
  );
}

TEST(ScriptedEngine, Invoke)
{
  auto engine = load();
  auto collector = engine.create_collector("test");
  EXPECT_EQ(collector->name(), "test");
  EXPECT_FALSE(collector->usage().has_value());

  auto outcome = engine.invoke("ChatAgent", {{"message", R"("hi")"}}, collector.get());
  ASSERT_TRUE(std::holds_alternative<Value>(outcome));
  EXPECT_EQ(std::get<Value>(outcome).type_name, "Reply");
  EXPECT_EQ(std::get<Value>(outcome).json, R"({"content":"Paris"})");
  EXPECT_EQ(engine.invocations(), 1);

  auto usage = collector->usage();
  ASSERT_TRUE(usage.has_value());
  EXPECT_EQ(usage->input_tokens, 12);
  EXPECT_EQ(usage->output_tokens, 30);
  EXPECT_EQ(usage->total_tokens, 42);

  auto log = collector->last_function_log();
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->id, "req_1");
  EXPECT_EQ(log->function_name, "ChatAgent");
  ASSERT_EQ(log->calls.size(), 1);
  EXPECT_EQ(log->calls[0].provider, "openai");
  ASSERT_TRUE(log->calls[0].response.has_value());
  EXPECT_EQ(log->calls[0].response->status_code, 200);
}

TEST(ScriptedEngine, InvokeErrors)
{
  auto engine = load();
  auto collector = engine.create_collector("test");

  auto outcome = engine.invoke("Broken", {}, collector.get());
  ASSERT_TRUE(std::holds_alternative<Error>(outcome));
  EXPECT_EQ(std::get<Error>(outcome).reason, "provider rejected the request");

  outcome = engine.invoke("Unknown", {}, collector.get());
  ASSERT_TRUE(std::holds_alternative<Error>(outcome));
  EXPECT_EQ(std::get<Error>(outcome).reason, "Unknown function Unknown");

  EXPECT_THROW(engine.invoke("Faulty", {}, collector.get()), llmbridge::common::EngineError);
  EXPECT_EQ(engine.invocations(), 3);
}

TEST(ScriptedEngine, InvokeStream)
{
  auto engine = load();
  auto collector = engine.create_collector("test");

  std::vector<std::string> chunks;
  std::stop_source stop;
  auto outcome = engine.invoke_stream(
      "ChatAgent", {}, collector.get(),
      [&](Value&& chunk) {
        EXPECT_EQ(chunk.type_name, "Reply");
        chunks.push_back(chunk.json);
      },
      stop.get_token()
  );

  ASSERT_TRUE(std::holds_alternative<Value>(outcome));
  EXPECT_EQ(std::get<Value>(outcome).json, R"({"content":"Paris"})");

  std::vector<std::string> expected{
      R"({"content":"Pa"})", R"({"content":null})", R"({"content":"ris"})"};
  EXPECT_EQ(chunks, expected);
  ASSERT_TRUE(collector->usage().has_value());
}

TEST(ScriptedEngine, InvokeStreamCancelled)
{
  auto engine = load();
  auto collector = engine.create_collector("test");

  int received = 0;
  std::stop_source stop;
  auto outcome = engine.invoke_stream(
      "ChatAgent", {}, collector.get(),
      [&](Value&&) {
        ++received;
        stop.request_stop();
      },
      stop.get_token()
  );

  EXPECT_EQ(received, 1);
  ASSERT_TRUE(std::holds_alternative<Error>(outcome));
  EXPECT_EQ(std::get<Error>(outcome).reason, "cancelled");
  EXPECT_FALSE(collector->usage().has_value());
}
