#include <llmbridge/engine/scripted.hpp>

#include <llmbridge/common/exceptions.hpp>

#include <chrono>
#include <fstream>
#include <thread>

#include <cereal/external/rapidjson/document.h>
#include <cereal/external/rapidjson/istreamwrapper.h>
#include <cereal/external/rapidjson/stringbuffer.h>
#include <cereal/external/rapidjson/writer.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace llmbridge::engine {

  namespace rj = CEREAL_RAPIDJSON_NAMESPACE;

  namespace {

    std::string to_json(const rj::Value& value)
    {
      rj::StringBuffer buffer;
      rj::Writer<rj::StringBuffer> writer{buffer};
      value.Accept(writer);
      return std::string{buffer.GetString(), buffer.GetSize()};
    }

    std::optional<std::string> get_string(const rj::Value& obj, const char* key)
    {
      auto it = obj.FindMember(key);
      if (it == obj.MemberEnd() || !it->value.IsString()) {
        return std::nullopt;
      }
      return std::string{it->value.GetString(), it->value.GetStringLength()};
    }

    std::optional<int64_t> get_int(const rj::Value& obj, const char* key)
    {
      auto it = obj.FindMember(key);
      if (it == obj.MemberEnd() || !it->value.IsInt64()) {
        return std::nullopt;
      }
      return it->value.GetInt64();
    }

    std::optional<std::map<std::string, std::string>>
    get_string_map(const rj::Value& obj, const char* key)
    {
      auto it = obj.FindMember(key);
      if (it == obj.MemberEnd() || !it->value.IsObject()) {
        return std::nullopt;
      }

      std::map<std::string, std::string> result;
      for (const auto& member : it->value.GetObject()) {
        if (member.value.IsString()) {
          result.emplace(member.name.GetString(), member.value.GetString());
        } else {
          result.emplace(member.name.GetString(), to_json(member.value));
        }
      }
      return result;
    }

    LLMCall parse_call(const std::string& fname, const rj::Value& obj)
    {
      if (!obj.IsObject()) {
        throw common::InvalidJSON{fmt::format("Could not parse LLM call in the log of {}", fname)};
      }

      LLMCall call;
      call.provider = get_string(obj, "provider");
      call.client_name = get_string(obj, "client_name");

      auto selected = obj.FindMember("selected");
      call.selected = selected != obj.MemberEnd() && selected->value.IsBool() &&
                      selected->value.GetBool();

      auto req = obj.FindMember("request");
      if (req != obj.MemberEnd() && req->value.IsObject()) {
        HttpRequest request;
        request.url = get_string(req->value, "url");
        request.method = get_string(req->value, "method");
        request.headers = get_string_map(req->value, "headers");
        request.body = get_string(req->value, "body");
        call.request = std::move(request);
      }

      auto resp = obj.FindMember("response");
      if (resp != obj.MemberEnd() && resp->value.IsObject()) {
        HttpResponse response;
        auto code = get_int(resp->value, "status_code");
        if (code.has_value()) {
          response.status_code = static_cast<int>(code.value());
        }
        response.headers = get_string_map(resp->value, "headers");
        response.body = get_string(resp->value, "body");
        call.response = std::move(response);
      }

      return call;
    }

    FunctionLog parse_log(const std::string& fname, const rj::Value& obj)
    {
      if (!obj.IsObject()) {
        throw common::InvalidJSON{fmt::format("Could not parse log configuration for {}", fname)};
      }

      FunctionLog log;
      log.id = get_string(obj, "id");
      log.function_name = get_string(obj, "function_name");
      if (!log.function_name.has_value()) {
        log.function_name = fname;
      }
      log.log_type = get_string(obj, "log_type");
      log.raw_llm_response = get_string(obj, "raw_llm_response");
      log.tags = get_string_map(obj, "tags").value_or(std::map<std::string, std::string>{});

      auto timing = obj.FindMember("timing");
      if (timing != obj.MemberEnd() && timing->value.IsObject()) {
        log.timing = Timing{
            get_int(timing->value, "start_time_ms").value_or(0),
            get_int(timing->value, "duration_ms")};
      }

      auto calls = obj.FindMember("calls");
      if (calls != obj.MemberEnd()) {
        if (!calls->value.IsArray()) {
          throw common::InvalidJSON{fmt::format("Calls of {} must be an array", fname)};
        }
        for (const auto& call : calls->value.GetArray()) {
          log.calls.push_back(parse_call(fname, call));
        }
      }

      return log;
    }

    ScriptedFunction parse_function(const std::string& fname, const rj::Value& obj)
    {
      if (!obj.IsObject()) {
        throw common::InvalidJSON{fmt::format("Could not parse configuration for {}", fname)};
      }

      ScriptedFunction function;
      function.type_name = get_string(obj, "type").value_or("");
      function.error = get_string(obj, "error");
      function.fault = get_string(obj, "fault");
      function.chunk_delay_ms = static_cast<int>(get_int(obj, "chunk-delay-ms").value_or(0));
      function.silent_ms = static_cast<int>(get_int(obj, "silent-ms").value_or(0));

      auto result = obj.FindMember("result");
      if (result != obj.MemberEnd()) {
        function.result = to_json(result->value);
      }

      auto chunks = obj.FindMember("chunks");
      if (chunks != obj.MemberEnd()) {
        if (!chunks->value.IsArray()) {
          throw common::InvalidJSON{fmt::format("Chunks of {} must be an array", fname)};
        }
        for (const auto& chunk : chunks->value.GetArray()) {
          function.chunks.push_back(to_json(chunk));
        }
      }

      auto usage = obj.FindMember("usage");
      if (usage != obj.MemberEnd() && usage->value.IsObject()) {
        function.input_tokens = get_int(usage->value, "input_tokens");
        function.output_tokens = get_int(usage->value, "output_tokens");
      }

      auto log = obj.FindMember("log");
      if (log != obj.MemberEnd()) {
        function.log = parse_log(fname, log->value);
      }

      return function;
    }

    // Sleeps in short slices to notice a stop request.
    bool interruptible_sleep(int milliseconds, const std::stop_token& stop)
    {
      constexpr int SLICE_MS = 5;
      auto end = std::chrono::steady_clock::now() + std::chrono::milliseconds{milliseconds};
      while (std::chrono::steady_clock::now() < end) {
        if (stop.stop_requested()) {
          return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{SLICE_MS});
      }
      return !stop.stop_requested();
    }

  } // namespace

  std::optional<Usage> ScriptedCollector::usage() const
  {
    if (!_recorded || (!_input_tokens.has_value() && !_output_tokens.has_value())) {
      return std::nullopt;
    }
    return Usage::from_tokens(_input_tokens, _output_tokens);
  }

  std::optional<FunctionLog> ScriptedCollector::last_function_log() const
  {
    return _log;
  }

  void ScriptedCollector::record(const ScriptedFunction& function)
  {
    _recorded = true;
    _input_tokens = function.input_tokens;
    _output_tokens = function.output_tokens;
    _log = function.log;
  }

  ScriptedEngine ScriptedEngine::deserialize(std::istream& in_stream)
  {
    rj::Document doc;
    rj::IStreamWrapper wrapper{in_stream};
    doc.ParseStream(wrapper);

    if (doc.HasParseError() || !doc.IsObject()) {
      throw common::InvalidJSON{"Could not parse engine script"};
    }

    auto it = doc.FindMember("functions");
    if (it == doc.MemberEnd() || !it->value.IsObject()) {
      throw common::InvalidJSON{"Engine script does not define functions"};
    }

    ScriptedEngine engine;
    for (const auto& function_cfg : it->value.GetObject()) {
      std::string fname = function_cfg.name.GetString();
      engine.add_function(fname, parse_function(fname, function_cfg.value));
    }

    return engine;
  }

  ScriptedEngine ScriptedEngine::deserialize(const std::string& path)
  {
    std::ifstream in_stream{path};
    if (!in_stream.is_open()) {
      throw common::ObjectDoesNotExist{fmt::format("Could not open engine script {}", path)};
    }
    return deserialize(in_stream);
  }

  void ScriptedEngine::add_function(const std::string& name, ScriptedFunction function)
  {
    std::lock_guard<std::mutex> lock{_lock};
    _functions.insert_or_assign(name, std::move(function));
  }

  bool ScriptedEngine::has_function(const std::string& name) const
  {
    std::lock_guard<std::mutex> lock{_lock};
    return _functions.find(name) != _functions.end();
  }

  std::vector<std::string> ScriptedEngine::functions() const
  {
    std::lock_guard<std::mutex> lock{_lock};
    std::vector<std::string> names;
    for (const auto& [name, _] : _functions) {
      names.push_back(name);
    }
    return names;
  }

  std::optional<ScriptedFunction> ScriptedEngine::_get(const std::string& name) const
  {
    std::lock_guard<std::mutex> lock{_lock};
    auto it = _functions.find(name);
    if (it == _functions.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::shared_ptr<Collector> ScriptedEngine::create_collector(const std::string& name)
  {
    return std::make_shared<ScriptedCollector>(name);
  }

  Outcome ScriptedEngine::_finish(const ScriptedFunction& function, Collector* collector)
  {
    auto* scripted = dynamic_cast<ScriptedCollector*>(collector);
    if (scripted) {
      scripted->record(function);
    }

    if (function.error.has_value()) {
      return Error{function.error.value()};
    }
    return Value{function.type_name, function.result};
  }

  Outcome
  ScriptedEngine::invoke(const std::string& function_name, const Arguments& args, Collector* collector)
  {
    ++_invocations;

    auto function = _get(function_name);
    if (!function.has_value()) {
      return Error{fmt::format("Unknown function {}", function_name)};
    }
    SPDLOG_DEBUG("Scripted invocation of {} with {} arguments", function_name, args.size());

    if (function->fault.has_value()) {
      throw common::EngineError{function->fault.value()};
    }

    if (function->silent_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds{function->silent_ms});
    }

    return _finish(function.value(), collector);
  }

  Outcome ScriptedEngine::invoke_stream(
      const std::string& function_name, const Arguments& args, Collector* collector,
      const chunk_callback_t& on_chunk, std::stop_token stop
  )
  {
    ++_invocations;

    auto function = _get(function_name);
    if (!function.has_value()) {
      return Error{fmt::format("Unknown function {}", function_name)};
    }
    SPDLOG_DEBUG("Scripted stream of {} with {} arguments", function_name, args.size());

    if (function->fault.has_value()) {
      throw common::EngineError{function->fault.value()};
    }

    if (function->silent_ms > 0 && !interruptible_sleep(function->silent_ms, stop)) {
      return Error{"cancelled"};
    }

    for (const auto& chunk : function->chunks) {

      if (function->chunk_delay_ms > 0 && !interruptible_sleep(function->chunk_delay_ms, stop)) {
        return Error{"cancelled"};
      }
      if (stop.stop_requested()) {
        return Error{"cancelled"};
      }

      on_chunk(Value{function->type_name, chunk});
    }

    return _finish(function.value(), collector);
  }

} // namespace llmbridge::engine
