#ifndef LLMBRIDGE_COMMON_EXCEPTIONS_HPP
#define LLMBRIDGE_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace llmbridge::common {

  struct LLMBridgeException : std::runtime_error {

    LLMBridgeException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : LLMBridgeException {

    InvalidConfigurationError(const std::string& msg) : LLMBridgeException(msg) {}
  };

  struct InvalidJSON : LLMBridgeException {

    InvalidJSON(const std::string& msg) : LLMBridgeException(msg) {}
  };

  struct ObjectDoesNotExist : LLMBridgeException {

    ObjectDoesNotExist(const std::string& name) : LLMBridgeException(name) {}
  };

  struct InvalidStreamState : LLMBridgeException {

    InvalidStreamState(const std::string& msg) : LLMBridgeException(msg) {}
  };

  // Raised by engines on faults that are not reported as an error outcome,
  // e.g., a transport failure or a malformed schema response.
  struct EngineError : LLMBridgeException {

    EngineError(const std::string& msg) : LLMBridgeException(msg) {}
  };

} // namespace llmbridge::common

#endif
