#include <llmbridge/bridge/client.hpp>

namespace llmbridge::bridge {

  Client::Client(
      std::string name, engine::Engine& engine, const std::vector<std::string>& functions
  )
      : _name(std::move(name)), _engine(engine), _functions(functions.begin(), functions.end())
  {
  }

  bool Client::has_function(const std::string& function_name) const
  {
    return _functions.find(function_name) != _functions.end();
  }

} // namespace llmbridge::bridge
