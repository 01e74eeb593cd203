#ifndef LLMBRIDGE_BRIDGE_CLIENT_HPP
#define LLMBRIDGE_BRIDGE_CLIENT_HPP

#include <llmbridge/engine/engine.hpp>

#include <set>
#include <string>
#include <vector>

namespace llmbridge::bridge {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Logical client: an engine together with the functions it exports.
  ///
  /// The engine must outlive the client.
  ////////////////////////////////////////////////////////////////////////////////
  class Client {
  public:
    Client(std::string name, engine::Engine& engine, const std::vector<std::string>& functions);

    bool has_function(const std::string& function_name) const;

    const std::string& name() const
    {
      return _name;
    }

    engine::Engine& engine() const
    {
      return _engine;
    }

    const std::set<std::string>& functions() const
    {
      return _functions;
    }

  private:
    std::string _name;

    engine::Engine& _engine;

    std::set<std::string> _functions;
  };

} // namespace llmbridge::bridge

#endif
