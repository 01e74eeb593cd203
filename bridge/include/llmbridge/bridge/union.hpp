#ifndef LLMBRIDGE_BRIDGE_UNION_HPP
#define LLMBRIDGE_BRIDGE_UNION_HPP

#include <llmbridge/engine/value.hpp>

#include <optional>
#include <string>
#include <vector>

namespace llmbridge::bridge {

  struct UnionMember {
    std::string name;

    // Schema type produced by the engine for this member.
    std::string instance_of;
  };

  // Return type of a function that may produce one of several schema types.
  struct UnionType {

    std::vector<UnionMember> members;

    // First member declared with the value's type, if any.
    std::optional<std::string> match(const engine::Value& value) const;

    // Tags the value with the matching member. Values without a match stay untagged.
    engine::Value resolve(engine::Value&& value) const;
  };

} // namespace llmbridge::bridge

#endif
