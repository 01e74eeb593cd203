#include <llmbridge/bridge/union.hpp>

#include <algorithm>

#include <spdlog/spdlog.h>

namespace llmbridge::bridge {

  std::optional<std::string> UnionType::match(const engine::Value& value) const
  {
    auto it = std::find_if(members.begin(), members.end(), [&](const UnionMember& member) {
      return member.instance_of == value.type_name;
    });

    if (it == members.end()) {
      return std::nullopt;
    }
    return it->name;
  }

  engine::Value UnionType::resolve(engine::Value&& value) const
  {
    value.variant = match(value);
    if (!value.variant.has_value()) {
      SPDLOG_DEBUG("No union member declared for type {}", value.type_name);
    }
    return std::move(value);
  }

} // namespace llmbridge::bridge
