#ifndef LLMBRIDGE_COMMON_UUID_HPP
#define LLMBRIDGE_COMMON_UUID_HPP

#include <random>
#include <string>

#include <uuid.h>

namespace llmbridge::common {

  // Not thread-safe: keep one generator per thread.
  class UUID {
  public:
    UUID() : _generator{_rd()}, _uuid_generator{_generator} {}

    uuids::uuid generate()
    {
      return _uuid_generator();
    }

    static std::string str(const uuids::uuid& id)
    {
      return uuids::to_string(id);
    }

  private:
    std::random_device _rd;
    std::mt19937 _generator;
    uuids::uuid_random_generator _uuid_generator;
  };

} // namespace llmbridge::common

#endif
