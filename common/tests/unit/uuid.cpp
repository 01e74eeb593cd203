#include <llmbridge/common/uuid.hpp>

#include <set>

#include <gtest/gtest.h>

using namespace llmbridge::common;

TEST(UUID, StrConversion)
{
  auto str = "47183823-2574-4bfd-b411-99ed177d3e43";
  auto id = uuids::uuid::from_string(str);
  ASSERT_TRUE(id.has_value());

  EXPECT_EQ(str, UUID::str(id.value()));
}

TEST(UUID, GenerateUnique)
{
  UUID generator;

  std::set<std::string> ids;
  for (int i = 0; i < 100; ++i) {
    auto id = generator.generate();
    EXPECT_FALSE(id.is_nil());
    ids.insert(UUID::str(id));
  }
  EXPECT_EQ(ids.size(), 100);
}
