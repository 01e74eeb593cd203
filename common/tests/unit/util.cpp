#include <llmbridge/common/exceptions.hpp>
#include <llmbridge/common/util.hpp>

#include <sstream>

#include <cereal/archives/json.hpp>
#include <cereal/types/string.hpp>
#include <gtest/gtest.h>

using namespace llmbridge::common;

struct Section {

  int value;
  std::string name;

  void load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(value));
    util::cereal_load_value(archive, "name", name);
  }

  void set_defaults()
  {
    value = 42;
    name = "default";
  }
};

TEST(Util, LoadOptionalSection)
{
  {
    std::stringstream stream{R"({"section": {"value": 7, "name": "set"}})"};
    cereal::JSONInputArchive archive{stream};

    Section section{};
    util::cereal_load_optional(archive, "section", section);
    EXPECT_EQ(section.value, 7);
    EXPECT_EQ(section.name, "set");
  }

  {
    std::stringstream stream{R"({"other": 1})"};
    cereal::JSONInputArchive archive{stream};

    Section section{};
    util::cereal_load_optional(archive, "section", section);
    EXPECT_EQ(section.value, 42);
    EXPECT_EQ(section.name, "default");
  }

  {
    std::stringstream stream{R"({"section": {"name": "no value"}})"};
    cereal::JSONInputArchive archive{stream};

    Section section{};
    EXPECT_THROW(util::cereal_load_optional(archive, "section", section), InvalidConfigurationError);
  }
}

TEST(Util, LoadValue)
{
  std::stringstream stream{R"({"present": 5, "wrong": "text"})"};
  cereal::JSONInputArchive archive{stream};

  int present = 0;
  EXPECT_TRUE(util::cereal_load_value(archive, "present", present));
  EXPECT_EQ(present, 5);

  int missing = 3;
  EXPECT_FALSE(util::cereal_load_value(archive, "missing", missing));
  EXPECT_EQ(missing, 3);

  int wrong = 0;
  EXPECT_THROW(util::cereal_load_value(archive, "wrong", wrong), InvalidConfigurationError);
}

TEST(Util, Clocks)
{
  int64_t begin = util::monotonic_time();
  int64_t end = util::monotonic_time();
  EXPECT_LE(begin, end);

  EXPECT_GT(util::system_time(), 0);
}

TEST(Util, Logger)
{
  auto logger = util::create_logger("Test");
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "Test");
  EXPECT_EQ(logger->level(), spdlog::get_level());
}
