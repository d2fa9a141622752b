#include "../test_config.h"

#include "sandfs/core/config.hpp"
#include "sandfs/core/logger.hpp"

namespace sandfs::Test {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        Logger::instance().set_level(LogLevel::NONE);
    }

    Config config;
};

TEST_F(ConfigTest, DottedLookup)
{
    ASSERT_TRUE(config.load_string(R"({
        "log_level": "debug",
        "filesystem": { "root": "/srv/sandbox", "max_tree_depth": 12 }
    })"));

    EXPECT_TRUE(config.has("filesystem.root"));
    EXPECT_FALSE(config.has("filesystem.missing"));
    EXPECT_FALSE(config.has("log_level.nested"));

    EXPECT_EQ(config.get_string("log_level", "info"), "debug");
    EXPECT_EQ(config.get_string("filesystem.root", "."), "/srv/sandbox");
    EXPECT_EQ(config.get_int("filesystem.max_tree_depth", 64), 12);
    EXPECT_EQ(config.get_int("filesystem.max_read_size", 50000), 50000);
}

TEST_F(ConfigTest, LenientConversions)
{
    ASSERT_TRUE(config.load_string(R"({
        "n": "42", "junk": "abc", "flag": "Yes", "off": 0, "f": 2.9, "b": true
    })"));

    EXPECT_EQ(config.get_int("n", 0), 42);
    EXPECT_EQ(config.get_int("junk", 7), 7);
    EXPECT_EQ(config.get_int("f", 0), 2);
    EXPECT_TRUE(config.get_bool("flag", false));
    EXPECT_FALSE(config.get_bool("off", true));
    EXPECT_TRUE(config.get_bool("junk", true));
    EXPECT_EQ(config.get_string("b", ""), "true");
    EXPECT_EQ(config.get_string("f", ""), "2.9");
}

TEST_F(ConfigTest, OutOfRangeNumbersFallBackToDefault)
{
    ASSERT_TRUE(config.load_string(R"({
        "huge": 1e300, "tiny": -1e300, "wide": 18446744073709551615,
        "edge": 9223372036854775807, "text": "99999999999999999999999"
    })"));

    EXPECT_EQ(config.get_int("huge", 64), 64);
    EXPECT_EQ(config.get_int("tiny", 64), 64);
    EXPECT_EQ(config.get_int("wide", 64), 64);
    EXPECT_EQ(config.get_int("text", 64), 64);
    EXPECT_EQ(config.get_int("edge", 0), INT64_MAX);
}

TEST_F(ConfigTest, RejectedInputKeepsPreviousData)
{
    ASSERT_TRUE(config.load_string(R"({"log_level": "warn"})"));

    EXPECT_FALSE(config.load_string("{ not json"));
    EXPECT_FALSE(config.load_string("[1, 2, 3]"));
    EXPECT_EQ(config.get_string("log_level", ""), "warn");
}

TEST_F(ConfigTest, SettersCreateIntermediateObjects)
{
    config.set_string("filesystem.root", "/tmp/x");
    config.set_int("filesystem.max_tree_depth", 3);
    config.set_bool("verbose", true);

    EXPECT_EQ(config.get_string("filesystem.root", ""), "/tmp/x");
    EXPECT_EQ(config.get_int("filesystem.max_tree_depth", 0), 3);
    EXPECT_TRUE(config.get_bool("verbose", false));
    EXPECT_TRUE(config.raw()["filesystem"].is_object());

    // Overwriting a scalar with a nested key replaces it
    config.set_string("verbose.level", "high");
    EXPECT_EQ(config.get_string("verbose.level", ""), "high");
}

TEST_F(ConfigTest, LoadFile)
{
    TempDir dir;
    write_raw(dir / "config.json", R"({"filesystem": {"root": "data"}})");

    ASSERT_TRUE(config.load_file(dir / "config.json"));
    EXPECT_EQ(config.source(), dir / "config.json");
    EXPECT_EQ(config.get_string("filesystem.root", ""), "data");

    EXPECT_FALSE(config.load_file(dir / "absent.json"));
    EXPECT_EQ(config.source(), dir / "config.json");
}

} // namespace sandfs::Test
