#include "dirls/cli.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace dirls {
namespace {

std::optional<int> parse(std::vector<const char*> args, Config& config) {
    args.insert(args.begin(), "dirls");
    Cli cli;
    return cli.parse(static_cast<int>(args.size()), args.data(), config);
}

class CliTest : public ::testing::Test {
protected:
    void TearDown() override { Logger::instance().set_level(Logger::Level::Error); }
};

TEST_F(CliTest, DefaultsToCurrentDirectoryAndNameFormat) {
    Config config;
    EXPECT_FALSE(parse({}, config).has_value());

    EXPECT_EQ(config.data().paths, (std::vector<std::string>{"."}));
    EXPECT_EQ(config.format(), Format::Name);
    EXPECT_FALSE(config.listing_options().show_hidden);
    EXPECT_FALSE(config.listing_options().recursive);
    EXPECT_EQ(config.data().color_policy, ColorPolicy::Auto);
}

TEST_F(CliTest, ParsesLongFlags) {
    Config config;
    const auto code = parse({"--long", "--all", "--human-readable", "--recursive", "--reverse", "a", "b"}, config);
    EXPECT_FALSE(code.has_value());

    const auto options = config.listing_options();
    EXPECT_EQ(options.render.format, Format::Long);
    EXPECT_TRUE(options.render.human_readable);
    EXPECT_TRUE(options.show_hidden);
    EXPECT_TRUE(options.recursive);
    EXPECT_TRUE(options.sort.reverse);
    EXPECT_FALSE(options.sort.by_time);
    EXPECT_EQ(config.data().paths, (std::vector<std::string>{"a", "b"}));
}

TEST_F(CliTest, CombinedShortFlags) {
    Config config;
    EXPECT_FALSE(parse({"-shtr1", "dir"}, config).has_value());

    const auto options = config.listing_options();
    EXPECT_EQ(options.render.format, Format::WithSize);
    EXPECT_TRUE(options.render.human_readable);
    EXPECT_TRUE(options.sort.by_time);
    EXPECT_TRUE(options.sort.reverse);
    EXPECT_TRUE(config.data().one_column);
}

TEST_F(CliTest, LongWinsOverSize) {
    Config config;
    EXPECT_FALSE(parse({"-s", "-l"}, config).has_value());
    EXPECT_EQ(config.format(), Format::Long);
}

TEST_F(CliTest, ColorAndLogLevel) {
    Config config;
    EXPECT_FALSE(parse({"--color", "never", "--log-level", "debug"}, config).has_value());
    EXPECT_EQ(config.data().color_policy, ColorPolicy::Never);
    EXPECT_EQ(config.data().log_level, Logger::Level::Debug);
    EXPECT_EQ(Logger::instance().level(), Logger::Level::Debug);
}

TEST_F(CliTest, RejectsUnknownColor) {
    Config config;
    const auto code = parse({"--color", "sometimes"}, config);
    ASSERT_TRUE(code.has_value());
    EXPECT_NE(*code, 0);
}

TEST_F(CliTest, RejectsUnknownFlag) {
    Config config;
    const auto code = parse({"--bogus"}, config);
    ASSERT_TRUE(code.has_value());
    EXPECT_NE(*code, 0);
}

TEST_F(CliTest, HelpExitsSuccessfully) {
    Config config;
    const auto code = parse({"--help"}, config);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 0);
}

TEST_F(CliTest, VersionExitsSuccessfully) {
    Config config;
    const auto code = parse({"--version"}, config);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 0);
}

} // namespace
} // namespace dirls
