#include <gtest/gtest.h>
#include "lanbeam/core/cli.hpp"
#include <vector>

using namespace lanbeam::core;

class CommandLineParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "lanbeam");
        storage = args;
        argv.clear();
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
        return parser.parse(static_cast<int>(argv.size()), argv.data());
    }

    CommandLineParser parser{"lanbeam"};
    std::vector<std::string> storage;
    std::vector<char*> argv;
};

TEST_F(CommandLineParserTest, PositionalArguments) {
    ASSERT_TRUE(parse({"send", "10.0.0.2", "a.txt", "b.txt"}));

    const auto& args = parser.get_positional_args();
    ASSERT_EQ(args.size(), 4u);
    EXPECT_EQ(args[0], "send");
    EXPECT_EQ(args[3], "b.txt");
}

TEST_F(CommandLineParserTest, LongAndShortOptions) {
    ASSERT_TRUE(parse({"--config=/etc/lanbeam.conf", "-s", "/tmp/test.sock", "--verbose", "users"}));

    EXPECT_EQ(parser.get_option("config"), "/etc/lanbeam.conf");
    EXPECT_EQ(parser.get_option("socket"), "/tmp/test.sock");
    EXPECT_TRUE(parser.has_option("verbose"));
    ASSERT_EQ(parser.get_positional_args().size(), 1u);
}

TEST_F(CommandLineParserTest, DefaultsApplyWhenOptionMissing) {
    ASSERT_TRUE(parse({"status"}));

    EXPECT_FALSE(parser.has_option("config"));
    EXPECT_EQ(parser.get_option("config"), "~/.lanbeam.conf");
    EXPECT_EQ(parser.get_option("socket"), "/tmp/lanbeam.sock");
}

TEST_F(CommandLineParserTest, DoubleDashEndsOptions) {
    ASSERT_TRUE(parse({"send", "10.0.0.2", "--", "-weird-name.txt"}));

    const auto& args = parser.get_positional_args();
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[2], "-weird-name.txt");
}

TEST_F(CommandLineParserTest, Errors) {
    EXPECT_FALSE(parse({"--bogus"}));
    EXPECT_EQ(parser.get_error(), "Unknown option: --bogus");

    EXPECT_FALSE(parse({"--config"}));
    EXPECT_EQ(parser.get_error(), "Option --config requires a value");

    EXPECT_FALSE(parse({"-x"}));
}
