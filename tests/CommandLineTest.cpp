#include <gtest/gtest.h>

#include <cli/CommandLine.hpp>
#include <iterator>

using imageless::parseCommandLine;

TEST(CommandLineTest, ShortOptions) {
    const char* argv[] = {"imageless", "-f", "in.png", "-o",
                          "out.jpg",   "-c", "config.json"};
    auto options = parseCommandLine(static_cast<int>(std::size(argv)), argv);
    ASSERT_TRUE(options.ok()) << options.status();
    EXPECT_FALSE(options->help);
    EXPECT_EQ(options->file, "in.png");
    EXPECT_EQ(options->out, "out.jpg");
    EXPECT_EQ(options->config, "config.json");
    EXPECT_FALSE(options->log.verbose);
    EXPECT_FALSE(options->log.logFile.has_value());
}

TEST(CommandLineTest, LongOptions) {
    const char* argv[] = {"imageless", "--file=a.png", "--out",  "b.png",
                          "--config",  "c.json",       "--verbose",
                          "--log-file", "run.log"};
    auto options = parseCommandLine(static_cast<int>(std::size(argv)), argv);
    ASSERT_TRUE(options.ok()) << options.status();
    EXPECT_EQ(options->file, "a.png");
    EXPECT_EQ(options->out, "b.png");
    EXPECT_EQ(options->config, "c.json");
    EXPECT_TRUE(options->log.verbose);
    ASSERT_TRUE(options->log.logFile.has_value());
    EXPECT_EQ(*options->log.logFile, "run.log");
}

TEST(CommandLineTest, HelpSkipsRequiredOptions) {
    const char* argv[] = {"imageless", "--help"};
    auto options = parseCommandLine(static_cast<int>(std::size(argv)), argv);
    ASSERT_TRUE(options.ok()) << options.status();
    EXPECT_TRUE(options->help);
}

TEST(CommandLineTest, MissingRequiredOption) {
    const char* argv[] = {"imageless", "-f", "in.png", "-o", "out.png"};
    auto options = parseCommandLine(static_cast<int>(std::size(argv)), argv);
    ASSERT_FALSE(options.ok());
    EXPECT_EQ(options.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(options.status().message().find("config"), std::string::npos)
        << options.status();
}

TEST(CommandLineTest, UnknownOption) {
    const char* argv[] = {"imageless", "-f", "in.png", "-o", "out.png",
                          "-c",        "c.json", "--quality", "9"};
    auto options = parseCommandLine(static_cast<int>(std::size(argv)), argv);
    ASSERT_FALSE(options.ok());
    EXPECT_EQ(options.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(CommandLineTest, UsageListsOptions) {
    const auto text = imageless::usage();
    EXPECT_NE(text.find("--config"), std::string::npos);
    EXPECT_NE(text.find("--log-file"), std::string::npos);
}
