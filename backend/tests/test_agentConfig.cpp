#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "agentConfig.hpp"

namespace {

/**
 * Run parseArguments over a mutable copy of the given words
 */
CliAction parse(std::vector<std::string> words, AgentConfig& config) {
    words.insert(words.begin(), "lanagent");
    std::vector<char*> argv;
    for (auto& word : words) {
        argv.push_back(&word[0]);
    }
    argv.push_back(nullptr);
    return parseArguments(static_cast<int>(words.size()), argv.data(), config);
}

} // namespace

TEST(AgentConfigTest, Defaults) {
    AgentConfig config;
    EXPECT_EQ(config.port, 0);
    EXPECT_EQ(config.scan_interval.count(), 60);
    EXPECT_EQ(config.probe_batch_size, 50u);
    EXPECT_EQ(config.max_hosts, 254u);
    EXPECT_EQ(config.service_type, "_lanagent._tcp.local.");
    EXPECT_EQ(config.service_version, "1.0");
}

TEST(AgentConfigTest, NoArgumentsRunsWithDefaults) {
    AgentConfig config;
    EXPECT_EQ(parse({}, config), CliAction::RUN);
    EXPECT_EQ(config.port, 0);
}

TEST(AgentConfigTest, ShortAndLongPort) {
    AgentConfig config;
    EXPECT_EQ(parse({"-p", "8080"}, config), CliAction::RUN);
    EXPECT_EQ(config.port, 8080);

    EXPECT_EQ(parse({"--port", "9090"}, config), CliAction::RUN);
    EXPECT_EQ(config.port, 9090);

    EXPECT_EQ(parse({"--port=7070"}, config), CliAction::RUN);
    EXPECT_EQ(config.port, 7070);
}

TEST(AgentConfigTest, Interval) {
    AgentConfig config;
    EXPECT_EQ(parse({"-i", "15"}, config), CliAction::RUN);
    EXPECT_EQ(config.scan_interval.count(), 15);
}

TEST(AgentConfigTest, VersionAndHelp) {
    AgentConfig config;
    EXPECT_EQ(parse({"-v"}, config), CliAction::SHOW_VERSION);
    EXPECT_EQ(parse({"--version"}, config), CliAction::SHOW_VERSION);
    EXPECT_EQ(parse({"-h"}, config), CliAction::SHOW_HELP);
}

TEST(AgentConfigTest, RejectsBadValues) {
    AgentConfig config;
    EXPECT_THROW(parse({"-p", "70000"}, config), std::invalid_argument);
    EXPECT_THROW(parse({"-p", "-1"}, config), std::invalid_argument);
    EXPECT_THROW(parse({"-p", "http"}, config), std::invalid_argument);
    EXPECT_THROW(parse({"-i", "0"}, config), std::invalid_argument);
    EXPECT_THROW(parse({"-p"}, config), std::invalid_argument);
    EXPECT_EQ(config.port, 0);
}

TEST(AgentConfigTest, RejectsUnknownOptionsAndArguments) {
    AgentConfig config;
    EXPECT_THROW(parse({"--verbose"}, config), std::invalid_argument);
    EXPECT_THROW(parse({"-x"}, config), std::invalid_argument);
    EXPECT_THROW(parse({"extra"}, config), std::invalid_argument);
}

TEST(AgentConfigTest, UsageMentionsOptions) {
    std::string text = usage("lanagent");
    EXPECT_NE(text.find("--port"), std::string::npos);
    EXPECT_NE(text.find("--version"), std::string::npos);
}
