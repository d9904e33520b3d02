#include <gtest/gtest.h>
#include "curio/cli/cli.hpp"
#include <sstream>

using namespace curio::cli;

namespace {

Command visualize_command() {
    return {
        "visualize",
        "Export the visualization payload",
        {
            {"config", "c", "Config file"},
            {"limit", "l", "Relationships read", OptionKind::Count},
            {"threshold", "t", "Similarity threshold", OptionKind::Number},
            {"depth", "d", "Hops", OptionKind::Count, "2"},
            {"no-topics", "", "Omit topics", OptionKind::Switch},
            {"node", "n", "Start node", OptionKind::Text, "", true}
        },
        [](const Options&) { return 0; }
    };
}

// Runs argv through a CommandLine holding one recording command
int run_with(CommandLine& cli, std::vector<std::string> words) {
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(w.data());
    return cli.run(static_cast<int>(argv.size()), argv.data());
}

} // anonymous namespace

// ==========================================
// Parsing Tests
// ==========================================

TEST(CommandLineParseTest, TypedValuesAndDefaults) {
    CommandLine cli("curio", "test");
    Command cmd = visualize_command();

    Options options = cli.parse(cmd, {"--node", "concept_graphs", "-l", "40", "--threshold=0.5", "--no-topics"});

    EXPECT_EQ(options.require("node"), "concept_graphs");
    EXPECT_EQ(options.count("limit", 0), 40u);
    EXPECT_DOUBLE_EQ(options.number("threshold", 0.0), 0.5);
    EXPECT_TRUE(options.enabled("no-topics"));
    EXPECT_EQ(options.count("depth", 0), 2u);
    EXPECT_FALSE(options.has("config"));
    EXPECT_EQ(options.text("config", "fallback"), "fallback");
}

TEST(CommandLineParseTest, StrayWordIsRejected) {
    CommandLine cli("curio", "test");
    Command cmd = visualize_command();

    EXPECT_THROW(cli.parse(cmd, {"--node", "n1", "foo"}), UsageError);
    EXPECT_THROW(cli.parse(cmd, {"foo", "--node", "n1"}), UsageError);
}

TEST(CommandLineParseTest, UnknownOptionIsRejected) {
    CommandLine cli("curio", "test");
    Command cmd = visualize_command();

    EXPECT_THROW(cli.parse(cmd, {"--node", "n1", "--colour", "red"}), UsageError);
    EXPECT_THROW(cli.parse(cmd, {"--node", "n1", "-z"}), UsageError);
}

TEST(CommandLineParseTest, MalformedValuesAreRejected) {
    CommandLine cli("curio", "test");
    Command cmd = visualize_command();

    EXPECT_THROW(cli.parse(cmd, {"--node", "n1", "--limit", "-3"}), UsageError);
    EXPECT_THROW(cli.parse(cmd, {"--node", "n1", "--limit", "ten"}), UsageError);
    EXPECT_THROW(cli.parse(cmd, {"--node", "n1", "--limit", "99999999999999999999999"}), UsageError);
    EXPECT_THROW(cli.parse(cmd, {"--node", "n1", "--threshold", "0.5x"}), UsageError);
    EXPECT_THROW(cli.parse(cmd, {"--node", "n1", "--no-topics=yes"}), UsageError);
    EXPECT_THROW(cli.parse(cmd, {"--node"}), UsageError);
}

TEST(CommandLineParseTest, MissingRequiredOption) {
    CommandLine cli("curio", "test");
    Command cmd = visualize_command();

    EXPECT_THROW(cli.parse(cmd, {"--limit", "5"}), UsageError);
    Options options = cli.parse(cmd, {"-n", "n1"});
    EXPECT_THROW(options.require("config"), UsageError);
}

TEST(CommandLineParseTest, ValueMayStartWithDash) {
    CommandLine cli("curio", "test");
    Command cmd{"similarity", "Cosine similarity", {{"a", "a", "First vector", OptionKind::Text, "", true}}, nullptr};

    Options options = cli.parse(cmd, {"-a", "-1,0"});
    EXPECT_EQ(options.text("a"), "-1,0");
}

// ==========================================
// Dispatch Tests
// ==========================================

TEST(CommandLineRunTest, DispatchesToHandler) {
    CommandLine cli("curio", "test");
    size_t seen_limit = 0;
    Command cmd = visualize_command();
    cmd.handler = [&](const Options& options) {
        seen_limit = options.count("limit", 0);
        return 7;
    };
    cli.add(cmd);

    EXPECT_EQ(run_with(cli, {"curio", "visualize", "--node", "n1", "--limit", "12"}), 7);
    EXPECT_EQ(seen_limit, 12u);
}

TEST(CommandLineRunTest, UsageErrorsDoNotReachHandler) {
    CommandLine cli("curio", "test");
    bool called = false;
    Command cmd = visualize_command();
    cmd.handler = [&](const Options&) {
        called = true;
        return 0;
    };
    cli.add(cmd);

    EXPECT_EQ(run_with(cli, {"curio", "visualize", "--node", "n1", "extra"}), 2);
    EXPECT_EQ(run_with(cli, {"curio", "unknown"}), 1);
    EXPECT_EQ(run_with(cli, {"curio"}), 1);
    EXPECT_FALSE(called);
}

TEST(CommandLineRunTest, HandlerExceptionBecomesExitCode) {
    CommandLine cli("curio", "test");
    Command cmd = visualize_command();
    cmd.handler = [](const Options&) -> int { throw std::runtime_error("graph file unreadable"); };
    cli.add(cmd);

    EXPECT_EQ(run_with(cli, {"curio", "visualize", "--node", "n1"}), 1);
}

TEST(CommandLineRunTest, HelpListsCommandsAndOptions) {
    CommandLine cli("curio", "test");
    cli.add(visualize_command());
    ASSERT_NE(cli.find("visualize"), nullptr);
    EXPECT_EQ(cli.find("build"), nullptr);

    std::ostringstream help;
    cli.print_help(help);
    EXPECT_NE(help.str().find("visualize"), std::string::npos);

    std::ostringstream usage;
    cli.find("visualize")->print_usage(usage, "curio");
    EXPECT_NE(usage.str().find("--node <value>"), std::string::npos);
    EXPECT_NE(usage.str().find("--limit, -l <n>"), std::string::npos);
    EXPECT_NE(usage.str().find("(default: 2)"), std::string::npos);
    EXPECT_NE(usage.str().find("[required]"), std::string::npos);
}
