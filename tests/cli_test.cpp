// Tests for command line parsing.

#include "accrete/cli.hpp"

#include <gtest/gtest.h>

using namespace accrete;

namespace {

Result<Invocation> parse(std::vector<std::string_view> args) {
    return parse_args(args);
}

} // namespace

TEST(CliTest, AddJobMinimal) {
    auto inv = parse({"add-job", "-i", "a.c", "-c", "gcc -c a.c -o a.o", "-o", "a.o"});
    ASSERT_TRUE(inv) << inv.error().message;
    const auto *opts = std::get_if<AddJobOptions>(&inv->action);
    ASSERT_NE(opts, nullptr);
    EXPECT_EQ(opts->inputs, std::vector<std::string>{"a.c"});
    EXPECT_EQ(opts->outputs, std::vector<std::string>{"a.o"});
    EXPECT_EQ(opts->command, "gcc -c a.c -o a.o");
    EXPECT_FALSE(opts->description);
    EXPECT_FALSE(opts->ci_stage);
    EXPECT_EQ(inv->config.verbosity, Verbosity::Quiet);
}

TEST(CliTest, AddJobAllOptions) {
    auto inv = parse({"--cache", "/x/c.json", "add-job",  "--inputs",    "a",       "b",     "--outputs",
                      "c",       "d",         "--command", "make",       "-p",      "pipe",  "-s",
                      "test",    "--timeout", "15",        "--timeout-ok", "--ok-returns", "0", "-1",
                      "2",       "--description", "Making things", "-w"});
    ASSERT_TRUE(inv) << inv.error().message;
    EXPECT_EQ(inv->config.cache_path.string(), "/x/c.json");
    EXPECT_EQ(inv->config.verbosity, Verbosity::VeryVerbose);

    const auto &opts = std::get<AddJobOptions>(inv->action);
    EXPECT_EQ(opts.inputs, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(opts.outputs, (std::vector<std::string>{"c", "d"}));
    EXPECT_EQ(opts.pipeline_name, "pipe");
    EXPECT_EQ(opts.ci_stage, CiStage::Test);
    EXPECT_EQ(opts.timeout, 15);
    EXPECT_TRUE(opts.timeout_ok);
    EXPECT_EQ(opts.ok_returns, (std::vector<int>{0, -1, 2}));
    EXPECT_EQ(opts.description, "Making things");
}

TEST(CliTest, ToRecordCarriesEverything) {
    AddJobOptions opts;
    opts.inputs = {"i"};
    opts.outputs = {"o"};
    opts.command = "c";
    opts.ci_stage = CiStage::Build;
    JobRecord record = to_record(opts);
    EXPECT_EQ(record.inputs, std::vector<std::string>{"i"});
    EXPECT_EQ(record.outputs, std::vector<std::string>{"o"});
    EXPECT_EQ(record.command, "c");
    EXPECT_EQ(record.ci_stage, CiStage::Build);
    EXPECT_FALSE(record.description);
}

TEST(CliTest, RunBuild) {
    auto inv = parse({"-f", "out.ninja", "run-build"});
    ASSERT_TRUE(inv);
    EXPECT_TRUE(std::holds_alternative<RunBuild>(inv->action));
    EXPECT_EQ(inv->config.build_file.string(), "out.ninja");
}

TEST(CliTest, HelpAndVersion) {
    auto help = parse({"--help"});
    ASSERT_TRUE(help);
    EXPECT_TRUE(std::holds_alternative<ShowHelp>(help->action));
    auto version = parse({"--version"});
    ASSERT_TRUE(version);
    EXPECT_TRUE(std::holds_alternative<ShowVersion>(version->action));
}

TEST(CliTest, UsageErrors) {
    for (const auto &args : std::vector<std::vector<std::string_view>>{
             {},
             {"frobnicate"},
             {"add-job", "-c", "x", "-o", "y"},
             {"add-job", "-i", "x", "-o", "y"},
             {"add-job", "-i", "x", "-c", "y"},
             {"add-job", "-i", "-c", "y", "-o", "z"},
             {"add-job", "-i", "x", "-c", "y", "-o", "z", "-s", "deploy"},
             {"add-job", "-i", "x", "-c", "y", "-o", "z", "--timeout", "soon"},
             {"add-job", "-i", "x", "-c", "y", "-o", "z", "--timeout", "-3"},
             {"add-job", "-i", "x", "-c"},
             {"run-build", "extra"},
             {"--cache"},
         }) {
        auto inv = parse(args);
        ASSERT_FALSE(inv);
        EXPECT_EQ(inv.error().kind, ErrorKind::Usage);
    }
}
