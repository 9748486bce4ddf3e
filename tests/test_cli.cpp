#include <gtest/gtest.h>

#include "rebootto/cli.hpp"
#include "testing.hpp"

#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace rebootto;
using testutil::FakeCommandRunner;
using testutil::FakeTerminal;
using testutil::LogCapture;

const char* kListing =
    "BootCurrent: 0000\n"
    "BootNext: 0002\n"
    "Boot0000* Linux\tHD()\n"
    "Boot0001* Windows Boot Manager\tHD()\n"
    "Boot0002* ubuntu\tHD()\n";

// getopt wants mutable argv.
class Argv {
public:
    Argv(std::initializer_list<const char*> args) {
        for (const char* a : args) storage_.emplace_back(a);
        for (auto& s : storage_) ptrs_.push_back(s.data());
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

CliParse Parse(std::initializer_list<const char*> args) {
    Argv a(args);
    return parse_args(a.argc(), a.argv());
}

TEST(ParseArgsTest, NoArguments) {
    auto p = Parse({"reboot-to"});
    ASSERT_TRUE(p.ok);
    EXPECT_FALSE(p.options.list);
    EXPECT_FALSE(p.options.next.has_value());
    EXPECT_FALSE(p.options.reboot_to.has_value());
}

TEST(ParseArgsTest, LongAndShortOptions) {
    auto p = Parse({"reboot-to", "--next", "ub", "-r", "3", "-l", "--config=/tmp/x.json", "-v"});
    ASSERT_TRUE(p.ok) << p.error;
    EXPECT_TRUE(p.options.list);
    EXPECT_EQ(p.options.next, "ub");
    EXPECT_EQ(p.options.reboot_to, "3");
    EXPECT_EQ(p.options.config_path, "/tmp/x.json");
    EXPECT_TRUE(p.options.verbose);
}

TEST(ParseArgsTest, ParsesRepeatedly) {
    EXPECT_TRUE(Parse({"reboot-to", "-n", "1"}).options.next.has_value());
    EXPECT_TRUE(Parse({"reboot-to", "-n", "2"}).options.next.has_value());
}

TEST(ParseArgsTest, RejectsUnknownOption) {
    auto p = Parse({"reboot-to", "--bogus"});
    EXPECT_FALSE(p.ok);
    EXPECT_FALSE(p.error.empty());
}

TEST(ParseArgsTest, RejectsMissingValue) {
    auto p = Parse({"reboot-to", "--reboot-to"});
    EXPECT_FALSE(p.ok);
}

TEST(ParseArgsTest, RejectsStrayArgument) {
    auto p = Parse({"reboot-to", "ubuntu"});
    EXPECT_FALSE(p.ok);
    EXPECT_NE(p.error.find("ubuntu"), std::string::npos);
}

TEST(VersionTest, ComesFromTheBuild) {
    EXPECT_STREQ(kVersion, REBOOTTO_VERSION);
    EXPECT_GT(std::string(kVersion).size(), 0u);
}

TEST(HelpTest, ExplainsDestMatching) {
    std::ostringstream out;
    print_help(out, "reboot-to");
    EXPECT_NE(out.str().find("case-sensitive"), std::string::npos);
    EXPECT_NE(out.str().find("--reboot-to"), std::string::npos);
}

class RunTest : public ::testing::Test {
protected:
    void SetUp() override { runner.Script("efibootmgr", 0, kListing); }

    int Run(const CliOptions& opts) { return run(opts, boot, terminal, out); }

    FakeCommandRunner runner;
    BootControl boot{runner, Config{}};
    FakeTerminal terminal;
    std::ostringstream out;
    LogCapture log;
};

TEST_F(RunTest, ListPrintsIdsAndNames) {
    CliOptions opts;
    opts.list = true;

    EXPECT_EQ(Run(opts), 0);
    EXPECT_EQ(out.str(), "0 \t Linux\n1 \t Windows Boot Manager\n2 \t ubuntu\n");
    EXPECT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(terminal.entered, 0);
}

TEST_F(RunTest, RebootToUnknownDestFailsWithoutSideEffects) {
    CliOptions opts;
    opts.reboot_to = "zzz";

    EXPECT_EQ(Run(opts), 1);
    EXPECT_EQ(runner.calls.size(), 1u); // only the listing
    EXPECT_TRUE(runner.calls[0].args.empty());
    EXPECT_TRUE(log.Contains("Could not find UEFI boot entry from specifier \"zzz\""));
}

TEST_F(RunTest, NextUnknownIdFails) {
    CliOptions opts;
    opts.next = "7";
    EXPECT_EQ(Run(opts), 1);
    EXPECT_EQ(runner.calls.size(), 1u);
}

TEST_F(RunTest, RebootToByName) {
    CliOptions opts;
    opts.reboot_to = "Win";

    EXPECT_EQ(Run(opts), 0);
    ASSERT_EQ(runner.calls.size(), 3u);
    EXPECT_EQ(runner.calls[1].args, (std::vector<std::string>{"--bootnext", "0001"}));
    EXPECT_EQ(runner.calls[2].name, "shutdown");
}

TEST_F(RunTest, NextById) {
    CliOptions opts;
    opts.next = "2";

    EXPECT_EQ(Run(opts), 0);
    ASSERT_EQ(runner.calls.size(), 2u);
    EXPECT_EQ(runner.calls[1].args, (std::vector<std::string>{"--bootnext", "0002"}));
    EXPECT_EQ(runner.CountCalls("shutdown"), 0u);
}

TEST_F(RunTest, ResolvedDestSucceedsEvenIfCommandFails) {
    runner.Script("efibootmgr", 4);
    CliOptions opts;
    opts.reboot_to = "ubuntu";

    EXPECT_EQ(Run(opts), 0);
    EXPECT_EQ(runner.CountCalls("shutdown"), 0u);
    EXPECT_TRUE(log.Contains("non-zero status: 4"));
}

TEST_F(RunTest, ListTakesPrecedence) {
    CliOptions opts;
    opts.list = true;
    opts.reboot_to = "ubuntu";

    EXPECT_EQ(Run(opts), 0);
    EXPECT_EQ(runner.calls.size(), 1u);
}

TEST_F(RunTest, RebootToTakesPrecedenceOverNext) {
    CliOptions opts;
    opts.reboot_to = "0";
    opts.next = "1";

    EXPECT_EQ(Run(opts), 0);
    ASSERT_GE(runner.calls.size(), 2u);
    EXPECT_EQ(runner.calls[1].args[1], "0000");
    EXPECT_EQ(runner.CountCalls("shutdown"), 1u);
}

TEST_F(RunTest, InteractiveSetNext) {
    terminal.Press(KeyCode::Up);
    terminal.Char('n');

    EXPECT_EQ(Run(CliOptions{}), 0);
    EXPECT_EQ(terminal.left, 1);
    ASSERT_EQ(runner.calls.size(), 2u);
    EXPECT_EQ(runner.calls[1].args, (std::vector<std::string>{"--bootnext", "0002"}));
    ASSERT_FALSE(terminal.frames.empty());
    EXPECT_EQ(terminal.frames[0].rows[0], "cur: Linux");
    EXPECT_EQ(terminal.frames[0].rows[2], "nxt: ubuntu");
}

TEST_F(RunTest, InteractiveQuitRunsNothingAndSucceeds) {
    terminal.Press(KeyCode::Esc);

    EXPECT_EQ(Run(CliOptions{}), 0);
    EXPECT_EQ(runner.calls.size(), 1u);
}

TEST_F(RunTest, InteractiveTerminalFailureIsReported) {
    terminal.fail_draw = true;

    EXPECT_EQ(Run(CliOptions{}), 1);
    EXPECT_EQ(terminal.left, 1);
    EXPECT_TRUE(log.Contains("Error in TUI"));
}

TEST(RunListingTest, ListingLaunchFailureExitsOne) {
    FakeCommandRunner runner;
    runner.FailLaunch("efibootmgr");
    BootControl boot(runner, Config{});
    FakeTerminal terminal;
    std::ostringstream out;
    LogCapture log;

    CliOptions opts;
    opts.list = true;
    EXPECT_EQ(run(opts, boot, terminal, out), 1);
    EXPECT_TRUE(out.str().empty());
}

} // namespace
