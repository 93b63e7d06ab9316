#include <gtest/gtest.h>
#include "cli/Parser.hpp"
#include "cli/Router.hpp"
#include "cli/commands.hpp"
#include "runtime/Core.hpp"
#include "log/Registry.hpp"
#include "TempTree.hpp"

#include <iostream>
#include <sstream>

using namespace nx::cli;

TEST(ParserTest, CommandFlagsAndPositionals) {
    const auto call = parseArgs({"--config", "/etc/nexus.yaml", "scan", "/home", "--depth", "3"});
    EXPECT_EQ(call.name, "scan");
    ASSERT_EQ(call.positionals.size(), 1u);
    EXPECT_EQ(call.positionals[0], "/home");
    EXPECT_EQ(call.opt("config"), "/etc/nexus.yaml");
    EXPECT_EQ(call.opt("depth"), "3");
}

TEST(ParserTest, EqualsFormIsSplit) {
    std::vector<std::string> raw = {"nexus", "scan", "--depth=4", "/tmp"};
    std::vector<char*> argv;
    for (auto& s : raw) argv.push_back(s.data());

    const auto call = parseArgs(static_cast<int>(argv.size()), argv.data());
    EXPECT_EQ(call.name, "scan");
    EXPECT_EQ(call.opt("depth"), "4");
    ASSERT_EQ(call.positionals.size(), 1u);
    EXPECT_EQ(call.positionals[0], "/tmp");
}

TEST(ParserTest, BooleanFlagsDoNotSwallowWords) {
    const auto call = parseArgs({"--pretty", "list"});
    EXPECT_EQ(call.name, "list");
    EXPECT_TRUE(call.hasOpt("pretty"));
    EXPECT_FALSE(call.opt("pretty").has_value());
}

TEST(ParserTest, DoubleDashEndsFlags) {
    const auto call = parseArgs({"trash", "--", "--weird-name"});
    EXPECT_EQ(call.name, "trash");
    ASSERT_EQ(call.positionals.size(), 1u);
    EXPECT_EQ(call.positionals[0], "--weird-name");
}

TEST(ParserTest, LastFlagWins) {
    const auto call = parseArgs({"scan", "--depth", "1", "--depth", "5", "/x"});
    EXPECT_EQ(call.opt("depth"), "5");
    EXPECT_EQ(call.options.size(), 1u);
}

class RouterTest : public ::testing::Test {
protected:
    TempTree tree{"cli"};
    std::unique_ptr<nx::runtime::Core> core;
    Router router;

    void SetUp() override {
        nx::config::Config cfg;
        cfg.trash.root = tree.root() / "app-trash";
        cfg.trash.include_system_trash = false;
        cfg.scan.worker_threads = 1;
        core = std::make_unique<nx::runtime::Core>(cfg);
        registerCommands(router, *core);
    }

    CommandResult run(const std::vector<std::string>& args) const { return router.execute(parseArgs(args)); }
};

TEST_F(RouterTest, UnknownAndIncompleteCommandsAreUsageErrors) {
    EXPECT_EQ(run({}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"frobnicate"}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"scan"}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"restore"}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"scan", tree.root().string(), "--depth", "-1"}).exit_code, EXIT_USAGE);
    EXPECT_EQ(run({"scan", tree.root().string(), "--depth", "two"}).exit_code, EXIT_USAGE);
    EXPECT_NE(router.usage().find("scan-deep <path>"), std::string::npos);
}

TEST_F(RouterTest, ScanPrintsTree) {
    tree.file("data/one.bin", 100);
    const auto result = run({"scan", (tree.root() / "data").string()});
    ASSERT_EQ(result.exit_code, EXIT_OK);
    ASSERT_TRUE(result.has_data);
    EXPECT_EQ(result.data.at("id"), "data");
    EXPECT_EQ(result.data.at("value"), 100);
}

TEST_F(RouterTest, ScanOfMissingPathFails) {
    const auto result = run({"scan-deep", (tree.root() / "ghost").string()});
    EXPECT_EQ(result.exit_code, EXIT_OP_FAILED);
    EXPECT_EQ(result.data.at("error"), "NotFound");
}

TEST_F(RouterTest, FailedScanLeavesStdoutParseable) {
    testing::internal::CaptureStdout();
    const auto result = run({"scan-deep", (tree.root() / "ghost").string()});
    std::ostringstream err;
    printResult(result, false, std::cout, err);
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    const auto out = testing::internal::GetCapturedStdout();

    ASSERT_EQ(result.exit_code, EXIT_OP_FAILED);
    nlohmann::json parsed;
    ASSERT_NO_THROW(parsed = nlohmann::json::parse(out)) << out;
    EXPECT_EQ(parsed.at("error"), "NotFound");
    EXPECT_FALSE(err.str().empty());
}

TEST_F(RouterTest, TrashListRestoreCycle) {
    const auto file = tree.text("cycle.txt", "c");

    const auto trashed = run({"trash", file.string()});
    ASSERT_EQ(trashed.exit_code, EXIT_OK);
    const auto id = trashed.data.at("entry").at("id").get<std::string>();
    EXPECT_EQ(trashed.data.at("entry").at("source"), "app");

    const auto listed = run({"LIST"});
    ASSERT_EQ(listed.exit_code, EXIT_OK);
    ASSERT_EQ(listed.data.size(), 1u);
    EXPECT_EQ(listed.data[0].at("id"), id);

    EXPECT_EQ(run({"restore", id}).exit_code, EXIT_OK);
    EXPECT_TRUE(fs::exists(file));

    const auto again = run({"restore", id});
    EXPECT_EQ(again.exit_code, EXIT_OP_FAILED);
    EXPECT_EQ(again.data.at("error"), "NotFound");
}

TEST_F(RouterTest, PurgeAndEmpty) {
    const auto a = run({"trash", tree.text("a.txt", "a").string()});
    run({"trash", tree.text("b.txt", "b").string()});

    EXPECT_EQ(run({"purge", a.data.at("entry").at("id").get<std::string>()}).exit_code, EXIT_OK);
    EXPECT_EQ(run({"list"}).data.size(), 1u);

    EXPECT_EQ(run({"empty"}).exit_code, EXIT_OK);
    EXPECT_TRUE(run({"list"}).data.empty());

    EXPECT_EQ(run({"purge", "system:!!"}).data.at("error"), "InvalidId");
}

TEST_F(RouterTest, ConfigDumpsEffectiveSettings) {
    const auto result = run({"config"});
    ASSERT_EQ(result.exit_code, EXIT_OK);
    EXPECT_EQ(result.data.at("trash").at("include_system_trash"), false);
    EXPECT_EQ(result.data.at("scan").at("worker_threads"), 1);
}
