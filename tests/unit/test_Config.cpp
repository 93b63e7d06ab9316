#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "util/paths.hpp"
#include "TempTree.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using namespace nx::config;

class ConfigTest : public ::testing::Test {
protected:
    TempTree tree{"config"};
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = loadConfig(tree.root() / "absent.yaml");
    EXPECT_EQ(cfg.scan.default_depth, 2);
    EXPECT_EQ(cfg.scan.deep_depth, 6);
    EXPECT_EQ(cfg.scan.small_file_bytes, 5u * 1024 * 1024);
    EXPECT_EQ(cfg.scan.small_folder_bytes, 1u * 1024 * 1024);
    EXPECT_EQ(cfg.scan.max_recursion_depth, 256u);
    EXPECT_EQ(cfg.scan.worker_threads, 0u);
    EXPECT_EQ(cfg.scan.always_fold.size(), 7u);
    EXPECT_TRUE(cfg.trash.include_system_trash);
    EXPECT_TRUE(cfg.trash.root.empty());
}

TEST_F(ConfigTest, YamlOverridesSections) {
    const auto file = tree.text("config.yaml", R"(
scan:
  default_depth: 3
  small_file_mb: 2
  small_folder_mb: 4
  worker_threads: 5
  always_fold: [vendor, target]
trash:
  root: /srv/nexus/trash
  include_system_trash: false
logging:
  log_dir: /var/log/nexus
  log_levels:
    console_log_level: error
    subsystem_levels:
      scan: debug
)");

    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.scan.default_depth, 3);
    EXPECT_EQ(cfg.scan.deep_depth, 6);
    EXPECT_EQ(cfg.scan.small_file_bytes, 2u * 1024 * 1024);
    EXPECT_EQ(cfg.scan.small_folder_bytes, 4u * 1024 * 1024);
    EXPECT_EQ(cfg.scan.worker_threads, 5u);
    EXPECT_EQ(cfg.scan.always_fold, (std::vector<std::string>{"vendor", "target"}));
    EXPECT_EQ(cfg.trash.root, fs::path("/srv/nexus/trash"));
    EXPECT_EQ(cfg.trashRoot(), fs::path("/srv/nexus/trash"));
    EXPECT_FALSE(cfg.trash.include_system_trash);
    EXPECT_EQ(cfg.logDir(), fs::path("/var/log/nexus"));
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::err);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.scan, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.trash, spdlog::level::info);
}

TEST_F(ConfigTest, MalformedYamlThrows) {
    const auto file = tree.text("bad.yaml", "scan: [unclosed\n");
    EXPECT_THROW((void)loadConfig(file), YAML::Exception);
}

TEST_F(ConfigTest, EmptyLocationsFallBackToTestingRoot) {
    const Config cfg;
    ASSERT_TRUE(nx::paths::isTesting());
    EXPECT_EQ(cfg.trashRoot(), nx::paths::getTrashRoot());
    EXPECT_EQ(cfg.systemTrashRoot(), nx::paths::getSystemTrashRoot());
    EXPECT_EQ(cfg.logDir(), nx::paths::getLogPath());
    EXPECT_EQ(nx::paths::getConfigPath().filename(), "config.yaml");
}

TEST_F(ConfigTest, JsonDumpCarriesEverySection) {
    Config cfg;
    cfg.scan.default_depth = 4;
    cfg.trash.system_trash_dir = "/elsewhere/Trash";

    const nlohmann::json j = cfg;
    EXPECT_EQ(j.at("scan").at("default_depth"), 4);
    EXPECT_EQ(j.at("trash").at("system_trash_dir"), "/elsewhere/Trash");
    EXPECT_EQ(j.at("logging").at("log_levels").at("subsystem_levels").at("trash"), "info");

    const auto back = j.get<Config>();
    EXPECT_EQ(back.scan.default_depth, 4);
    EXPECT_EQ(back.trash.system_trash_dir, fs::path("/elsewhere/Trash"));
    EXPECT_EQ(back.logging.levels.file_log_level, spdlog::level::info);
}

TEST_F(ConfigTest, RegistryIsInitializedByHarness) {
    EXPECT_TRUE(ConfigRegistry::isInitialized());
    EXPECT_EQ(ConfigRegistry::get().scan.default_depth, 2);
}
