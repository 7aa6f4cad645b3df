#include "TestUtils.h"
#include "core/ConfigManager.h"

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = testutil::makeTempDir("config");
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    fs::path testDir;
};

TEST_F(ConfigManagerTest, MissingFileGivesDefaults) {
    Config cfg = Config::loadOrDefault((testDir / "nope.json").u8string());
    EXPECT_EQ(cfg.package.name, "com.gamelovers.mcp-unity");
    EXPECT_EQ(cfg.package.serverDirectory, "Server~");
    EXPECT_EQ(cfg.package.markerFile, "tsconfig");
    EXPECT_EQ(cfg.server.launcherCommand, "node");
    EXPECT_EQ(cfg.server.entry, (std::vector<std::string>{"build", "index.js"}));
    EXPECT_TRUE(cfg.npm.executablePath.empty());
    EXPECT_EQ(cfg.npm.timeoutSeconds, 0);
}

TEST_F(ConfigManagerTest, ReadsOverrides) {
    fs::path path = testDir / "settings.json";
    testutil::writeFile(path, R"({
        "npm_executable_path": "/opt/node/bin/npm",
        "use_tabs_indentation": true,
        "process_timeout_seconds": 120,
        "max_log_entries": 10
    })");

    Config cfg = Config::load(path.u8string());
    EXPECT_EQ(cfg.npm.executablePath, "/opt/node/bin/npm");
    EXPECT_TRUE(cfg.server.useTabsIndentation);
    EXPECT_EQ(cfg.npm.timeoutSeconds, 120);
    EXPECT_EQ(cfg.logging.maxEntries, 10u);
    EXPECT_EQ(cfg.package.name, "com.gamelovers.mcp-unity");
}

TEST_F(ConfigManagerTest, BrokenFileThrows) {
    fs::path path = testDir / "settings.json";
    testutil::writeFile(path, "{ not json");
    EXPECT_THROW(Config::loadOrDefault(path.u8string()), std::runtime_error);

    testutil::writeFile(path, R"({"process_timeout_seconds": "soon"})");
    EXPECT_THROW(Config::load(path.u8string()), std::runtime_error);
}

TEST_F(ConfigManagerTest, SaveThenLoadKeepsValues) {
    Config cfg;
    cfg.npm.executablePath = "C:/Program Files/nodejs/npm.cmd";
    cfg.server.useTabsIndentation = true;

    fs::path path = testDir / "ProjectSettings" / "McpUnitySettings.json";
    cfg.save(path.u8string());

    Config loaded = Config::load(path.u8string());
    EXPECT_EQ(loaded.npm.executablePath, cfg.npm.executablePath);
    EXPECT_TRUE(loaded.server.useTabsIndentation);
}
