#include "steamlink/path_manager.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using steamlink::PathManager;
using steamlink::test::ScopedEnv;
using steamlink::test::TempDir;

TEST(PathManagerTest, ExpandsHome) {
    ScopedEnv home("HOME", "/home/gamer");
    EXPECT_EQ(PathManager::expand("~"), std::filesystem::path("/home/gamer"));
    EXPECT_EQ(PathManager::expand("~/.steam/steam"), std::filesystem::path("/home/gamer/.steam/steam"));
    // Only a leading tilde counts
    EXPECT_EQ(PathManager::expand("/data/~/x"), std::filesystem::path("/data/~/x"));
    EXPECT_EQ(PathManager::expand("~other/x"), std::filesystem::path("~other/x"));
}

TEST(PathManagerTest, ExpandsVariables) {
    ScopedEnv drive("STEAMLINK_TEST_DRIVE", "/mnt/fast");
    EXPECT_EQ(PathManager::expand("$STEAMLINK_TEST_DRIVE/lib"), std::filesystem::path("/mnt/fast/lib"));
    EXPECT_EQ(PathManager::expand("${STEAMLINK_TEST_DRIVE}Lib"), std::filesystem::path("/mnt/fastLib"));
}

TEST(PathManagerTest, UnknownVariablesStayLiteral) {
    ::unsetenv("STEAMLINK_TEST_UNSET");
    EXPECT_EQ(PathManager::expand("/x/$STEAMLINK_TEST_UNSET/y"), std::filesystem::path("/x/$STEAMLINK_TEST_UNSET/y"));
    EXPECT_EQ(PathManager::expand("/x/${STEAMLINK_TEST_UNSET}"), std::filesystem::path("/x/${STEAMLINK_TEST_UNSET}"));
    EXPECT_EQ(PathManager::expand("/cost$"), std::filesystem::path("/cost$"));
    EXPECT_EQ(PathManager::expand("/a/${unterminated"), std::filesystem::path("/a/${unterminated"));
}

TEST(PathManagerTest, InitWithOverrideCreatesLogDirectory) {
    TempDir tmp;
    auto& pm = PathManager::instance();
    pm.init((tmp / "data").string());

    EXPECT_EQ(pm.root(), tmp / "data");
    EXPECT_TRUE(std::filesystem::is_directory(pm.logs()));
    EXPECT_EQ(pm.configFile(), tmp / "data/config.json");
    EXPECT_EQ(pm.currentLog().parent_path(), pm.logs());
    EXPECT_EQ(pm.currentLog().extension(), ".log");
}

TEST(PathManagerTest, RootFromEnvironment) {
    TempDir tmp;
    ScopedEnv root("STEAMLINK_PATH", (tmp / "envroot").string());
    auto& pm = PathManager::instance();
    pm.init();
    EXPECT_EQ(pm.root(), tmp / "envroot");
}
