#include "steamlink/config.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using steamlink::Config;
using steamlink::test::TempDir;
using steamlink::test::readFile;
using steamlink::test::writeFile;

class ConfigTest : public ::testing::Test {
protected:
    TempDir tmp;
    void SetUp() override { Config::instance().reset(); }
    void TearDown() override { Config::instance().reset(); }
};

TEST_F(ConfigTest, MissingFileWritesDefaults) {
    auto path = tmp / "cfg/config.json";
    Config::instance().load(path);

    ASSERT_TRUE(std::filesystem::exists(path));
    auto j = nlohmann::json::parse(readFile(path));
    EXPECT_EQ(j["general"]["link_temp"], true);
    EXPECT_TRUE(j["general"]["extra_library_roots"].is_array());
    EXPECT_TRUE(Config::instance().getGeneral().linkTemp);
}

TEST_F(ConfigTest, LoadsValuesWrittenBySave) {
    auto path = tmp / "config.json";
    Config::instance().load(path);
    auto& general = Config::instance().getGeneral();
    general.lastSteamapps = "/mnt/hdd/SteamLibrary/steamapps";
    general.lastDestination = "/mnt/ssd";
    general.linkTemp = false;
    general.extraLibraryRoots = {"/srv/steam", "~/Games"};
    Config::instance().save();

    Config::instance().reset();
    Config::instance().load(path);
    const auto& loaded = Config::instance().getGeneral();
    EXPECT_EQ(loaded.lastSteamapps, "/mnt/hdd/SteamLibrary/steamapps");
    EXPECT_EQ(loaded.lastDestination, "/mnt/ssd");
    EXPECT_FALSE(loaded.linkTemp);
    ASSERT_EQ(loaded.extraLibraryRoots.size(), 2u);
    EXPECT_EQ(loaded.extraLibraryRoots[1], "~/Games");
}

TEST_F(ConfigTest, MalformedFileKeepsDefaults) {
    auto path = tmp / "config.json";
    writeFile(path, "{ \"general\": { \"link_temp\": fal");

    Config::instance().load(path);
    EXPECT_TRUE(Config::instance().getGeneral().linkTemp);
    EXPECT_TRUE(Config::instance().getGeneral().lastSteamapps.empty());
}

TEST_F(ConfigTest, IgnoresNonStringRoots) {
    auto path = tmp / "config.json";
    writeFile(path, R"({"general": {"extra_library_roots": ["/a", 3, null, "/b"]}})");

    Config::instance().load(path);
    const auto& roots = Config::instance().getGeneral().extraLibraryRoots;
    ASSERT_EQ(roots.size(), 2u);
    EXPECT_EQ(roots[0], "/a");
    EXPECT_EQ(roots[1], "/b");
}
