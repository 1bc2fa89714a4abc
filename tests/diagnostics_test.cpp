#include "steamlink/diagnostics.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using steamlink::Diagnostics;
using steamlink::PathState;
using steamlink::test::TempDir;
using steamlink::test::writeFile;

TEST(DiagnosticsTest, ReportsEachTargetWithoutChangingAnything) {
    TempDir tmp;
    auto steamapps = tmp / "lib/steamapps";
    auto targetRoot = tmp / "ssd/lib_symlink";
    std::filesystem::create_directories(targetRoot / "downloading");
    std::filesystem::create_directories(steamapps);
    std::filesystem::create_directory_symlink(targetRoot / "downloading", steamapps / "downloading");
    writeFile(steamapps / "temp/leftover");

    Diagnostics diag;
    EXPECT_FALSE(diag.runChecks({steamapps}, tmp / "ssd", true));

    const auto& results = diag.getResults();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].second.ok);
    EXPECT_EQ(results[0].second.state, PathState::SYMLINK_CORRECT);
    EXPECT_FALSE(results[1].second.ok);
    EXPECT_EQ(results[1].second.state, PathState::NON_EMPTY_DIRECTORY);
    EXPECT_EQ(results[1].second.category, steamapps.string());
    EXPECT_EQ(diag.failureCount(), 1);

    EXPECT_FALSE(std::filesystem::is_symlink(steamapps / "temp"));
    EXPECT_FALSE(std::filesystem::exists(targetRoot / "temp"));
}

TEST(DiagnosticsTest, WithoutDestinationOnlyResolvabilityMatters) {
    TempDir tmp;
    auto steamapps = tmp / "lib/steamapps";
    std::filesystem::create_directories(steamapps);
    std::filesystem::create_directories(tmp / "anywhere");
    std::filesystem::create_directory_symlink(tmp / "anywhere", steamapps / "downloading");
    std::filesystem::create_directory_symlink(tmp / "unplugged", steamapps / "temp");

    Diagnostics diag;
    diag.runChecks({steamapps}, {}, true);

    const auto& results = diag.getResults();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].second.ok);
    EXPECT_FALSE(results[1].second.ok);
    EXPECT_EQ(results[1].second.message, "broken link");
}

TEST(DiagnosticsTest, TempSkippedWhenNotRequested) {
    TempDir tmp;
    std::filesystem::create_directories(tmp / "lib/steamapps");

    Diagnostics diag;
    diag.runChecks({tmp / "lib/steamapps"}, tmp / "ssd", false);
    ASSERT_EQ(diag.getResults().size(), 1u);
    EXPECT_EQ(diag.getResults()[0].second.state, PathState::MISSING);
}
