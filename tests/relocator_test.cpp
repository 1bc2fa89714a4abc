#include "steamlink/relocator.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace steamlink;
using steamlink::test::TempDir;
using steamlink::test::readFile;
using steamlink::test::writeFile;

class RelocatorTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::filesystem::path steamapps;

    void SetUp() override {
        steamapps = tmp / "games/SteamLibrary/steamapps";
        std::filesystem::create_directories(steamapps);
    }

    RelocationRequest request(bool linkTemp = true) const {
        return RelocationRequest{steamapps.string(), (tmp / "ssd").string(), linkTemp};
    }
};

TEST_F(RelocatorTest, FullRunMovesAndLinks) {
    writeFile(steamapps / "downloading/1.bin", "1");
    writeFile(steamapps / "downloading/2.bin", "2");
    writeFile(steamapps / "downloading/3.bin", "3");

    // Proceed?, then Move contents?
    ScriptedPrompter prompter({true, true});
    Relocator relocator(prompter);
    std::vector<std::string> streamed;
    auto report = relocator.run(request(true), [&](const std::string& line) { streamed.push_back(line); });

    EXPECT_EQ(report.status, RunStatus::COMPLETED);
    EXPECT_TRUE(report.ok());
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.log, streamed);

    auto moved = tmp / "ssd/SteamLibrary_symlink/downloading";
    for (const char* name : {"1.bin", "2.bin", "3.bin"}) {
        EXPECT_TRUE(std::filesystem::is_regular_file(moved / name)) << name;
    }
    EXPECT_TRUE(std::filesystem::is_symlink(steamapps / "downloading"));
    EXPECT_EQ(std::filesystem::canonical(steamapps / "downloading"), std::filesystem::canonical(moved));
    EXPECT_TRUE(std::filesystem::is_symlink(steamapps / "temp"));

    ASSERT_EQ(prompter.confirmations().size(), 2u);
    EXPECT_EQ(prompter.confirmations()[0].first, "Proceed?");
    EXPECT_NE(prompter.confirmations()[0].second.find("downloading"), std::string::npos);
    ASSERT_EQ(prompter.notices().size(), 1u);
    EXPECT_EQ(prompter.notices()[0].first, "Done");

    ASSERT_EQ(report.log.size(), 2u);
    EXPECT_EQ(report.log[0].rfind("Moved contents and linked", 0), 0u);
}

TEST_F(RelocatorTest, DecliningPlanTouchesNoLinks) {
    writeFile(steamapps / "downloading/1.bin", "1");

    ScriptedPrompter prompter({false});
    Relocator relocator(prompter);
    auto report = relocator.run(request());

    EXPECT_EQ(report.status, RunStatus::CANCELLED);
    EXPECT_TRUE(report.results.empty());
    EXPECT_TRUE(report.log.empty());
    EXPECT_FALSE(std::filesystem::is_symlink(steamapps / "downloading"));
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(steamapps / "temp")));
    EXPECT_EQ(readFile(steamapps / "downloading/1.bin"), "1");
}

TEST_F(RelocatorTest, InvalidSourceAbortsBeforeMutation) {
    ScriptedPrompter prompter({true, true});
    Relocator relocator(prompter);
    RelocationRequest req{(tmp / "nowhere/steamapps").string(), (tmp / "ssd").string(), true};
    auto report = relocator.run(req);

    EXPECT_EQ(report.status, RunStatus::INVALID_SOURCE);
    EXPECT_FALSE(report.ok());
    ASSERT_EQ(report.log.size(), 1u);
    EXPECT_EQ(report.log[0].rfind("ERROR: ", 0), 0u);
    ASSERT_EQ(prompter.alerts().size(), 1u);
    EXPECT_EQ(prompter.alerts()[0].first, "Invalid path");
    EXPECT_FALSE(std::filesystem::exists(tmp / "ssd"));
}

TEST_F(RelocatorTest, EmptyInputsAreRejected) {
    ScriptedPrompter prompter({true});
    Relocator relocator(prompter);

    auto noSource = relocator.run(RelocationRequest{"  ", (tmp / "ssd").string(), true});
    EXPECT_EQ(noSource.status, RunStatus::INVALID_INPUT);

    auto noDest = relocator.run(RelocationRequest{steamapps.string(), "", true});
    EXPECT_EQ(noDest.status, RunStatus::INVALID_INPUT);

    EXPECT_EQ(prompter.alerts().size(), 2u);
    EXPECT_TRUE(prompter.confirmations().empty());
}

TEST_F(RelocatorTest, UnusualSourceNameNeedsExtraConfirmation) {
    auto custom = tmp / "games/Other/library";
    std::filesystem::create_directories(custom);

    ScriptedPrompter decline({false});
    auto cancelled = Relocator(decline).run(RelocationRequest{custom.string(), (tmp / "ssd").string(), false});
    EXPECT_EQ(cancelled.status, RunStatus::CANCELLED);
    ASSERT_EQ(decline.confirmations().size(), 1u);
    EXPECT_EQ(decline.confirmations()[0].first, "Confirm steamapps");
    EXPECT_FALSE(std::filesystem::exists(tmp / "ssd"));

    ScriptedPrompter accept({true, true});
    auto done = Relocator(accept).run(RelocationRequest{custom.string(), (tmp / "ssd").string(), false});
    EXPECT_EQ(done.status, RunStatus::COMPLETED);
    EXPECT_TRUE(std::filesystem::is_symlink(custom / "downloading"));
    EXPECT_TRUE(std::filesystem::is_directory(tmp / "ssd/Other_symlink/downloading"));
}

TEST_F(RelocatorTest, TrailingSlashOnSourceIsAccepted) {
    ScriptedPrompter prompter({true});
    auto report = Relocator(prompter).run(
        RelocationRequest{steamapps.string() + "/", (tmp / "ssd").string(), false});

    EXPECT_EQ(report.status, RunStatus::COMPLETED);
    // Only "Proceed?" was asked; the name check saw "steamapps"
    EXPECT_EQ(prompter.confirmations().size(), 1u);
    EXPECT_TRUE(std::filesystem::is_directory(tmp / "ssd/SteamLibrary_symlink"));
}

TEST_F(RelocatorTest, FailedOperationMakesReportNotOk) {
    writeFile(steamapps / "downloading", "file");

    ScriptedPrompter prompter({true});
    auto report = Relocator(prompter).run(request(true));

    EXPECT_EQ(report.status, RunStatus::COMPLETED);
    EXPECT_FALSE(report.ok());
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_TRUE(report.results[0].failed());
    EXPECT_FALSE(report.results[1].failed());
}

TEST(RelocatorSuggestTest, PicksFirstExistingHint) {
    TempDir tmp;
    std::filesystem::create_directories(tmp / "media");
    std::filesystem::create_directories(tmp / "run/media");

    EXPECT_EQ(Relocator::suggestDestinationBase({tmp / "mnt", tmp / "media", tmp / "run/media"}), tmp / "media");
    EXPECT_TRUE(Relocator::suggestDestinationBase({tmp / "mnt"}).empty());
}
