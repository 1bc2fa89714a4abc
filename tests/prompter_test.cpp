#include "steamlink/prompter.hpp"
#include <gtest/gtest.h>
#include <sstream>

using steamlink::ConsolePrompter;
using steamlink::ScriptedPrompter;

TEST(ConsolePrompterTest, AcceptsOnlyExplicitYes) {
    std::istringstream in("y\n YES \nn\n\nmaybe\n");
    std::ostringstream out;
    std::ostringstream err;
    ConsolePrompter prompter(in, out, err);

    EXPECT_TRUE(prompter.confirm("Move contents?", "a"));
    EXPECT_TRUE(prompter.confirm("Move contents?", "b"));
    EXPECT_FALSE(prompter.confirm("Move contents?", "c"));
    EXPECT_FALSE(prompter.confirm("Move contents?", "d"));
    EXPECT_FALSE(prompter.confirm("Move contents?", "e"));
    // Input exhausted
    EXPECT_FALSE(prompter.confirm("Move contents?", "f"));

    EXPECT_NE(out.str().find("== Move contents? =="), std::string::npos);
    EXPECT_NE(out.str().find("[y/N]"), std::string::npos);
}

TEST(ConsolePrompterTest, AlertsGoToErrorStream) {
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    ConsolePrompter prompter(in, out, err);

    prompter.alert("Symlink Error", "denied");
    prompter.notify("Done", "finished");

    EXPECT_NE(err.str().find("Symlink Error"), std::string::npos);
    EXPECT_EQ(out.str().find("Symlink Error"), std::string::npos);
    EXPECT_NE(out.str().find("Done: finished"), std::string::npos);
}

TEST(ScriptedPrompterTest, FallsBackOnceScriptRunsOut) {
    ScriptedPrompter prompter({false}, true);
    EXPECT_FALSE(prompter.confirm("t", "m"));
    EXPECT_TRUE(prompter.confirm("t", "m"));
    EXPECT_EQ(prompter.confirmations().size(), 2u);
}
