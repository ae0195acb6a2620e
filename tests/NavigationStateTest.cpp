#include <gtest/gtest.h>

#include <string>

#include "TestSupport.hpp"
#include "nav/NavigationState.hpp"

TEST(NavigationStateTest, DownThenUpRemembersChild) {
    TempDir tmp;
    const std::string proj = tmp.MakeDir("proj");
    const std::string src = tmp.MakeDir("proj/src");

    NavigationState state(proj);
    ASSERT_TRUE(state.Down(src));
    EXPECT_EQ(state.CurrentDir(), src);
    EXPECT_EQ(state.Memory().at(proj), "src");

    state.Up();
    EXPECT_EQ(state.CurrentDir(), proj);
    EXPECT_EQ(state.Memory().at(proj), "src");
    EXPECT_EQ(state.Memory().at(tmp.Path()), "proj");
}

TEST(NavigationStateTest, UpAtRootStaysAtRoot) {
    NavigationState state("/");
    state.Up();
    EXPECT_EQ(state.CurrentDir(), "/");
}

TEST(NavigationStateTest, DownRejectsFilesAndParentLine) {
    TempDir tmp;
    const std::string dir = tmp.MakeDir("a/b");
    const std::string file = tmp.MakeFile("a/b/notes.txt");

    NavigationState state(dir);
    EXPECT_FALSE(state.Down(file));
    EXPECT_FALSE(state.Down(tmp.Path() + "/a"));
    EXPECT_FALSE(state.Down(""));
    EXPECT_FALSE(state.Down(tmp.Path() + "/missing"));
    EXPECT_EQ(state.CurrentDir(), dir);
    EXPECT_TRUE(state.Memory().empty());
}

TEST(NavigationStateTest, EnterOnParentLineConfirmsCurrentDirectory) {
    TempDir tmp;
    const std::string b = tmp.MakeDir("a/b");

    NavigationState state(b);
    EXPECT_EQ(state.Enter(tmp.Path() + "/a"), NavigationState::EnterResult::ConfirmDirectory);
    EXPECT_EQ(state.ConfirmedPath(), b);
}

TEST(NavigationStateTest, EnterClassifiesTargets) {
    TempDir tmp;
    const std::string sub = tmp.MakeDir("sub");
    const std::string file = tmp.MakeFile("notes.txt");

    NavigationState state(tmp.Path());
    EXPECT_EQ(state.Enter(file), NavigationState::EnterResult::OpenFile);
    EXPECT_EQ(state.Enter(""), NavigationState::EnterResult::Ignored);
    EXPECT_EQ(state.Enter(tmp.Path() + "/missing"), NavigationState::EnterResult::Ignored);
    EXPECT_EQ(state.Enter(sub), NavigationState::EnterResult::ConfirmDirectory);
    EXPECT_EQ(state.ConfirmedPath(), sub);
    EXPECT_EQ(state.CurrentDir(), tmp.Path());
}

TEST(NavigationStateTest, ArriveAtFilePreselectsItsDirectoryFromAbove) {
    TempDir tmp;
    tmp.MakeDir("elsewhere");
    const std::string file = tmp.MakeFile("docs/guide.md");

    NavigationState state(tmp.Path() + "/elsewhere");
    state.ArriveAtFile(file);
    EXPECT_EQ(state.CurrentDir(), tmp.Path() + "/docs");
    EXPECT_EQ(state.Memory().at(tmp.Path()), "docs");
}
