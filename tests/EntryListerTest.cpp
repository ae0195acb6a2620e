#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "nav/EntryLister.hpp"

TEST(EntryListerTest, SortsCaseInsensitivelyWithHiddenEntries) {
    TempDir tmp;
    tmp.MakeDir("beta");
    tmp.MakeDir("Alpha");
    tmp.MakeDir(".hidden");
    tmp.MakeFile("zeta.txt");
    tmp.MakeFile("README.md");
    tmp.MakeFile(".profile");

    const Listing listing = ListDirectory(tmp.Path());
    EXPECT_EQ(listing.dirs, (std::vector<std::string>{".hidden/", "Alpha/", "beta/"}));
    EXPECT_EQ(listing.files, (std::vector<std::string>{".profile", "README.md", "zeta.txt"}));
}

TEST(EntryListerTest, FoldedOrderMatchesSortF) {
    EXPECT_TRUE(FoldedLess("apple", "Banana"));
    EXPECT_TRUE(FoldedLess("Zed", "zee"));
    // '_' sits after the upper-case letters once folded.
    EXPECT_TRUE(FoldedLess("abc", "_abc"));
    // Equal when folded: raw bytes decide.
    EXPECT_TRUE(FoldedLess("ABC", "abc"));
    EXPECT_FALSE(FoldedLess("abc", "ABC"));
}

TEST(EntryListerTest, MissingDirectoryIsEmpty) {
    TempDir tmp;
    const Listing listing = ListDirectory(tmp.Path() + "/nope");
    EXPECT_TRUE(listing.dirs.empty());
    EXPECT_TRUE(listing.files.empty());
}

TEST(EntryListerTest, SymlinkToDirectoryListsAsDirectory) {
    TempDir tmp;
    const std::string target = tmp.MakeDir("real");
    std::filesystem::create_directory_symlink(target, tmp.Path() + "/link");

    const Listing listing = ListDirectory(tmp.Path());
    EXPECT_EQ(listing.dirs, (std::vector<std::string>{"link/", "real/"}));
}
