#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <sstream>
#include <string>

#include "TestSupport.hpp"
#include "config/Settings.hpp"
#include "nav/PathCodec.hpp"
#include "preview/Previewer.hpp"

namespace {
// Puts dir first on PATH for the lifetime of the object.
class PathPrefix {
public:
    explicit PathPrefix(const std::string& dir) {
        const char* path = std::getenv("PATH");
        had_path_ = path != nullptr;
        saved_ = had_path_ ? path : "";
        setenv("PATH", (dir + ":" + saved_).c_str(), 1);
    }

    ~PathPrefix() {
        if (had_path_) {
            setenv("PATH", saved_.c_str(), 1);
        } else {
            unsetenv("PATH");
        }
    }

private:
    bool had_path_;
    std::string saved_;
};
}

TEST(PreviewerTest, MalformedTokenPrintsNothing) {
    Settings settings;
    Previewer previewer(settings);
    std::ostringstream out;
    previewer.Render("", out);
    previewer.Render("%%%", out);
    EXPECT_TRUE(out.str().empty());
}

TEST(PreviewerTest, MissingPath) {
    TempDir tmp;
    Settings settings;
    Previewer previewer(settings);
    std::ostringstream out;
    previewer.Render(EncodePath(tmp.Path() + "/gone"), out);
    EXPECT_EQ(out.str(), "(missing)\n");
}

TEST(PreviewerTest, BuiltInTreeListsDirectoriesFirst) {
    TempDir tmp;
    tmp.MakeFile("b.txt");
    tmp.MakeFile("src/main.cpp");
    tmp.MakeFile(".git/HEAD");
    Settings settings;
    settings.excludes = {".git"};
    Previewer previewer(settings);

    std::ostringstream out;
    previewer.RenderTree(tmp.Path(), out);
    const std::string expected = "\033[1;34m" + tmp.Path() + "\033[0m\n"
                                 "├── \033[1;34msrc\033[0m\n"
                                 "│   └── main.cpp\n"
                                 "└── b.txt\n"
                                 "\n"
                                 "1 directory, 2 files\n";
    EXPECT_EQ(out.str(), expected);
}

TEST(PreviewerTest, BuiltInTreeStopsAtLineLimit) {
    TempDir tmp;
    for (char c = 'a'; c <= 'e'; ++c) {
        tmp.MakeFile(std::string(1, c) + ".txt");
    }
    Settings settings;
    settings.preview_max_lines = 2;
    Previewer previewer(settings);

    std::ostringstream out;
    previewer.RenderTree(tmp.Path(), out);
    EXPECT_NE(out.str().find("├── b.txt\n…\n"), std::string::npos);
    EXPECT_EQ(out.str().find("c.txt"), std::string::npos);
}

TEST(PreviewerTest, TextDetection) {
    EXPECT_TRUE(Previewer::IsTextMime("text/plain"));
    EXPECT_TRUE(Previewer::IsTextMime("application/json"));
    EXPECT_TRUE(Previewer::IsTextMime("application/x-sh"));
    EXPECT_TRUE(Previewer::IsTextMime("image/svg+xml"));
    EXPECT_FALSE(Previewer::IsTextMime("application/octet-stream"));

    EXPECT_TRUE(Previewer::LooksTextual("line one\nline two\n"));
    EXPECT_FALSE(Previewer::LooksTextual("no newline"));
    EXPECT_FALSE(Previewer::LooksTextual(std::string("bin\0ary\n", 8)));
}

TEST(PreviewerTest, HexDumpLayout) {
    const std::string dump = Previewer::HexDump(std::string("\x7f" "ELF\x02\x01\x01\x00" "abcdefghXY", 18));
    const std::string expected =
        "00000000  7f 45 4c 46 02 01 01 00  61 62 63 64 65 66 67 68  |.ELF....abcdefgh|\n"
        "00000010  58 59                                             |XY|\n"
        "00000012\n";
    EXPECT_EQ(dump, expected);
}

TEST(PreviewerTest, HumanSizes) {
    EXPECT_EQ(Previewer::HumanSize(0), "0B");
    EXPECT_EQ(Previewer::HumanSize(1023), "1023B");
    EXPECT_EQ(Previewer::HumanSize(1536), "1.5K");
    EXPECT_EQ(Previewer::HumanSize(50ull * 1024 * 1024), "50M");
}

TEST(PreviewerTest, SlowToolsShareOneDeadline) {
    TempDir tmp;
    tmp.MakeScript("bin/file", "sleep 0.7\necho text/plain\n");
    tmp.MakeScript("bin/bat", "sleep 5\n");
    const std::string notes = tmp.MakeFile("notes.txt", "one\ntwo\n");
    PathPrefix prefix(tmp.Path() + "/bin");

    Settings settings;
    settings.preview_timeout_seconds = 1;
    Previewer previewer(settings);
    std::ostringstream out;
    const auto started = std::chrono::steady_clock::now();
    previewer.Render(EncodePath(notes), out);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 1500);
    EXPECT_NE(out.str().find("(preview timed out)"), std::string::npos);
}
