#include <gtest/gtest.h>

#include <string>

#include "nav/DisplayLines.hpp"
#include "nav/PathCodec.hpp"

namespace {
Listing SampleListing() {
    Listing listing;
    listing.dirs = {"docs/", "src/"};
    listing.files = {"README.md"};
    return listing;
}
}

TEST(DisplayLinesTest, ParentLineThenDirectoriesThenFiles) {
    const Frame frame = BuildFrame("/home/u/proj", SampleListing(), NavigationMemory{}, Palette{});

    ASSERT_EQ(frame.lines.size(), 4u);
    EXPECT_EQ(frame.lines[0].label, "../");
    EXPECT_EQ(*DecodePath(frame.lines[0].token), "/home/u");
    EXPECT_EQ(frame.lines[1].label, "docs/");
    EXPECT_EQ(*DecodePath(frame.lines[1].token), "/home/u/proj/docs");
    EXPECT_EQ(frame.lines[2].label, "src/");
    EXPECT_EQ(frame.lines[3].label, "README.md");
    EXPECT_EQ(*DecodePath(frame.lines[3].token), "/home/u/proj/README.md");
    EXPECT_FALSE(frame.preselect.has_value());
}

TEST(DisplayLinesTest, ParentLineAtRootPointsAtRoot) {
    Listing listing;
    listing.dirs = {"etc/"};
    const Frame frame = BuildFrame("/", listing, NavigationMemory{}, Palette{});

    ASSERT_EQ(frame.lines.size(), 2u);
    EXPECT_EQ(*DecodePath(frame.lines[0].token), "/");
    EXPECT_EQ(*DecodePath(frame.lines[1].token), "/etc");
}

TEST(DisplayLinesTest, PreselectsRememberedDirectoryOnly) {
    NavigationMemory memory;
    memory["/home/u/proj"] = "src";
    Frame frame = BuildFrame("/home/u/proj", SampleListing(), memory, Palette{});
    ASSERT_TRUE(frame.preselect.has_value());
    EXPECT_EQ(*frame.preselect, 2u);

    // A file with the remembered name is never preselected.
    memory["/home/u/proj"] = "README.md";
    frame = BuildFrame("/home/u/proj", SampleListing(), memory, Palette{});
    EXPECT_FALSE(frame.preselect.has_value());

    // A remembered child that no longer exists selects nothing.
    memory["/home/u/proj"] = "gone";
    frame = BuildFrame("/home/u/proj", SampleListing(), memory, Palette{});
    EXPECT_FALSE(frame.preselect.has_value());
}

TEST(DisplayLinesTest, PaletteWrapsLabels) {
    const Palette palette = Palette::FromHex("#ff8800", "00ff00");
    EXPECT_EQ(palette.dir, "\033[38;2;255;136;0m");
    EXPECT_EQ(palette.file, "\033[38;2;0;255;0m");
    EXPECT_EQ(palette.reset, "\033[0m");

    const Frame frame = BuildFrame("/x", SampleListing(), NavigationMemory{}, palette);
    EXPECT_EQ(frame.lines[1].label, palette.dir + "docs/" + palette.reset);
    EXPECT_EQ(frame.lines[3].label, palette.file + "README.md" + palette.reset);
}

TEST(DisplayLinesTest, MalformedColorsLeaveDefaults) {
    const Palette palette = Palette::FromHex("orange", "#12345");
    EXPECT_TRUE(palette.dir.empty());
    EXPECT_TRUE(palette.file.empty());
    EXPECT_TRUE(palette.reset.empty());
}

TEST(DisplayLinesTest, LabelsCannotBreakRecords) {
    EXPECT_EQ(SanitizeLabel("a\tb\nc\rd"), "a?b?c?d");

    const DisplayLine line = MakeLine("/srv/odd\tname", false, Palette{});
    EXPECT_EQ(line.label, "odd?name");
    EXPECT_EQ(*DecodePath(line.token), "/srv/odd\tname");
    EXPECT_EQ(FormatLines({line, MakeLine("/srv", true, Palette{})}),
              FormatLine(line) + "\n" + EncodePath("/srv") + "\tsrv/\n");
}
