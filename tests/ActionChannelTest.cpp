#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "TestSupport.hpp"
#include "picker/Action.hpp"
#include "picker/ActionChannel.hpp"

using namespace std::chrono_literals;

TEST(ActionChannelTest, ParsesTaggedLines) {
    auto message = ActionChannel::Parse("A:ENTER:L2V0Yw==\n");
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->tag, "ENTER");
    EXPECT_EQ(message->token, "L2V0Yw==");

    message = ActionChannel::Parse("A:LEFT:");
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->tag, "LEFT");
    EXPECT_TRUE(message->token.empty());

    EXPECT_FALSE(ActionChannel::Parse("").has_value());
    EXPECT_FALSE(ActionChannel::Parse("ENTER:abc").has_value());
    EXPECT_FALSE(ActionChannel::Parse("A::abc").has_value());
    EXPECT_FALSE(ActionChannel::Parse("A:ENTER").has_value());
}

TEST(ActionChannelTest, SilenceTimesOut) {
    TempDir tmp;
    ActionChannel channel(tmp.Path());

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.Await(50ms, 10ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST(ActionChannelTest, PicksUpLateWriter) {
    TempDir tmp;
    ActionChannel channel(tmp.Path());

    std::thread writer([&channel]() {
        std::this_thread::sleep_for(30ms);
        std::ofstream out(channel.Path());
        out << "A:RIGHT:dG9rZW4=\n";
    });
    const auto message = channel.Await(2000ms, 5ms);
    writer.join();

    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->tag, "RIGHT");
    EXPECT_EQ(message->token, "dG9rZW4=");
}

TEST(ActionChannelTest, RemovesBackingFile) {
    TempDir tmp;
    std::string path;
    {
        ActionChannel channel(tmp.Path());
        path = channel.Path();
        EXPECT_TRUE(std::filesystem::exists(path));
        EXPECT_EQ(path.rfind(tmp.Path() + "/", 0), 0u);
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ActionChannelTest, UnwritableDirectoryThrows) {
    TempDir tmp;
    EXPECT_THROW(ActionChannel(tmp.Path() + "/missing"), std::runtime_error);
}

TEST(ActionTest, TagsDependOnMode) {
    EXPECT_EQ(ActionKindFromTag("ENTER", false), ActionKind::Enter);
    EXPECT_EQ(ActionKindFromTag("LEFT", false), ActionKind::Up);
    EXPECT_EQ(ActionKindFromTag("RIGHT", false), ActionKind::Down);
    EXPECT_EQ(ActionKindFromTag("G_ENTER", false), ActionKind::Cancel);

    EXPECT_EQ(ActionKindFromTag("G_ENTER", true), ActionKind::Enter);
    EXPECT_EQ(ActionKindFromTag("G_RIGHT", true), ActionKind::Into);
    EXPECT_EQ(ActionKindFromTag("G_LEFT", true), ActionKind::Back);
    EXPECT_EQ(ActionKindFromTag("ENTER", true), ActionKind::Cancel);
}
