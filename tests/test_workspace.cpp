#include <gtest/gtest.h>

#include "FakeServer.hpp"
#include "juicebox/layout/Workspace.hpp"
#include "juicebox/utils/GapConfig.hpp"

using namespace juicebox;
using juicebox::test::FakeServer;

class WorkspaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        connection_ = server_.connect();
    }

    Window window(protocol::WindowId id) { return Window(id, *connection_); }

    FakeServer server_;
    std::unique_ptr<Connection> connection_;
};

TEST_F(WorkspaceTest, AddRejectsDuplicates) {
    Workspace workspace(0);
    EXPECT_TRUE(workspace.add(window(1)));
    EXPECT_TRUE(workspace.add(window(2)));
    EXPECT_FALSE(workspace.add(window(1)));

    ASSERT_EQ(workspace.size(), 2u);
    EXPECT_EQ(workspace.at(0).getId(), 1u);
    EXPECT_EQ(workspace.at(1).getId(), 2u);
}

TEST_F(WorkspaceTest, RemoveKeepsOrder) {
    Workspace workspace(0);
    workspace.add(window(1));
    workspace.add(window(2));
    workspace.add(window(3));

    EXPECT_TRUE(workspace.remove(window(2)));
    EXPECT_FALSE(workspace.remove(window(2)));

    ASSERT_EQ(workspace.size(), 2u);
    EXPECT_EQ(workspace.at(0).getId(), 1u);
    EXPECT_EQ(workspace.at(1).getId(), 3u);
}

TEST_F(WorkspaceTest, RemovingFocusedHandsFocusToPredecessor) {
    Workspace workspace(0);
    workspace.add(window(1));
    workspace.add(window(2));
    workspace.setFocused(window(2));

    workspace.remove(window(2));
    ASSERT_TRUE(workspace.getFocused().has_value());
    EXPECT_EQ(workspace.getFocused()->getId(), 1u);

    workspace.remove(window(1));
    EXPECT_FALSE(workspace.getFocused().has_value());
    EXPECT_TRUE(workspace.empty());
}

TEST_F(WorkspaceTest, RemovingFirstFocusedLeavesNoFocus) {
    Workspace workspace(0);
    workspace.add(window(1));
    workspace.add(window(2));
    workspace.setFocused(window(1));

    workspace.remove(window(1));
    EXPECT_FALSE(workspace.getFocused().has_value());
}

TEST_F(WorkspaceTest, RemovingUnfocusedKeepsFocus) {
    Workspace workspace(0);
    workspace.add(window(1));
    workspace.add(window(2));
    workspace.setFocused(window(2));

    workspace.remove(window(1));
    EXPECT_TRUE(workspace.isFocused(window(2)));
    EXPECT_EQ(workspace.focusedIndex(), std::optional<std::size_t>(0));
}

TEST_F(WorkspaceTest, SwapAndIndexes) {
    Workspace workspace(3);
    EXPECT_EQ(workspace.getId(), 3u);
    workspace.add(window(1));
    workspace.add(window(2));
    workspace.add(window(3));
    workspace.setFocused(window(3));

    workspace.swap(0, 2);
    EXPECT_EQ(workspace.at(0).getId(), 3u);
    EXPECT_EQ(workspace.at(2).getId(), 1u);
    EXPECT_EQ(workspace.focusedIndex(), std::optional<std::size_t>(0));
    EXPECT_EQ(workspace.indexOf(window(1)), std::optional<std::size_t>(2));
    EXPECT_FALSE(workspace.indexOf(window(9)).has_value());

    EXPECT_THROW(workspace.swap(0, 3), std::out_of_range);
}

TEST_F(WorkspaceTest, Prev) {
    Workspace workspace(0);
    workspace.add(window(1));
    workspace.add(window(2));

    EXPECT_FALSE(workspace.prev(window(1)).has_value());
    ASSERT_TRUE(workspace.prev(window(2)).has_value());
    EXPECT_EQ(workspace.prev(window(2))->getId(), 1u);
    EXPECT_FALSE(workspace.prev(window(5)).has_value());
}

TEST_F(WorkspaceTest, ModeDefaultsToTiled) {
    Workspace workspace(0);
    EXPECT_EQ(workspace.getMode(), Workspace::Mode::Tiled);
    workspace.setMode(Workspace::Mode::FullScreen);
    EXPECT_EQ(workspace.getMode(), Workspace::Mode::FullScreen);
}

TEST(GapConfigTest, ApplyShrinksScreen) {
    GapConfig gaps(1, 2, 3, 4);
    EXPECT_EQ(gaps.apply(100, 50), GapRect(1, 3, 97, 43));
    EXPECT_EQ(gaps.getHorizontalGap(), 3);
    EXPECT_EQ(gaps.getVerticalGap(), 7);

    GapConfig defaults;
    EXPECT_EQ(defaults.apply(800, 600), GapRect(4, 4, 792, 592));
}
