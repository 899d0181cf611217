// Hydromat - Head Layout Tests

#include <gtest/gtest.h>

#include "core/tools/head_layout.h"

using hm::HeadLayout;
using hm::ToolPosition;

TEST(HeadLayout, RequiredPosition_FixedTable) {
    const ToolPosition expected[] = {
        ToolPosition::Bottom, ToolPosition::Top,    ToolPosition::Right, ToolPosition::Left,
        ToolPosition::Right,  ToolPosition::Left,   ToolPosition::Top,   ToolPosition::Bottom,
        ToolPosition::Top,    ToolPosition::Bottom,
    };
    for (int head = 1; head <= HeadLayout::HEAD_COUNT; ++head) {
        auto pos = HeadLayout::requiredPosition(head);
        ASSERT_TRUE(pos.has_value()) << "head " << head;
        EXPECT_EQ(*pos, expected[head - 1]) << "head " << head;
    }
}

TEST(HeadLayout, RequiredPosition_OutOfRange) {
    EXPECT_FALSE(HeadLayout::requiredPosition(0).has_value());
    EXPECT_FALSE(HeadLayout::requiredPosition(11).has_value());
    EXPECT_FALSE(HeadLayout::requiredPosition(-3).has_value());
}

TEST(HeadLayout, PositionMatches) {
    EXPECT_TRUE(HeadLayout::positionMatches(3, ToolPosition::Right));
    EXPECT_FALSE(HeadLayout::positionMatches(3, ToolPosition::Left));
    EXPECT_FALSE(HeadLayout::positionMatches(11, ToolPosition::Bottom));
}

TEST(HeadLayout, DefaultNames) {
    HeadLayout layout;
    EXPECT_EQ(layout.headName(1), "1 Bottom");
    EXPECT_EQ(layout.headName(2), "1 Top");
    EXPECT_EQ(layout.headName(10), "3 Bottom");
    EXPECT_EQ(layout.headName(0), "");
    EXPECT_EQ(HeadLayout::defaultHeadNames().size(), 10u);
}

TEST(HeadLayout, NamesOverride_EmptyKeepsDefault) {
    std::vector<std::string> names(HeadLayout::HEAD_COUNT);
    names[0] = "Bottom feed";
    HeadLayout layout(names);

    EXPECT_EQ(layout.headName(1), "Bottom feed");
    EXPECT_EQ(layout.headName(2), "1 Top");
}

TEST(HeadLayout, SetHeadName) {
    HeadLayout layout;
    layout.setHeadName(5, "Jointer");
    layout.setHeadName(12, "ignored");
    layout.setHeadName(6, "");

    EXPECT_EQ(layout.headName(5), "Jointer");
    EXPECT_EQ(layout.headName(6), "2 Left");
}
