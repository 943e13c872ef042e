#include <docdiff-cpp/change.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace docdiff_cpp;

TEST(Op, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(Op::add),     "add");
    EXPECT_EQ(to_string_view(Op::remove),  "remove");
    EXPECT_EQ(to_string_view(Op::replace), "replace");
}

TEST(Change, default_constructed) {
    const auto c = Change{};

    EXPECT_EQ(c.op, Op::add);
    EXPECT_TRUE(c.path.empty());
    EXPECT_FALSE(c.value.has_value());
    EXPECT_TRUE(c.item_ids.empty());
}

TEST(Change, construction_with_fields) {
    const auto c = Change{
        .op = Op::replace,
        .path = {"toys", "toy2", "name"},
        .value = Value{"Robot"},
        .item_ids = {"toy2"},
    };

    EXPECT_EQ(c.path.size(), 3u);
    ASSERT_TRUE(c.value.has_value());
    EXPECT_EQ(*c.value, Value{"Robot"});
    EXPECT_EQ(c.item_ids, std::vector<std::string>{"toy2"});
}

TEST(Change, equality_covers_every_field) {
    const auto base = Change{Op::remove, {"toys", "toy1"}, std::nullopt, {"toy1"}};

    auto other_op = base;
    other_op.op = Op::add;
    auto other_value = base;
    other_value.value = Value{1};
    auto other_ids = base;
    other_ids.item_ids.clear();

    EXPECT_EQ(base, (Change{Op::remove, {"toys", "toy1"}, std::nullopt, {"toy1"}}));
    EXPECT_NE(base, other_op);
    EXPECT_NE(base, other_value);
    EXPECT_NE(base, other_ids);
}
