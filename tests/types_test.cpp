#include <mergeguard/types.hpp>

#include <gtest/gtest.h>

#include <unordered_set>
#include <vector>

using namespace mergeguard;

// -- LineRange ----------------------------------------------------------------

TEST(LineRange, length_is_inclusive) {
    EXPECT_EQ((LineRange{10, 20}).length(), 11u);
    EXPECT_EQ((LineRange{5, 5}).length(), 1u);
}

TEST(LineRange, inverted_range_is_invalid) {
    EXPECT_TRUE((LineRange{3, 3}).valid());
    EXPECT_FALSE((LineRange{4, 3}).valid());
}

TEST(LineRange, touching_endpoints_intersect) {
    const auto a = LineRange{10, 20};
    const auto b = LineRange{20, 30};
    EXPECT_TRUE(a.intersects(b));
    EXPECT_TRUE(b.intersects(a));
}

TEST(LineRange, adjacent_ranges_do_not_intersect) {
    EXPECT_FALSE((LineRange{10, 19}).intersects(LineRange{20, 30}));
}

TEST(LineRange, intersection_of_overlapping_ranges) {
    auto shared = LineRange{10, 20}.intersection(LineRange{15, 40});
    ASSERT_TRUE(shared.has_value());
    EXPECT_EQ(*shared, (LineRange{15, 20}));
    EXPECT_FALSE((LineRange{1, 2}.intersection(LineRange{3, 4}).has_value()));
}

TEST(LineRange, encloses_and_contains) {
    const auto outer = LineRange{1, 50};
    EXPECT_TRUE(outer.encloses(LineRange{10, 20}));
    EXPECT_TRUE(outer.encloses(outer));
    EXPECT_FALSE(outer.encloses(LineRange{40, 60}));
    EXPECT_TRUE(outer.contains(50));
    EXPECT_FALSE(outer.contains(51));
}

TEST(LineRange, any_intersect_between_lists) {
    const auto a = std::vector<LineRange>{{1, 5}, {30, 40}};
    const auto b = std::vector<LineRange>{{6, 29}};
    const auto c = std::vector<LineRange>{{6, 30}};
    EXPECT_FALSE(any_intersect(a, b));
    EXPECT_TRUE(any_intersect(a, c));
}

// -- ProposalPair -------------------------------------------------------------

TEST(ProposalPair, normalizes_order) {
    const auto p = ProposalPair{9, 4};
    EXPECT_EQ(p.first, 4u);
    EXPECT_EQ(p.second, 9u);
    EXPECT_EQ(p, (ProposalPair{4, 9}));
}

TEST(ProposalPair, involves_and_other) {
    const auto p = ProposalPair{3, 7};
    EXPECT_TRUE(p.involves(3));
    EXPECT_TRUE(p.involves(7));
    EXPECT_FALSE(p.involves(5));
    EXPECT_EQ(p.other(3), 7u);
    EXPECT_EQ(p.other(7), 3u);
}

TEST(ProposalPair, hashable) {
    auto set = std::unordered_set<ProposalPair>{};
    set.insert(ProposalPair{1, 2});
    set.insert(ProposalPair{2, 1});
    set.insert(ProposalPair{1, 3});
    EXPECT_EQ(set.size(), 2u);
}
