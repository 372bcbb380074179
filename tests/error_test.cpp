#include <mergeguard/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace mergeguard;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::invalid_diff),     "invalid_diff");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_symbol),   "invalid_symbol");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_proposal), "invalid_proposal");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_decision), "invalid_decision");
    EXPECT_EQ(to_string_view(ErrorKind::analysis_failed),  "analysis_failed");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::invalid_diff, "inverted range"};
    const auto e2 = Error{ErrorKind::invalid_diff, "inverted range"};
    const auto e3 = Error{ErrorKind::invalid_symbol, "inverted range"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::analysis_failed, "foo"};
    const auto e2 = Error{ErrorKind::analysis_failed, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(InputError, carries_its_kind) {
    try {
        throw InputError{ErrorKind::invalid_symbol, "crossing ranges"};
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "crossing ranges");
        const auto* input = dynamic_cast<const InputError*>(&e);
        ASSERT_NE(input, nullptr);
        EXPECT_EQ(input->kind(), ErrorKind::invalid_symbol);
    }
}

TEST(ConfigError, is_a_runtime_error) {
    try {
        throw ConfigError{"weights must sum to 1.0"};
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "weights must sum to 1.0");
    }
}
