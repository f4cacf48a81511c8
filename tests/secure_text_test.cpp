#include "secure_text.hpp"

#include <gtest/gtest.h>

#include <type_traits>

static_assert(!std::is_copy_constructible<SecureText>::value, "SecureText must not be copyable");
static_assert(!std::is_copy_assignable<SecureText>::value, "SecureText must not be copyable");
static_assert(std::is_nothrow_move_constructible<SecureText>::value, "moves must not throw");

TEST(SecureText, HoldsWhatItWasGiven) {
    SecureText empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.size(), 0u);

    SecureText s(U"sk_live_abc");
    EXPECT_FALSE(s.empty());
    EXPECT_EQ(s.size(), 11u);
    EXPECT_EQ(s.str(), U"sk_live_abc");
}

TEST(SecureText, MoveConstructionLeavesSourceEmpty) {
    SecureText a(U"ghp_Q7rT9vK2");
    SecureText b(std::move(a));

    EXPECT_EQ(b.str(), U"ghp_Q7rT9vK2");
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(a.size(), 0u);
}

TEST(SecureText, MoveAssignmentReplacesAndEmptiesSource) {
    SecureText a(U"first value");
    SecureText b(U"second");
    b = std::move(a);

    EXPECT_EQ(b.str(), U"first value");
    EXPECT_TRUE(a.empty());

    // self-move keeps the value
    SecureText& alias = b;
    b = std::move(alias);
    EXPECT_EQ(b.str(), U"first value");
}

TEST(SecureText, AssignReplacesContents) {
    SecureText s(U"old contents");
    s.assign(U"new");
    EXPECT_EQ(s.str(), U"new");
    EXPECT_EQ(s.size(), 3u);

    s.assign(Text());
    EXPECT_TRUE(s.empty());
}

TEST(SecureText, DataAllowsInPlaceEdits) {
    SecureText s(U"AbC");
    for (char32_t& c : s.data()) {
        if (c >= U'A' && c <= U'Z') c = c - U'A' + U'a';
    }
    EXPECT_EQ(s.str(), U"abc");
}
