#include "utils/circular_window.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace kls::tui;

namespace {

CircularWindow<int> numbers(int n) {
    std::vector<int> v;
    for (int i = 0; i < n; ++i) {
        v.push_back(i);
    }
    return CircularWindow<int>(v);
}

} // namespace

TEST(CircularWindowTest, ShiftBySizeIsIdentity) {
    for (int n : {1, 2, 5, 13}) {
        auto window = numbers(n);
        window.shift(3);
        const auto before = window.view(n);

        window.shift(n);
        EXPECT_EQ(window.view(n), before);
        window.shift(-n);
        EXPECT_EQ(window.view(n), before);
        window.shift(4 * n);
        EXPECT_EQ(window.view(n), before);
    }
}

TEST(CircularWindowTest, ShiftsCompose) {
    const std::vector<std::pair<long, long>> steps = {
        {1, 1}, {3, -5}, {-7, 2}, {12, 12}, {-1, -1}, {0, 6}
    };

    for (auto [a, b] : steps) {
        auto split = numbers(7);
        split.shift(a);
        split.shift(b);

        auto joined = numbers(7);
        joined.shift(a + b);

        EXPECT_EQ(split.view(7), joined.view(7)) << "a=" << a << " b=" << b;
        EXPECT_EQ(split.offset(), joined.offset());
    }
}

TEST(CircularWindowTest, ViewHasRequestedLengthAndRepeats) {
    auto window = numbers(3);
    window.shift(1);

    EXPECT_EQ(window.view(0).size(), 0u);
    EXPECT_EQ(window.view(2), (std::vector<int>{1, 2}));
    EXPECT_EQ(window.view(7), (std::vector<int>{1, 2, 0, 1, 2, 0, 1}));
}

TEST(CircularWindowTest, EmptyWindowIsInert) {
    CircularWindow<std::string> window;
    window.shift(5);
    window.shift(-2);

    EXPECT_TRUE(window.empty());
    EXPECT_TRUE(window.view(4).empty());
    EXPECT_EQ(window.offset(), 0u);
}

TEST(CircularWindowTest, AtFollowsRotationAndResetRestoresOrigin) {
    CircularWindow<std::string> window({"a", "b", "c", "d"});
    window.shift(-1);

    EXPECT_EQ(window.at(0), "d");
    EXPECT_EQ(window.at(1), "a");
    EXPECT_EQ(window.elements().front(), "a");

    window.reset();
    EXPECT_EQ(window.at(0), "a");
}
