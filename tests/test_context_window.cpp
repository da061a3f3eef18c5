#include "context_window.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace pseudo_mt;

TEST(ContextWindow, KeepsMostRecentBytes) {
    ContextWindow window(8);
    window.add_context("abc");
    window.add_context("defgh");
    EXPECT_EQ(window.context(), "abcdefgh");

    window.add_context("ij");
    EXPECT_EQ(window.context(), "cdefghij");
    EXPECT_EQ(window.size_bytes(), 8u);
}

TEST(ContextWindow, OversizedAdditionKeepsItsTail) {
    ContextWindow window(4);
    window.add_context("xy");
    window.add_context("0123456789");
    EXPECT_EQ(window.context(), "6789");
}

TEST(ContextWindow, ClearEmptiesTheBuffer) {
    ContextWindow window(16);
    window.add_context("total = 0\n");
    window.clear();
    EXPECT_TRUE(window.context().empty());
    EXPECT_EQ(window.window_size(), 16u);
}

TEST(ContextWindow, ConcurrentWritersStayWithinBound) {
    ContextWindow window(64);
    {
        std::vector<std::jthread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&window, t]() {
                for (int i = 0; i < 200; ++i) {
                    window.add_context("w" + std::to_string(t) + ":" + std::to_string(i) + "\n");
                }
            });
        }
    }
    EXPECT_EQ(window.size_bytes(), 64u);
}
