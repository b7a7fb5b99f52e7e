#include "core/errors.hpp"
#include "window/sliding_window.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace logplot::window;

TEST(SlidingWindow, ZeroCapacityIsConfigError)
{
    EXPECT_THROW(SlidingWindow(0), logplot::ConfigError);
    EXPECT_THROW(WindowBuffer(0), logplot::ConfigError);
}

TEST(SlidingWindow, NeverExceedsCapacity)
{
    for (std::size_t cap : {1u, 2u, 7u, 100u})
    {
        SlidingWindow w(cap);
        for (int i = 0; i < 250; ++i)
        {
            w.push(i, i * 2.0);
            ASSERT_LE(w.size(), cap);
            // Oldest kept sample is the cap-th most recent or newer.
            const auto snap = w.snapshot();
            const double oldestAllowed =
                static_cast<double>(i) - static_cast<double>(cap) + 1.0;
            EXPECT_GE(snap.front().x, oldestAllowed);
            EXPECT_EQ(snap.back().x, static_cast<double>(i));
        }
    }
}

TEST(SlidingWindow, EvictsByArrivalNotByX)
{
    SlidingWindow w(3);
    w.push(5, 1);
    w.push(1, 2);
    w.push(9, 3);
    w.push(0, 4);
    const auto snap = w.snapshot();
    ASSERT_EQ(snap.size(), 3u);
    EXPECT_EQ(snap[0], (Point{1, 2}));
    EXPECT_EQ(snap[1], (Point{9, 3}));
    EXPECT_EQ(snap[2], (Point{0, 4}));
}

TEST(SlidingWindow, SnapshotDoesNotMutate)
{
    SlidingWindow w(4);
    w.push(1, 1);
    w.push(2, 2);
    auto a = w.snapshot();
    a.clear();
    EXPECT_EQ(w.size(), 2u);
    EXPECT_EQ(w.snapshot().size(), 2u);
}

TEST(SlidingWindow, Stats)
{
    SlidingWindow w(10);
    EXPECT_EQ(w.stats().n, 0);

    w.push(0, 4);
    w.push(1, -2);
    w.push(2, std::numeric_limits<double>::quiet_NaN());
    w.push(3, 10);
    const auto st = w.stats();
    EXPECT_EQ(st.n, 3);
    EXPECT_DOUBLE_EQ(st.yMin, -2);
    EXPECT_DOUBLE_EQ(st.yMax, 10);
    EXPECT_DOUBLE_EQ(st.xMax, 3);
    EXPECT_DOUBLE_EQ(st.mean, 4);
    EXPECT_DOUBLE_EQ(st.last, 10);
}

TEST(WindowBuffer, SeriesAreIndependent)
{
    WindowBuffer buf(2);
    buf.push(0, 0, 5);
    buf.push(1, 0, 50);
    buf.push(0, 1, 6);
    buf.push(0, 2, 7);

    EXPECT_EQ(buf.seriesCount(), 2u);
    EXPECT_EQ(buf.snapshot(0), (std::vector<Point>{{1, 6}, {2, 7}}));
    EXPECT_EQ(buf.snapshot(1), (std::vector<Point>{{0, 50}}));
    EXPECT_TRUE(buf.snapshot(9).empty());
    EXPECT_EQ(buf.stats(9).n, 0);
}

TEST(WindowBuffer, BoundsCoverAllSeries)
{
    WindowBuffer buf(5);
    EXPECT_FALSE(buf.bounds().valid);

    buf.push(0, 1, 10);
    buf.push(1, -4, 3);
    buf.push(1, 8, 30);
    const auto b = buf.bounds();
    ASSERT_TRUE(b.valid);
    EXPECT_DOUBLE_EQ(b.xMin, -4);
    EXPECT_DOUBLE_EQ(b.xMax, 8);
    EXPECT_DOUBLE_EQ(b.yMin, 3);
    EXPECT_DOUBLE_EQ(b.yMax, 30);
}

TEST(WindowBuffer, ResetDropsEverySeries)
{
    WindowBuffer buf(3);
    buf.push(0, 1, 1);
    buf.push(2, 1, 1);
    buf.reset();
    EXPECT_EQ(buf.seriesCount(), 0u);
    EXPECT_FALSE(buf.bounds().valid);
    EXPECT_EQ(buf.capacity(), 3u);
}
