#include <gtest/gtest.h>
#include <tweenkit/tween_types.hpp>
#include <vector>

using namespace tweenkit;

// ─── Restart ────────────────────────────────────────────────────────────────

TEST(TweenLoop, RestartThreeTimes)
{
    FloatTween t;
    int        loops = 0, completes = 0;
    t.set_loop(LoopType::Restart, 3)
        .on_loop([&] { ++loops; })
        .on_complete([&] { ++completes; });
    t.start(0.0f, 10.0f, 1.0f);

    int frames = 0;
    while (!t.is_complete() && frames < 100)
    {
        t.update(1.0f);
        ++frames;
    }

    EXPECT_EQ(loops, 3);
    EXPECT_EQ(completes, 1);
    EXPECT_EQ(frames, 4);
    EXPECT_FLOAT_EQ(t.current_value(), 10.0f);
}

TEST(TweenLoop, RestartReturnsToStartValue)
{
    FloatTween t;
    t.set_loop(LoopType::Restart, 1);
    t.start(0.0f, 10.0f, 1.0f);
    t.update(1.0f);
    EXPECT_EQ(t.state(), TweenState::Running);
    EXPECT_FLOAT_EQ(t.elapsed(), 0.0f);
    EXPECT_FLOAT_EQ(t.current_value(), 0.0f);
    EXPECT_EQ(t.loops_remaining(), 0);

    t.update(0.5f);
    EXPECT_FLOAT_EQ(t.current_value(), 5.0f);
}

TEST(TweenLoop, LoopCountZeroPlaysOnce)
{
    FloatTween t;
    int        loops = 0;
    t.set_loop(LoopType::Restart, 0).on_loop([&] { ++loops; });
    t.start(0.0f, 1.0f, 1.0f);
    t.update(1.0f);
    EXPECT_TRUE(t.is_complete());
    EXPECT_EQ(loops, 0);
}

TEST(TweenLoop, NoneIgnoresCount)
{
    FloatTween t;
    t.set_loop(LoopType::None, 5);
    t.start(0.0f, 1.0f, 1.0f);
    t.update(1.0f);
    EXPECT_TRUE(t.is_complete());
}

TEST(TweenLoop, CountBelowMinusOneClamps)
{
    FloatTween t;
    t.set_loop(LoopType::Restart, -7);
    EXPECT_EQ(t.loop_count(), -1);
}

TEST(TweenLoop, StartResetsLoopsRemaining)
{
    FloatTween t;
    t.set_loop(LoopType::Restart, 2);
    t.start(0.0f, 1.0f, 1.0f);
    t.update(1.0f);
    EXPECT_EQ(t.loops_remaining(), 1);
    t.start(0.0f, 1.0f, 1.0f);
    EXPECT_EQ(t.loops_remaining(), 2);
}

TEST(TweenLoop, LoopDoesNotRefireStart)
{
    FloatTween t;
    int        starts = 0;
    t.set_loop(LoopType::Restart, 2).on_start([&] { ++starts; });
    t.start(0.0f, 1.0f, 1.0f);
    for (int i = 0; i < 3; ++i)
        t.update(1.0f);
    EXPECT_TRUE(t.is_complete());
    EXPECT_EQ(starts, 1);
}

// ─── PingPong ───────────────────────────────────────────────────────────────

TEST(TweenLoop, PingPongSwapsEndpoints)
{
    FloatTween t;
    t.set_loop(LoopType::PingPong, 1);
    t.start(0.0f, 100.0f, 1.0f);

    t.update(1.0f);
    EXPECT_FLOAT_EQ(t.start_value(), 100.0f);
    EXPECT_FLOAT_EQ(t.end_value(), 0.0f);
    EXPECT_TRUE(t.is_reversed_phase());

    t.update(0.25f);
    EXPECT_FLOAT_EQ(t.current_value(), 75.0f);

    t.update(0.75f);
    EXPECT_TRUE(t.is_complete());
    EXPECT_FLOAT_EQ(t.current_value(), 0.0f);
}

TEST(TweenLoop, PingPongEasesForwardInBothPhases)
{
    FloatTween t;
    t.set_loop(LoopType::PingPong, 1);
    t.start(0.0f, 100.0f, 1.0f, ease::quad_in);
    t.update(1.0f);
    t.update(0.5f);
    // quad_in(0.5) = 0.25 applied from the swapped start
    EXPECT_FLOAT_EQ(t.current_value(), 75.0f);
}

// ─── Yoyo ───────────────────────────────────────────────────────────────────

TEST(TweenLoop, YoyoKeepsEndpointsAndMirrors)
{
    FloatTween t;
    t.set_loop(LoopType::Yoyo, 1);
    t.start(0.0f, 100.0f, 1.0f, ease::quad_in);

    t.update(1.0f);
    EXPECT_FLOAT_EQ(t.start_value(), 0.0f);
    EXPECT_FLOAT_EQ(t.end_value(), 100.0f);
    EXPECT_TRUE(t.is_reversed_phase());
    EXPECT_FLOAT_EQ(t.current_value(), 100.0f);

    t.update(0.25f);
    // Progress mirrored before easing: quad_in(0.75)
    EXPECT_FLOAT_EQ(t.current_value(), 56.25f);

    t.update(0.75f);
    EXPECT_TRUE(t.is_complete());
    EXPECT_FLOAT_EQ(t.current_value(), 0.0f);
}

TEST(TweenLoop, YoyoTracesCurveBackwards)
{
    FloatTween forward;
    forward.start(0.0f, 100.0f, 1.0f, ease::cubic_out);
    forward.update(0.3f);

    FloatTween yoyo;
    yoyo.set_loop(LoopType::Yoyo, 1);
    yoyo.start(0.0f, 100.0f, 1.0f, ease::cubic_out);
    yoyo.update(1.0f);
    yoyo.update(0.7f);

    EXPECT_NEAR(yoyo.current_value(), forward.current_value(), 1e-3f);
}

// ─── Infinite ───────────────────────────────────────────────────────────────

TEST(TweenLoop, InfiniteNeverCompletes)
{
    FloatTween t;
    int        loops = 0, completes = 0;
    t.set_loop(LoopType::PingPong, -1)
        .on_loop([&] { ++loops; })
        .on_complete([&] { ++completes; });
    t.start(0.0f, 1.0f, 0.5f);

    for (int i = 0; i < 50; ++i)
        t.update(0.5f);

    EXPECT_EQ(loops, 50);
    EXPECT_EQ(completes, 0);
    EXPECT_FALSE(t.is_complete());
    EXPECT_EQ(t.state(), TweenState::Running);
    EXPECT_EQ(t.loops_remaining(), -1);
}

TEST(TweenLoop, InfiniteStopsWithForceComplete)
{
    FloatTween t;
    int        completes = 0;
    t.set_loop(LoopType::Restart, -1).on_complete([&] { ++completes; });
    t.start(0.0f, 10.0f, 1.0f);
    t.update(2.5f);
    t.stop(StopBehavior::ForceComplete);
    EXPECT_TRUE(t.is_complete());
    EXPECT_EQ(completes, 1);
    EXPECT_FLOAT_EQ(t.current_value(), 10.0f);
}

// ─── Callback interplay ─────────────────────────────────────────────────────

TEST(TweenLoop, LoopFiresAfterUpdate)
{
    FloatTween       t;
    std::vector<int> events;   // 0 = update, 1 = loop
    t.set_loop(LoopType::Restart, 1)
        .on_update([&](float) { events.push_back(0); })
        .on_loop([&] { events.push_back(1); });
    t.start(0.0f, 1.0f, 1.0f);
    t.update(1.0f);
    EXPECT_EQ(events, (std::vector<int>{0, 1}));
}

TEST(TweenLoop, StopInsideLoopCallback)
{
    FloatTween t;
    int        completes = 0;
    t.set_loop(LoopType::Restart, -1)
        .on_loop([&] { t.stop(StopBehavior::AsIs); })
        .on_complete([&] { ++completes; });
    t.start(0.0f, 1.0f, 1.0f);
    t.update(1.0f);
    EXPECT_EQ(t.state(), TweenState::Stopped);
    EXPECT_FALSE(t.is_complete());
    EXPECT_EQ(completes, 0);

    t.update(1.0f);
    EXPECT_FLOAT_EQ(t.elapsed(), 0.0f);
}
