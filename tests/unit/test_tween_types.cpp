#include <cmath>
#include <gtest/gtest.h>
#include <tweenkit/tween_types.hpp>

using namespace tweenkit;

static constexpr float kPi = 3.14159265358979f;

// ─── Blend functions ────────────────────────────────────────────────────────

TEST(Blend, LerpScalar)
{
    EXPECT_FLOAT_EQ(lerp(0.0f, 10.0f, 0.0f), 0.0f);
    EXPECT_FLOAT_EQ(lerp(0.0f, 10.0f, 0.3f), 3.0f);
    EXPECT_FLOAT_EQ(lerp(0.0f, 10.0f, 1.0f), 10.0f);
}

TEST(Blend, LerpExtrapolatesForOvershoot)
{
    EXPECT_FLOAT_EQ(lerp(0.0f, 10.0f, 1.2f), 12.0f);
    EXPECT_FLOAT_EQ(lerp(0.0f, 10.0f, -0.1f), -1.0f);
}

TEST(Blend, LerpVectors)
{
    vec2 v2 = lerp(vec2{0.0f, 2.0f}, vec2{4.0f, 6.0f}, 0.5f);
    EXPECT_FLOAT_EQ(v2.x, 2.0f);
    EXPECT_FLOAT_EQ(v2.y, 4.0f);

    vec3 v3 = lerp(vec3{0.0f, 0.0f, 0.0f}, vec3{1.0f, 2.0f, 3.0f}, 0.25f);
    EXPECT_FLOAT_EQ(v3.x, 0.25f);
    EXPECT_FLOAT_EQ(v3.y, 0.5f);
    EXPECT_FLOAT_EQ(v3.z, 0.75f);

    vec4 v4 = lerp(vec4{1.0f, 1.0f, 1.0f, 1.0f}, vec4{3.0f, 5.0f, 7.0f, 9.0f}, 0.5f);
    EXPECT_EQ(v4, (vec4{2.0f, 3.0f, 4.0f, 5.0f}));
}

TEST(Blend, LerpColorIncludesAlpha)
{
    Color c = lerp(colors::black, colors::transparent, 0.5f);
    EXPECT_FLOAT_EQ(c.r, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 0.5f);

    Color mid = lerp(colors::red, colors::blue, 0.5f);
    EXPECT_FLOAT_EQ(mid.r, 0.5f);
    EXPECT_FLOAT_EQ(mid.g, 0.0f);
    EXPECT_FLOAT_EQ(mid.b, 0.5f);
    EXPECT_FLOAT_EQ(mid.a, 1.0f);
}

TEST(Blend, SlerpEndpoints)
{
    quat a = quat_identity();
    quat b = quat_from_axis_angle(vec3{0.0f, 0.0f, 1.0f}, kPi / 2.0f);
    quat r0 = slerp(a, b, 0.0f);
    quat r1 = slerp(a, b, 1.0f);
    EXPECT_NEAR(r0.w, a.w, 1e-5f);
    EXPECT_NEAR(r1.z, b.z, 1e-5f);
    EXPECT_NEAR(r1.w, b.w, 1e-5f);
}

TEST(Blend, SlerpHalfwayIsHalfAngle)
{
    quat a   = quat_identity();
    quat b   = quat_from_axis_angle(vec3{0.0f, 1.0f, 0.0f}, kPi / 2.0f);
    quat mid = slerp(a, b, 0.5f);
    quat ref = quat_from_axis_angle(vec3{0.0f, 1.0f, 0.0f}, kPi / 4.0f);
    EXPECT_NEAR(mid.x, ref.x, 1e-5f);
    EXPECT_NEAR(mid.y, ref.y, 1e-5f);
    EXPECT_NEAR(mid.z, ref.z, 1e-5f);
    EXPECT_NEAR(mid.w, ref.w, 1e-5f);
    EXPECT_NEAR(quat_length(mid), 1.0f, 1e-5f);
}

TEST(Blend, SlerpTakesShortestPath)
{
    quat a = quat_identity();
    quat b = quat_from_axis_angle(vec3{1.0f, 0.0f, 0.0f}, kPi / 2.0f);
    quat neg_b{-b.x, -b.y, -b.z, -b.w};
    quat p = slerp(a, b, 0.5f);
    quat q = slerp(a, neg_b, 0.5f);
    EXPECT_NEAR(p.x, q.x, 1e-5f);
    EXPECT_NEAR(p.w, q.w, 1e-5f);
}

TEST(Blend, SlerpNearlyIdenticalStaysNormalized)
{
    quat a = quat_identity();
    quat b = quat_from_axis_angle(vec3{0.0f, 0.0f, 1.0f}, 1e-4f);
    EXPECT_NEAR(quat_length(slerp(a, b, 0.5f)), 1.0f, 1e-5f);
}

// ─── Pre-bound tweens ───────────────────────────────────────────────────────

TEST(TweenTypes, Vec2Tween)
{
    Vec2Tween t;
    t.start(vec2{0.0f, 0.0f}, vec2{10.0f, -10.0f}, 1.0f);
    t.update(0.5f);
    EXPECT_EQ(t.current_value(), (vec2{5.0f, -5.0f}));
}

TEST(TweenTypes, Vec3TweenEased)
{
    Vec3Tween t;
    t.start(vec3{0.0f, 0.0f, 0.0f}, vec3{4.0f, 8.0f, 12.0f}, 1.0f, ease::quad_in);
    t.update(0.5f);
    EXPECT_FLOAT_EQ(t.current_value().x, 1.0f);
    EXPECT_FLOAT_EQ(t.current_value().y, 2.0f);
    EXPECT_FLOAT_EQ(t.current_value().z, 3.0f);
}

TEST(TweenTypes, Vec4Tween)
{
    Vec4Tween t;
    t.start(vec4{}, vec4{1.0f, 1.0f, 1.0f, 1.0f}, 2.0f);
    t.update(2.0f);
    EXPECT_EQ(t.current_value(), (vec4{1.0f, 1.0f, 1.0f, 1.0f}));
}

TEST(TweenTypes, ColorTweenFade)
{
    ColorTween t;
    t.start(colors::white, rgba(1.0f, 1.0f, 1.0f, 0.0f), 1.0f);
    t.update(0.25f);
    EXPECT_FLOAT_EQ(t.current_value().a, 0.75f);
    t.update(1.0f);
    EXPECT_EQ(t.current_value(), rgba(1.0f, 1.0f, 1.0f, 0.0f));
}

TEST(TweenTypes, QuatTweenRotates)
{
    QuatTween t;
    quat      end = quat_from_axis_angle(vec3{0.0f, 0.0f, 1.0f}, 2.0f * kPi / 3.0f);
    t.start(quat_identity(), end, 1.0f);
    t.update(0.5f);
    quat ref = quat_from_axis_angle(vec3{0.0f, 0.0f, 1.0f}, kPi / 3.0f);
    EXPECT_NEAR(t.current_value().z, ref.z, 1e-5f);
    EXPECT_NEAR(t.current_value().w, ref.w, 1e-5f);
}

TEST(TweenTypes, BackEasingOvershootsValue)
{
    FloatTween t;
    t.start(0.0f, 100.0f, 1.0f, ease::back_out);
    t.update(0.8f);
    EXPECT_GT(t.current_value(), 100.0f);
}

// ─── Helpers ────────────────────────────────────────────────────────────────

TEST(TweenTo, CreatesRunningTween)
{
    float target = -1.0f;
    auto  fade   = tween_to<FloatTween>(1.0f, 0.0f, 0.5f, [&](float a) { target = a; });
    ASSERT_NE(fade, nullptr);
    EXPECT_EQ(fade->state(), TweenState::Running);
    EXPECT_FLOAT_EQ(fade->current_value(), 1.0f);

    fade->update(0.25f);
    EXPECT_FLOAT_EQ(target, 0.5f);
}

TEST(TweenTo, UsesGivenEasing)
{
    vec2 pos;
    auto move = tween_to<Vec2Tween>(vec2{0.0f, 0.0f},
                                    vec2{100.0f, 0.0f},
                                    1.0f,
                                    [&](const vec2& p) { pos = p; },
                                    ease::quad_in);
    move->update(0.5f);
    EXPECT_FLOAT_EQ(pos.x, 25.0f);
}

TEST(TweenTo, NullCallbackAllowed)
{
    auto t = tween_to<FloatTween>(0.0f, 1.0f, 1.0f, nullptr);
    t->update(1.0f);
    EXPECT_TRUE(t->is_complete());
}

TEST(TweenTo, InvalidDurationThrows)
{
    EXPECT_THROW(tween_to<FloatTween>(0.0f, 1.0f, 0.0f, nullptr), std::invalid_argument);
}

TEST(TweenFrom, StartsAtFromAndSettlesOnCurrent)
{
    float y    = 20.0f;
    auto  drop = tween_from<FloatTween>(100.0f, y, 1.0f, [&](float v) { y = v; }, ease::back_out);
    EXPECT_FLOAT_EQ(drop->current_value(), 100.0f);
    EXPECT_FLOAT_EQ(drop->end_value(), 20.0f);

    drop->update(1.0f);
    EXPECT_TRUE(drop->is_complete());
    EXPECT_FLOAT_EQ(y, 20.0f);
}

TEST(MakeSequence, ChainsTweens)
{
    float value = 0.0f;
    auto  seq   = make_sequence();
    seq->append(tween_to<FloatTween>(0.0f, 1.0f, 1.0f, [&](float v) { value = v; }))
        .append(tween_to<FloatTween>(1.0f, 0.0f, 1.0f, [&](float v) { value = v; }))
        .start();

    seq->update(1.5f);
    EXPECT_FLOAT_EQ(value, 0.5f);
    seq->update(0.5f);
    EXPECT_FLOAT_EQ(value, 0.0f);
    EXPECT_TRUE(seq->is_complete());
}
