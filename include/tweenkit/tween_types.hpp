#pragma once

#include <memory>
#include <tweenkit/color.hpp>
#include <tweenkit/math.hpp>
#include <tweenkit/sequence.hpp>
#include <tweenkit/tween.hpp>

namespace tweenkit
{

// ─── Blend functions ────────────────────────────────────────────────────────
// Total over any t so overshooting easings extrapolate instead of failing.

float lerp(float a, float b, float t);
vec2  lerp(vec2 a, vec2 b, float t);
vec3  lerp(vec3 a, vec3 b, float t);
vec4  lerp(vec4 a, vec4 b, float t);

// Per channel, alpha included.
Color lerp(const Color& a, const Color& b, float t);

// Shortest-path spherical interpolation; normalized lerp when the two
// rotations are nearly identical.
quat slerp(quat a, quat b, float t);

// ─── Pre-bound tweens ───────────────────────────────────────────────────────

class FloatTween : public Tween<float>
{
   public:
    FloatTween();
};

class Vec2Tween : public Tween<vec2>
{
   public:
    Vec2Tween();
};

class Vec3Tween : public Tween<vec3>
{
   public:
    Vec3Tween();
};

class Vec4Tween : public Tween<vec4>
{
   public:
    Vec4Tween();
};

class ColorTween : public Tween<Color>
{
   public:
    ColorTween();
};

class QuatTween : public Tween<quat>
{
   public:
    QuatTween();
};

// ─── Helpers ────────────────────────────────────────────────────────────────

// Create, wire and start a tween in one call:
//   auto fade = tween_to<FloatTween>(1.0f, 0.0f, 0.3f, [&](float a) { alpha = a; });
template <typename TweenT>
std::shared_ptr<TweenT> tween_to(typename TweenT::value_type     start_value,
                                 typename TweenT::value_type     end_value,
                                 float                           duration,
                                 typename TweenT::UpdateCallback on_update,
                                 EasingFunc                      easing = ease::linear)
{
    auto tween = std::make_shared<TweenT>();
    if (on_update)
    {
        tween->on_update(std::move(on_update));
    }
    tween->start(std::move(start_value), std::move(end_value), duration, std::move(easing));
    return tween;
}

// Mirror of tween_to for "animate in" effects: plays from from_value back to
// the value the target currently holds.
//   auto drop = tween_from<FloatTween>(-50.0f, y, 0.4f, [&](float v) { y = v; }, ease::bounce_out);
template <typename TweenT>
std::shared_ptr<TweenT> tween_from(typename TweenT::value_type     from_value,
                                   typename TweenT::value_type     current_value,
                                   float                           duration,
                                   typename TweenT::UpdateCallback on_update,
                                   EasingFunc                      easing = ease::linear)
{
    return tween_to<TweenT>(std::move(from_value),
                            std::move(current_value),
                            duration,
                            std::move(on_update),
                            std::move(easing));
}

inline std::shared_ptr<Sequence> make_sequence()
{
    return std::make_shared<Sequence>();
}

}  // namespace tweenkit
