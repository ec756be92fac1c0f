#pragma once

#include <functional>
#include <span>
#include <string_view>

namespace tweenkit
{

// Plain catalog entry: normalized progress in, shaped progress out.
using EasingFn = float (*)(float);

// Any callable with the same shape, including stateful objects (CubicBezier).
using EasingFunc = std::function<float(float)>;

namespace ease
{
float linear(float t);

float quad_in(float t);
float quad_out(float t);
float quad_in_out(float t);

float cubic_in(float t);
float cubic_out(float t);
float cubic_in_out(float t);

float quart_in(float t);
float quart_out(float t);
float quart_in_out(float t);

float quint_in(float t);
float quint_out(float t);
float quint_in_out(float t);

float sine_in(float t);
float sine_out(float t);
float sine_in_out(float t);

// t == 0 and t == 1 map exactly to 0 and 1.
float expo_in(float t);
float expo_out(float t);
float expo_in_out(float t);

float circ_in(float t);
float circ_out(float t);
float circ_in_out(float t);

float elastic_in(float t);
float elastic_out(float t);
float elastic_in_out(float t);

// Overshoots below 0 / above 1 near the ends.
float back_in(float t);
float back_out(float t);
float back_in_out(float t);

float bounce_in(float t);
float bounce_out(float t);
float bounce_in_out(float t);

float smoothstep(float t);
float smootherstep(float t);

// Cubic-bezier easing factory (returns a stateless function object)
struct CubicBezier
{
    float x1, y1, x2, y2;
    float operator()(float t) const;
};

// Common presets
inline constexpr CubicBezier ease_out_cubic_bezier{0.215f, 0.61f, 0.355f, 1.0f};
inline constexpr CubicBezier ease_in_out_cubic_bezier{0.645f, 0.045f, 0.355f, 1.0f};

struct NamedEasing
{
    std::string_view name;
    EasingFn         fn;
};

// Every catalog function, grouped by family.
std::span<const NamedEasing> catalog();

// Catalog lookup by name ("quad_in_out"); nullptr when unknown.
EasingFn by_name(std::string_view name);
}  // namespace ease

}  // namespace tweenkit
