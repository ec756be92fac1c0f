#include <algorithm>
#include <array>
#include <cmath>
#include <tweenkit/easing.hpp>

namespace tweenkit::ease
{

namespace
{
constexpr float PI = 3.14159265358979323846f;

constexpr float BACK_S       = 1.70158f;
constexpr float BACK_S_INOUT = BACK_S * 1.525f;

constexpr float ELASTIC_C4 = (2.0f * PI) / 3.0f;
constexpr float ELASTIC_C5 = (2.0f * PI) / 4.5f;
}  // anonymous namespace

float linear(float t)
{
    return t;
}

// ─── Polynomial ─────────────────────────────────────────────────────────────

float quad_in(float t)
{
    return t * t;
}

float quad_out(float t)
{
    return t * (2.0f - t);
}

float quad_in_out(float t)
{
    return (t < 0.5f) ? 2.0f * t * t : -1.0f + (4.0f - 2.0f * t) * t;
}

float cubic_in(float t)
{
    return t * t * t;
}

float cubic_out(float t)
{
    float u = t - 1.0f;
    return u * u * u + 1.0f;
}

float cubic_in_out(float t)
{
    if (t < 0.5f)
    {
        return 4.0f * t * t * t;
    }
    float u = 2.0f * t - 2.0f;
    return 0.5f * u * u * u + 1.0f;
}

float quart_in(float t)
{
    return t * t * t * t;
}

float quart_out(float t)
{
    float u = t - 1.0f;
    return 1.0f - u * u * u * u;
}

float quart_in_out(float t)
{
    if (t < 0.5f)
    {
        return 8.0f * t * t * t * t;
    }
    float u = t - 1.0f;
    return 1.0f - 8.0f * u * u * u * u;
}

float quint_in(float t)
{
    return t * t * t * t * t;
}

float quint_out(float t)
{
    float u = t - 1.0f;
    return 1.0f + u * u * u * u * u;
}

float quint_in_out(float t)
{
    if (t < 0.5f)
    {
        return 16.0f * t * t * t * t * t;
    }
    float u = t - 1.0f;
    return 1.0f + 16.0f * u * u * u * u * u;
}

// ─── Sine ───────────────────────────────────────────────────────────────────

float sine_in(float t)
{
    return 1.0f - std::cos(t * PI * 0.5f);
}

float sine_out(float t)
{
    return std::sin(t * PI * 0.5f);
}

float sine_in_out(float t)
{
    return 0.5f * (1.0f - std::cos(t * PI));
}

// ─── Exponential ────────────────────────────────────────────────────────────

float expo_in(float t)
{
    if (t == 0.0f)
        return 0.0f;
    if (t == 1.0f)
        return 1.0f;
    return std::pow(2.0f, 10.0f * (t - 1.0f));
}

float expo_out(float t)
{
    if (t == 0.0f)
        return 0.0f;
    if (t == 1.0f)
        return 1.0f;
    return 1.0f - std::pow(2.0f, -10.0f * t);
}

float expo_in_out(float t)
{
    if (t == 0.0f)
        return 0.0f;
    if (t == 1.0f)
        return 1.0f;
    if (t < 0.5f)
    {
        return 0.5f * std::pow(2.0f, 20.0f * t - 10.0f);
    }
    return 1.0f - 0.5f * std::pow(2.0f, -20.0f * t + 10.0f);
}

// ─── Circular ───────────────────────────────────────────────────────────────
// Radicands are floored at zero so out-of-range progress stays finite.

float circ_in(float t)
{
    return 1.0f - std::sqrt(std::max(0.0f, 1.0f - t * t));
}

float circ_out(float t)
{
    return std::sqrt(std::max(0.0f, (2.0f - t) * t));
}

float circ_in_out(float t)
{
    if (t < 0.5f)
    {
        return 0.5f * (1.0f - std::sqrt(std::max(0.0f, 1.0f - 4.0f * t * t)));
    }
    return 0.5f * (std::sqrt(std::max(0.0f, -(2.0f * t - 3.0f) * (2.0f * t - 1.0f))) + 1.0f);
}

// ─── Elastic ────────────────────────────────────────────────────────────────

float elastic_in(float t)
{
    if (t == 0.0f || t == 1.0f)
        return t;
    return -std::pow(2.0f, 10.0f * t - 10.0f) * std::sin((t * 10.0f - 10.75f) * ELASTIC_C4);
}

float elastic_out(float t)
{
    if (t == 0.0f || t == 1.0f)
        return t;
    return std::pow(2.0f, -10.0f * t) * std::sin((t * 10.0f - 0.75f) * ELASTIC_C4) + 1.0f;
}

float elastic_in_out(float t)
{
    if (t == 0.0f || t == 1.0f)
        return t;
    if (t < 0.5f)
    {
        return -0.5f * std::pow(2.0f, 20.0f * t - 10.0f) *
               std::sin((20.0f * t - 11.125f) * ELASTIC_C5);
    }
    return 0.5f * std::pow(2.0f, -20.0f * t + 10.0f) *
               std::sin((20.0f * t - 11.125f) * ELASTIC_C5) +
           1.0f;
}

// ─── Back ───────────────────────────────────────────────────────────────────

float back_in(float t)
{
    return t * t * ((BACK_S + 1.0f) * t - BACK_S);
}

float back_out(float t)
{
    float u = t - 1.0f;
    return u * u * ((BACK_S + 1.0f) * u + BACK_S) + 1.0f;
}

float back_in_out(float t)
{
    float u = 2.0f * t;
    if (u < 1.0f)
    {
        return 0.5f * (u * u * ((BACK_S_INOUT + 1.0f) * u - BACK_S_INOUT));
    }
    u -= 2.0f;
    return 0.5f * (u * u * ((BACK_S_INOUT + 1.0f) * u + BACK_S_INOUT) + 2.0f);
}

// ─── Bounce ─────────────────────────────────────────────────────────────────

float bounce_out(float t)
{
    constexpr float n1 = 7.5625f;
    constexpr float d1 = 2.75f;

    if (t < 1.0f / d1)
    {
        return n1 * t * t;
    }
    else if (t < 2.0f / d1)
    {
        t -= 1.5f / d1;
        return n1 * t * t + 0.75f;
    }
    else if (t < 2.5f / d1)
    {
        t -= 2.25f / d1;
        return n1 * t * t + 0.9375f;
    }
    else
    {
        t -= 2.625f / d1;
        return n1 * t * t + 0.984375f;
    }
}

float bounce_in(float t)
{
    return 1.0f - bounce_out(1.0f - t);
}

float bounce_in_out(float t)
{
    if (t < 0.5f)
    {
        return 0.5f * (1.0f - bounce_out(1.0f - 2.0f * t));
    }
    return 0.5f * (1.0f + bounce_out(2.0f * t - 1.0f));
}

// ─── Smoothstep ─────────────────────────────────────────────────────────────

float smoothstep(float t)
{
    return t * t * (3.0f - 2.0f * t);
}

float smootherstep(float t)
{
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

// ─── Cubic bezier ───────────────────────────────────────────────────────────

float CubicBezier::operator()(float t) const
{
    // Solve cubic bezier using Newton-Raphson iteration
    // Find parameter u such that bezier_x(u) == t, then return bezier_y(u)
    if (t <= 0.0f)
        return 0.0f;
    if (t >= 1.0f)
        return 1.0f;

    float u = t;  // initial guess
    for (int i = 0; i < 8; ++i)
    {
        float u2   = u * u;
        float u3   = u2 * u;
        float inv  = 1.0f - u;
        float inv2 = inv * inv;

        float bx = 3.0f * inv2 * u * x1 + 3.0f * inv * u2 * x2 + u3;
        float dx = 3.0f * inv2 * x1 + 6.0f * inv * u * (x2 - x1) + 3.0f * u2 * (1.0f - x2);

        if (std::abs(dx) < 1e-7f)
            break;
        u -= (bx - t) / dx;
        u = std::clamp(u, 0.0f, 1.0f);
    }

    float inv  = 1.0f - u;
    float inv2 = inv * inv;
    float u2   = u * u;
    return 3.0f * inv2 * u * y1 + 3.0f * inv * u2 * y2 + u2 * u;
}

// ─── Catalog ────────────────────────────────────────────────────────────────

namespace
{
constexpr std::array<NamedEasing, 33> CATALOG{{
    {"linear", linear},
    {"quad_in", quad_in},
    {"quad_out", quad_out},
    {"quad_in_out", quad_in_out},
    {"cubic_in", cubic_in},
    {"cubic_out", cubic_out},
    {"cubic_in_out", cubic_in_out},
    {"quart_in", quart_in},
    {"quart_out", quart_out},
    {"quart_in_out", quart_in_out},
    {"quint_in", quint_in},
    {"quint_out", quint_out},
    {"quint_in_out", quint_in_out},
    {"sine_in", sine_in},
    {"sine_out", sine_out},
    {"sine_in_out", sine_in_out},
    {"expo_in", expo_in},
    {"expo_out", expo_out},
    {"expo_in_out", expo_in_out},
    {"circ_in", circ_in},
    {"circ_out", circ_out},
    {"circ_in_out", circ_in_out},
    {"elastic_in", elastic_in},
    {"elastic_out", elastic_out},
    {"elastic_in_out", elastic_in_out},
    {"back_in", back_in},
    {"back_out", back_out},
    {"back_in_out", back_in_out},
    {"bounce_in", bounce_in},
    {"bounce_out", bounce_out},
    {"bounce_in_out", bounce_in_out},
    {"smoothstep", smoothstep},
    {"smootherstep", smootherstep},
}};
}  // anonymous namespace

std::span<const NamedEasing> catalog()
{
    return CATALOG;
}

EasingFn by_name(std::string_view name)
{
    for (const auto& entry : CATALOG)
    {
        if (entry.name == name)
            return entry.fn;
    }
    return nullptr;
}

}  // namespace tweenkit::ease
