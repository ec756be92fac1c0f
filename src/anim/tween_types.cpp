#include <cmath>
#include <tweenkit/tween_types.hpp>

namespace tweenkit
{

float lerp(float a, float b, float t)
{
    return a + (b - a) * t;
}

vec2 lerp(vec2 a, vec2 b, float t)
{
    return a + (b - a) * t;
}

vec3 lerp(vec3 a, vec3 b, float t)
{
    return a + (b - a) * t;
}

vec4 lerp(vec4 a, vec4 b, float t)
{
    return a + (b - a) * t;
}

Color lerp(const Color& a, const Color& b, float t)
{
    return Color{lerp(a.r, b.r, t), lerp(a.g, b.g, t), lerp(a.b, b.b, t), lerp(a.a, b.a, t)};
}

quat slerp(quat a, quat b, float t)
{
    float dot = a.x * b.x + a.y * b.y + a.z * b.z + a.w * b.w;

    // If dot is negative, negate one quaternion to take the shorter path
    if (dot < 0.0f)
    {
        b   = {-b.x, -b.y, -b.z, -b.w};
        dot = -dot;
    }

    if (dot > 0.9995f)
    {
        quat r = {
            lerp(a.x, b.x, t),
            lerp(a.y, b.y, t),
            lerp(a.z, b.z, t),
            lerp(a.w, b.w, t),
        };
        return quat_normalize(r);
    }

    float theta     = std::acos(std::fmin(dot, 1.0f));
    float sin_theta = std::sin(theta);
    float wa        = std::sin((1.0f - t) * theta) / sin_theta;
    float wb        = std::sin(t * theta) / sin_theta;

    return {
        a.x * wa + b.x * wb,
        a.y * wa + b.y * wb,
        a.z * wa + b.z * wb,
        a.w * wa + b.w * wb,
    };
}

// ─── Pre-bound tweens ───────────────────────────────────────────────────────

FloatTween::FloatTween()
    : Tween<float>([](const float& a, const float& b, float t) { return lerp(a, b, t); })
{
}

Vec2Tween::Vec2Tween()
    : Tween<vec2>([](const vec2& a, const vec2& b, float t) { return lerp(a, b, t); })
{
}

Vec3Tween::Vec3Tween()
    : Tween<vec3>([](const vec3& a, const vec3& b, float t) { return lerp(a, b, t); })
{
}

Vec4Tween::Vec4Tween()
    : Tween<vec4>([](const vec4& a, const vec4& b, float t) { return lerp(a, b, t); })
{
}

ColorTween::ColorTween()
    : Tween<Color>([](const Color& a, const Color& b, float t) { return lerp(a, b, t); })
{
}

QuatTween::QuatTween()
    : Tween<quat>([](const quat& a, const quat& b, float t) { return slerp(a, b, t); })
{
}

}  // namespace tweenkit
