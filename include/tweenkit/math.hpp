#pragma once

#include <cmath>

namespace tweenkit
{

// ─── vec2 ────────────────────────────────────────────────────────────────────

struct vec2
{
    float x = 0.0f, y = 0.0f;

    constexpr vec2() = default;
    constexpr vec2(float x_, float y_) : x(x_), y(y_) {}

    constexpr vec2 operator+(vec2 b) const { return {x + b.x, y + b.y}; }
    constexpr vec2 operator-(vec2 b) const { return {x - b.x, y - b.y}; }
    constexpr vec2 operator*(float s) const { return {x * s, y * s}; }

    constexpr bool operator==(vec2 b) const { return x == b.x && y == b.y; }
    constexpr bool operator!=(vec2 b) const { return !(*this == b); }
};

// ─── vec3 ────────────────────────────────────────────────────────────────────

struct vec3
{
    float x = 0.0f, y = 0.0f, z = 0.0f;

    constexpr vec3() = default;
    constexpr vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    constexpr vec3 operator+(vec3 b) const { return {x + b.x, y + b.y, z + b.z}; }
    constexpr vec3 operator-(vec3 b) const { return {x - b.x, y - b.y, z - b.z}; }
    constexpr vec3 operator*(float s) const { return {x * s, y * s, z * s}; }

    constexpr bool operator==(vec3 b) const { return x == b.x && y == b.y && z == b.z; }
    constexpr bool operator!=(vec3 b) const { return !(*this == b); }
};

// ─── vec4 ────────────────────────────────────────────────────────────────────

struct vec4
{
    float x = 0.0f, y = 0.0f, z = 0.0f, w = 0.0f;

    constexpr vec4() = default;
    constexpr vec4(float x_, float y_, float z_, float w_) : x(x_), y(y_), z(z_), w(w_) {}

    constexpr vec4 operator+(vec4 b) const { return {x + b.x, y + b.y, z + b.z, w + b.w}; }
    constexpr vec4 operator-(vec4 b) const { return {x - b.x, y - b.y, z - b.z, w - b.w}; }
    constexpr vec4 operator*(float s) const { return {x * s, y * s, z * s, w * s}; }

    constexpr bool operator==(vec4 b) const
    {
        return x == b.x && y == b.y && z == b.z && w == b.w;
    }
    constexpr bool operator!=(vec4 b) const { return !(*this == b); }
};

// ─── quat ────────────────────────────────────────────────────────────────────
// Quaternion: x, y, z (imaginary), w (real). Identity = {0, 0, 0, 1}.

struct quat
{
    float x = 0.0f, y = 0.0f, z = 0.0f, w = 1.0f;

    constexpr quat() = default;
    constexpr quat(float x_, float y_, float z_, float w_) : x(x_), y(y_), z(z_), w(w_) {}

    constexpr bool operator==(quat b) const
    {
        return x == b.x && y == b.y && z == b.z && w == b.w;
    }
    constexpr bool operator!=(quat b) const { return !(*this == b); }
};

inline constexpr quat quat_identity()
{
    return {0.0f, 0.0f, 0.0f, 1.0f};
}

inline float quat_length(quat q)
{
    return std::sqrt(q.x * q.x + q.y * q.y + q.z * q.z + q.w * q.w);
}

inline quat quat_normalize(quat q)
{
    float len = quat_length(q);
    if (len < 1e-12f)
        return quat_identity();
    float inv = 1.0f / len;
    return {q.x * inv, q.y * inv, q.z * inv, q.w * inv};
}

inline quat quat_from_axis_angle(vec3 axis, float angle_rad)
{
    float len = std::sqrt(axis.x * axis.x + axis.y * axis.y + axis.z * axis.z);
    if (len < 1e-12f)
        return quat_identity();
    vec3  n    = axis * (1.0f / len);
    float half = angle_rad * 0.5f;
    float s    = std::sin(half);
    return {n.x * s, n.y * s, n.z * s, std::cos(half)};
}

}  // namespace tweenkit
