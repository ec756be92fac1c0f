#pragma once

namespace tweenkit
{

class Playable;
template <typename T>
class Tween;
class Sequence;
class TweenManager;
class Logger;

class FloatTween;
class Vec2Tween;
class Vec3Tween;
class Vec4Tween;
class ColorTween;
class QuatTween;

struct TweenOptions;
struct Color;
struct vec2;
struct vec3;
struct vec4;
struct quat;

enum class TweenState;
enum class StopBehavior;
enum class LoopType;

}  // namespace tweenkit
