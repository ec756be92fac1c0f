#pragma once

#include <tweenkit/color.hpp>
#include <tweenkit/easing.hpp>
#include <tweenkit/fwd.hpp>
#include <tweenkit/logger.hpp>
#include <tweenkit/math.hpp>
#include <tweenkit/playable.hpp>
#include <tweenkit/sequence.hpp>
#include <tweenkit/tween.hpp>
#include <tweenkit/tween_manager.hpp>
#include <tweenkit/tween_types.hpp>

// ─── Quick start ─────────────────────────────────────────────────────────────
//
//   tweenkit::FloatTween fade;
//   fade.on_update([&](float a) { alpha = a; }).start(1.0f, 0.0f, 0.5f, tweenkit::ease::sine_out);
//
//   // each frame
//   fade.update(dt);
