#pragma once

#include <string_view>

namespace tweenkit
{

enum class TweenState
{
    Delayed,   // Waiting out the start delay
    Running,
    Paused,
    Stopped,   // Never started, stopped early, or finished
};

enum class StopBehavior
{
    AsIs,            // Freeze at the current value, no notification
    ForceComplete,   // Snap to the end and fire completion
};

enum class LoopType
{
    None,
    Restart,    // Replay from the start value
    PingPong,   // Swap endpoints every iteration
    Yoyo,       // Mirror progress every iteration, endpoints unchanged
};

std::string_view to_string(TweenState state);
std::string_view to_string(StopBehavior behavior);
std::string_view to_string(LoopType type);

// Playable — the playback-control contract shared by Tween<T> and Sequence.
//
// Hosts drive a playable by calling update() once per frame with the elapsed
// seconds since the previous frame. Controls that have no effect in the
// current state are no-ops.
class Playable
{
   public:
    virtual ~Playable() = default;

    // ─── Queries ────────────────────────────────────────────────────────

    virtual TweenState state() const = 0;

    // Normalized progress in [0,1].
    virtual float progress() const = 0;

    // Seek without changing state.
    virtual void set_progress(float progress) = 0;

    // True once the unit reached its end and stopped (not stopped early).
    virtual bool is_complete() const = 0;

    virtual float time_scale() const = 0;

    // Multiplier on incoming deltas. 0 freezes; negative values clamp to 0.
    virtual void set_time_scale(float scale) = 0;

    // ─── Time ───────────────────────────────────────────────────────────

    // Advance by dt seconds. Returns the part of dt that was not consumed:
    // the overshoot when the unit finished inside this call, all of dt when
    // the unit is already stopped, 0 otherwise.
    virtual float advance(float dt) = 0;

    void update(float dt) { advance(dt); }

    // ─── Controls ───────────────────────────────────────────────────────

    virtual void stop(StopBehavior behavior = StopBehavior::AsIs) = 0;
    virtual void pause()                                        = 0;
    virtual void resume()                                       = 0;
    virtual void restart()                                      = 0;
    virtual void reverse()                                      = 0;

    bool is_running() const { return state() == TweenState::Running; }
    bool is_paused() const { return state() == TweenState::Paused; }
};

}  // namespace tweenkit
