#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <utility>
#include <vector>
#include <tweenkit/easing.hpp>
#include <tweenkit/logger.hpp>
#include <tweenkit/playable.hpp>

namespace tweenkit
{

// Tween settings that can be applied in one call with Tween::configure().
struct TweenOptions
{
    float      delay      = 0.0f;
    LoopType   loop_type  = LoopType::None;
    int        loop_count = 0;      // -1 = infinite
    float      time_scale = 1.0f;
    EasingFunc easing;              // Empty keeps the current easing
};

// Tween<T> — interpolates between two values of T over a duration.
//
// The value type is opaque to the engine: a blend function supplied at
// construction combines start, end and eased progress into a T. The blend must
// accept progress outside [0,1] (back/elastic easings overshoot).
//
//   FloatTween t;
//   t.set_delay(0.5f).on_update([](float v) { ... }).start(0.0f, 100.0f, 2.0f, ease::quad_in_out);
//   t.update(dt);   // once per frame
//
// Observers registered with on_start/on_update/on_loop/on_complete run
// synchronously in registration order and may call back into the tween.
template <typename T>
class Tween : public Playable
{
   public:
    using value_type       = T;
    using BlendFunc        = std::function<T(const T& start, const T& end, float t)>;
    using StartCallback    = std::function<void()>;
    using UpdateCallback   = std::function<void(const T& value)>;
    using LoopCallback     = std::function<void()>;
    using CompleteCallback = std::function<void()>;

    explicit Tween(BlendFunc blend);
    ~Tween() override = default;

    Tween(const Tween&)            = delete;
    Tween& operator=(const Tween&) = delete;

    // ─── Start ──────────────────────────────────────────────────────────

    // Begin a new run. Throws std::invalid_argument when duration <= 0, in
    // which case nothing about the tween changes.
    Tween& start(T start_value, T end_value, float duration);
    Tween& start(T start_value, T end_value, float duration, EasingFunc easing);

    // ─── Configuration ──────────────────────────────────────────────────

    // Applied at the next start()/restart().
    Tween& set_delay(float seconds);

    // count: -1 = infinite, 0 = play once, N = N extra iterations.
    Tween& set_loop(LoopType type, int count);

    // Empty function selects linear.
    Tween& set_easing(EasingFunc easing);

    Tween& configure(const TweenOptions& options);

    // ─── Notifications ──────────────────────────────────────────────────

    Tween& on_start(StartCallback cb);
    Tween& on_update(UpdateCallback cb);
    Tween& on_loop(LoopCallback cb);
    Tween& on_complete(CompleteCallback cb);
    void   clear_callbacks();

    // ─── Queries ────────────────────────────────────────────────────────

    const T& current_value() const { return current_; }
    const T& start_value() const { return start_; }
    const T& end_value() const { return end_; }

    float    duration() const { return duration_; }
    float    elapsed() const { return elapsed_; }
    float    delay() const { return delay_; }
    float    delay_remaining() const { return delay_remaining_; }
    LoopType loop_type() const { return loop_type_; }
    int      loop_count() const { return loop_count_; }
    int      loops_remaining() const { return loops_remaining_; }
    bool     is_reversed_phase() const { return reversed_phase_; }

    // ─── Playable ───────────────────────────────────────────────────────

    TweenState state() const override { return state_; }
    float      progress() const override;
    void       set_progress(float progress) override;
    bool       is_complete() const override;
    float      time_scale() const override { return time_scale_; }
    void       set_time_scale(float scale) override;

    float advance(float dt) override;

    void stop(StopBehavior behavior = StopBehavior::AsIs) override;
    void pause() override;
    void resume() override;
    void restart() override;
    void reverse() override;

   private:
    BlendFunc  blend_;
    EasingFunc easing_ = ease::linear;

    T start_{};
    T end_{};
    T current_{};

    float duration_        = 0.0f;   // 0 until the first successful start()
    float elapsed_         = 0.0f;
    float delay_           = 0.0f;
    float delay_remaining_ = 0.0f;
    float time_scale_      = 1.0f;

    TweenState state_           = TweenState::Stopped;
    LoopType   loop_type_       = LoopType::None;
    int        loop_count_      = 0;
    int        loops_remaining_ = 0;
    bool       reversed_phase_  = false;

    // Bumped by every control call; an update that sees it change while
    // notifying stops touching state the callback now owns.
    uint64_t epoch_ = 0;

    std::vector<StartCallback>    on_start_;
    std::vector<UpdateCallback>   on_update_;
    std::vector<LoopCallback>     on_loop_;
    std::vector<CompleteCallback> on_complete_;

    bool  has_run() const { return duration_ > 0.0f; }
    void  begin_run();
    void  evaluate();
    float step(float scaled_dt);
    float finish_iteration(float overshoot);

    template <typename Callbacks, typename... Args>
    static void notify(const Callbacks& callbacks, const Args&... args)
    {
        // Indexed so observers may register or clear observers while running.
        for (size_t i = 0; i < callbacks.size(); ++i)
        {
            auto cb = callbacks[i];
            if (cb)
                cb(args...);
        }
    }
};

// ─── Implementation ─────────────────────────────────────────────────────────

template <typename T>
Tween<T>::Tween(BlendFunc blend) : blend_(std::move(blend))
{
    if (!blend_)
    {
        TWEENKIT_LOG_ERROR("tween", "Tween constructed without a blend function");
        throw std::invalid_argument("Tween: blend function must not be empty");
    }
}

template <typename T>
Tween<T>& Tween<T>::start(T start_value, T end_value, float duration)
{
    // NaN fails this check too.
    if (!(duration > 0.0f))
    {
        TWEENKIT_LOG_ERROR("tween", "start rejected: duration {} is not positive", duration);
        throw std::invalid_argument("Tween::start: duration must be positive");
    }

    ++epoch_;
    start_    = std::move(start_value);
    end_      = std::move(end_value);
    duration_ = duration;
    begin_run();

    TWEENKIT_LOG_DEBUG("tween",
                       "start: duration={} delay={} loop={} x{}",
                       duration_,
                       delay_,
                       to_string(loop_type_),
                       loop_count_);

    if (state_ == TweenState::Running)
    {
        notify(on_start_);
    }
    return *this;
}

template <typename T>
Tween<T>& Tween<T>::start(T start_value, T end_value, float duration, EasingFunc easing)
{
    if (!(duration > 0.0f))
    {
        TWEENKIT_LOG_ERROR("tween", "start rejected: duration {} is not positive", duration);
        throw std::invalid_argument("Tween::start: duration must be positive");
    }
    easing_ = easing ? std::move(easing) : EasingFunc(ease::linear);
    return start(std::move(start_value), std::move(end_value), duration);
}

template <typename T>
Tween<T>& Tween<T>::set_delay(float seconds)
{
    delay_ = std::max(0.0f, seconds);
    return *this;
}

template <typename T>
Tween<T>& Tween<T>::set_loop(LoopType type, int count)
{
    loop_type_       = type;
    loop_count_      = std::max(-1, count);
    loops_remaining_ = loop_count_;
    if (has_run())
    {
        evaluate();
    }
    return *this;
}

template <typename T>
Tween<T>& Tween<T>::set_easing(EasingFunc easing)
{
    easing_ = easing ? std::move(easing) : EasingFunc(ease::linear);
    if (has_run())
    {
        evaluate();
    }
    return *this;
}

template <typename T>
Tween<T>& Tween<T>::configure(const TweenOptions& options)
{
    set_delay(options.delay);
    set_loop(options.loop_type, options.loop_count);
    set_time_scale(options.time_scale);
    if (options.easing)
    {
        set_easing(options.easing);
    }
    return *this;
}

template <typename T>
Tween<T>& Tween<T>::on_start(StartCallback cb)
{
    on_start_.push_back(std::move(cb));
    return *this;
}

template <typename T>
Tween<T>& Tween<T>::on_update(UpdateCallback cb)
{
    on_update_.push_back(std::move(cb));
    return *this;
}

template <typename T>
Tween<T>& Tween<T>::on_loop(LoopCallback cb)
{
    on_loop_.push_back(std::move(cb));
    return *this;
}

template <typename T>
Tween<T>& Tween<T>::on_complete(CompleteCallback cb)
{
    on_complete_.push_back(std::move(cb));
    return *this;
}

template <typename T>
void Tween<T>::clear_callbacks()
{
    on_start_.clear();
    on_update_.clear();
    on_loop_.clear();
    on_complete_.clear();
}

template <typename T>
float Tween<T>::progress() const
{
    return duration_ > 0.0f ? elapsed_ / duration_ : 0.0f;
}

template <typename T>
void Tween<T>::set_progress(float progress)
{
    if (!has_run())
        return;
    ++epoch_;
    elapsed_ = std::clamp(progress, 0.0f, 1.0f) * duration_;
    evaluate();
}

template <typename T>
bool Tween<T>::is_complete() const
{
    return state_ == TweenState::Stopped && has_run() && elapsed_ >= duration_;
}

template <typename T>
void Tween<T>::set_time_scale(float scale)
{
    time_scale_ = std::max(0.0f, scale);
}

template <typename T>
float Tween<T>::advance(float dt)
{
    if (state_ == TweenState::Stopped)
        return dt;
    if (state_ == TweenState::Paused || time_scale_ <= 0.0f || dt <= 0.0f)
        return 0.0f;

    // A callback run by step() may change the scale.
    const float scale  = time_scale_;
    float       unused = step(dt * scale);
    return unused / scale;
}

template <typename T>
void Tween<T>::stop(StopBehavior behavior)
{
    if (behavior == StopBehavior::ForceComplete)
    {
        if (state_ == TweenState::Stopped)
            return;

        ++epoch_;
        elapsed_         = duration_;
        delay_remaining_ = 0.0f;
        evaluate();
        state_ = TweenState::Stopped;
        TWEENKIT_LOG_DEBUG("tween", "force-completed");
        notify(on_complete_);
        return;
    }

    ++epoch_;
    state_ = TweenState::Stopped;
}

template <typename T>
void Tween<T>::pause()
{
    if (state_ != TweenState::Running && state_ != TweenState::Delayed)
        return;
    ++epoch_;
    state_ = TweenState::Paused;
}

template <typename T>
void Tween<T>::resume()
{
    if (state_ != TweenState::Paused)
        return;
    ++epoch_;
    state_ = delay_remaining_ > 0.0f ? TweenState::Delayed : TweenState::Running;
}

template <typename T>
void Tween<T>::restart()
{
    if (!has_run())
    {
        TWEENKIT_LOG_DEBUG("tween", "restart ignored: tween was never started");
        return;
    }
    ++epoch_;
    begin_run();
}

template <typename T>
void Tween<T>::reverse()
{
    if (!has_run())
        return;
    ++epoch_;
    std::swap(start_, end_);
    elapsed_ = duration_ - elapsed_;
    evaluate();
}

template <typename T>
void Tween<T>::begin_run()
{
    elapsed_         = 0.0f;
    delay_remaining_ = delay_;
    loops_remaining_ = loop_count_;
    reversed_phase_  = false;
    state_           = delay_ > 0.0f ? TweenState::Delayed : TweenState::Running;
    evaluate();
}

template <typename T>
void Tween<T>::evaluate()
{
    float t = duration_ > 0.0f ? elapsed_ / duration_ : 0.0f;
    if (loop_type_ == LoopType::Yoyo && reversed_phase_)
    {
        t = 1.0f - t;
    }
    current_ = blend_(start_, end_, easing_(t));
}

template <typename T>
float Tween<T>::step(float dt)
{
    const uint64_t epoch = epoch_;

    if (state_ == TweenState::Delayed)
    {
        delay_remaining_ -= dt;
        if (delay_remaining_ > 0.0f)
            return 0.0f;

        // The part of dt past the delay still counts toward this frame.
        dt               = -delay_remaining_;
        delay_remaining_ = 0.0f;
        state_           = TweenState::Running;
        notify(on_start_);
        if (epoch != epoch_)
            return 0.0f;
    }

    elapsed_ += dt;
    float overshoot = 0.0f;
    bool  reached   = elapsed_ >= duration_;
    if (reached)
    {
        overshoot = elapsed_ - duration_;
        elapsed_  = duration_;
    }
    evaluate();
    notify(on_update_, current_);

    if (!reached || epoch != epoch_)
        return 0.0f;
    return finish_iteration(overshoot);
}

template <typename T>
float Tween<T>::finish_iteration(float overshoot)
{
    if (loop_type_ != LoopType::None && (loop_count_ == -1 || loops_remaining_ > 0))
    {
        if (loop_count_ != -1)
        {
            --loops_remaining_;
        }
        elapsed_ = 0.0f;
        switch (loop_type_)
        {
            case LoopType::Restart:
                reversed_phase_ = false;
                break;
            case LoopType::PingPong:
                reversed_phase_ = !reversed_phase_;
                std::swap(start_, end_);
                break;
            case LoopType::Yoyo:
                reversed_phase_ = !reversed_phase_;
                break;
            case LoopType::None:
                break;
        }
        evaluate();
        TWEENKIT_LOG_TRACE("tween", "loop: {} remaining", loops_remaining_);
        notify(on_loop_);
        return 0.0f;
    }

    state_ = TweenState::Stopped;
    TWEENKIT_LOG_TRACE("tween", "complete");
    notify(on_complete_);
    return overshoot;
}

}  // namespace tweenkit
