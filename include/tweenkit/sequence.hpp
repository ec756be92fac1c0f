#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <tweenkit/playable.hpp>
#include <vector>

namespace tweenkit
{

// Sequence — plays an ordered list of playables strictly one at a time.
//
// Members are usually tweens that have already been start()ed; the sequence
// only routes time to the member at current_index() and moves on when that
// member reports completion. Time left over when a member finishes mid-frame
// is handed to the next member in the same update. Sequences nest.
class Sequence : public Playable
{
   public:
    using CompleteCallback = std::function<void()>;

    Sequence()           = default;
    ~Sequence() override = default;

    Sequence(const Sequence&)            = delete;
    Sequence& operator=(const Sequence&) = delete;

    // Adds to the end and hands it the sequence's current time scale.
    // Null units are ignored.
    Sequence& append(std::shared_ptr<Playable> unit);

    // Throws std::logic_error when there are no members.
    Sequence& start();

    Sequence& on_complete(CompleteCallback cb);
    void      clear_callbacks();

    // ─── Queries ────────────────────────────────────────────────────────

    size_t size() const { return units_.size(); }
    bool   empty() const { return units_.empty(); }

    // Equals size() exactly when the sequence has completed.
    size_t current_index() const { return current_index_; }

    const std::shared_ptr<Playable>& at(size_t index) const { return units_.at(index); }

    // ─── Playable ───────────────────────────────────────────────────────

    TweenState state() const override { return state_; }

    // Approximate: (current_index + member progress) / size.
    float progress() const override;

    // Seeks only the member the target falls into; earlier members are not
    // fast-forwarded.
    void set_progress(float progress) override;

    bool  is_complete() const override;
    float time_scale() const override { return time_scale_; }
    void  set_time_scale(float scale) override;

    float advance(float dt) override;

    void stop(StopBehavior behavior = StopBehavior::AsIs) override;

    // Only the member at current_index() is paused/resumed.
    void pause() override;
    void resume() override;

    void restart() override;

    // Unsupported: always throws std::logic_error.
    void reverse() override;

   private:
    std::vector<std::shared_ptr<Playable>> units_;
    std::vector<CompleteCallback>          on_complete_;

    size_t     current_index_ = 0;
    TweenState state_         = TweenState::Stopped;
    float      time_scale_    = 1.0f;
    uint64_t   epoch_         = 0;

    void finish();
};

}  // namespace tweenkit
