#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <tweenkit/logger.hpp>
#include <tweenkit/sequence.hpp>

namespace tweenkit
{

Sequence& Sequence::append(std::shared_ptr<Playable> unit)
{
    if (!unit)
    {
        TWEENKIT_LOG_WARN("sequence", "append ignored: null unit");
        return *this;
    }
    unit->set_time_scale(time_scale_);
    units_.push_back(std::move(unit));
    return *this;
}

Sequence& Sequence::start()
{
    if (units_.empty())
    {
        TWEENKIT_LOG_ERROR("sequence", "start rejected: sequence has no members");
        throw std::logic_error("Sequence::start: sequence is empty");
    }

    ++epoch_;
    current_index_ = 0;
    state_         = TweenState::Running;
    TWEENKIT_LOG_DEBUG("sequence", "start: {} members", units_.size());
    return *this;
}

Sequence& Sequence::on_complete(CompleteCallback cb)
{
    on_complete_.push_back(std::move(cb));
    return *this;
}

void Sequence::clear_callbacks()
{
    on_complete_.clear();
}

// ─── Queries ────────────────────────────────────────────────────────────────

float Sequence::progress() const
{
    if (units_.empty())
        return 0.0f;

    float active = current_index_ < units_.size() ? units_[current_index_]->progress() : 0.0f;
    return (static_cast<float>(current_index_) + active) / static_cast<float>(units_.size());
}

void Sequence::set_progress(float progress)
{
    if (units_.empty())
        return;

    float  scaled = std::clamp(progress, 0.0f, 1.0f) * static_cast<float>(units_.size());
    size_t index  = std::min(static_cast<size_t>(std::floor(scaled)), units_.size() - 1);

    ++epoch_;
    current_index_ = index;
    units_[index]->set_progress(scaled - static_cast<float>(index));
}

bool Sequence::is_complete() const
{
    return state_ == TweenState::Stopped && !units_.empty() && current_index_ >= units_.size();
}

void Sequence::set_time_scale(float scale)
{
    time_scale_ = std::max(0.0f, scale);
    for (auto& unit : units_)
    {
        unit->set_time_scale(time_scale_);
    }
}

// ─── Time ───────────────────────────────────────────────────────────────────

float Sequence::advance(float dt)
{
    if (state_ == TweenState::Stopped)
        return dt;
    if (state_ != TweenState::Running || current_index_ >= units_.size())
        return 0.0f;

    const uint64_t epoch     = epoch_;
    float          remaining = dt;

    while (current_index_ < units_.size())
    {
        // Hold a reference: a member callback may drop it from the caller's side.
        std::shared_ptr<Playable> unit = units_[current_index_];
        remaining                      = unit->advance(remaining);

        if (epoch != epoch_ || !unit->is_complete())
            return 0.0f;

        ++current_index_;
        if (current_index_ >= units_.size())
        {
            finish();
            return remaining;
        }
        TWEENKIT_LOG_TRACE("sequence", "advanced to member {}", current_index_);

        if (remaining <= 0.0f)
            return 0.0f;
    }
    return 0.0f;
}

// ─── Controls ───────────────────────────────────────────────────────────────

void Sequence::stop(StopBehavior behavior)
{
    if (behavior == StopBehavior::ForceComplete)
    {
        if (state_ == TweenState::Stopped)
            return;

        ++epoch_;
        for (auto& unit : units_)
        {
            unit->stop(StopBehavior::ForceComplete);
        }
        TWEENKIT_LOG_DEBUG("sequence", "force-completed");
        finish();
        return;
    }

    ++epoch_;
    state_ = TweenState::Stopped;
}

void Sequence::pause()
{
    if (state_ != TweenState::Running)
        return;

    ++epoch_;
    state_ = TweenState::Paused;
    if (current_index_ < units_.size())
    {
        units_[current_index_]->pause();
    }
}

void Sequence::resume()
{
    if (state_ != TweenState::Paused)
        return;

    ++epoch_;
    state_ = TweenState::Running;
    if (current_index_ < units_.size())
    {
        units_[current_index_]->resume();
    }
}

void Sequence::restart()
{
    if (units_.empty())
    {
        TWEENKIT_LOG_DEBUG("sequence", "restart ignored: sequence has no members");
        return;
    }

    ++epoch_;
    for (auto& unit : units_)
    {
        unit->restart();
    }
    current_index_ = 0;
    state_         = TweenState::Running;
}

void Sequence::reverse()
{
    TWEENKIT_LOG_ERROR("sequence", "reverse is not supported on sequences");
    throw std::logic_error("Sequence::reverse: not supported");
}

void Sequence::finish()
{
    current_index_ = units_.size();
    state_         = TweenState::Stopped;
    TWEENKIT_LOG_DEBUG("sequence", "complete");

    // Indexed so observers may register or clear observers while running.
    for (size_t i = 0; i < on_complete_.size(); ++i)
    {
        auto cb = on_complete_[i];
        if (cb)
            cb();
    }
}

}  // namespace tweenkit
