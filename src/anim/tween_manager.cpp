#include <algorithm>
#include <tweenkit/logger.hpp>
#include <tweenkit/tween_manager.hpp>

namespace tweenkit
{

void TweenManager::add(std::shared_ptr<Playable> unit)
{
    if (unit)
    {
        units_.push_back(std::move(unit));
    }
}

void TweenManager::remove(const std::shared_ptr<Playable>& unit)
{
    units_.erase(std::remove(units_.begin(), units_.end(), unit), units_.end());
}

void TweenManager::update(float dt)
{
    // Snapshot: callbacks fired during the update may add or remove units.
    auto snapshot = units_;
    for (auto& unit : snapshot)
    {
        unit->update(dt);
    }

    size_t before = units_.size();
    std::erase_if(units_, [](const std::shared_ptr<Playable>& unit) { return unit->is_complete(); });
    if (units_.size() != before)
    {
        TWEENKIT_LOG_TRACE("manager", "evicted {} finished units", before - units_.size());
    }
}

void TweenManager::stop_all(StopBehavior behavior)
{
    auto snapshot = std::move(units_);
    units_.clear();
    for (auto& unit : snapshot)
    {
        unit->stop(behavior);
    }
    TWEENKIT_LOG_DEBUG("manager", "stopped {} units ({})", snapshot.size(), to_string(behavior));
}

void TweenManager::pause_all()
{
    for (auto& unit : units_)
    {
        unit->pause();
    }
}

void TweenManager::resume_all()
{
    for (auto& unit : units_)
    {
        unit->resume();
    }
}

void TweenManager::set_time_scale(float scale)
{
    for (auto& unit : units_)
    {
        unit->set_time_scale(scale);
    }
}

void TweenManager::clear()
{
    units_.clear();
}

}  // namespace tweenkit
