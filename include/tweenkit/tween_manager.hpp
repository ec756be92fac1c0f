#pragma once

#include <memory>
#include <tweenkit/playable.hpp>
#include <vector>

namespace tweenkit
{

// Keeps a set of playables alive and steps them together. Finished units are
// dropped after the update that completed them.
class TweenManager
{
   public:
    TweenManager()  = default;
    ~TweenManager() = default;

    TweenManager(const TweenManager&)            = delete;
    TweenManager& operator=(const TweenManager&) = delete;

    void add(std::shared_ptr<Playable> unit);
    void remove(const std::shared_ptr<Playable>& unit);

    // Advance every unit by dt, then evict the completed ones.
    void update(float dt);

    // Stop every unit with the given behavior and forget them.
    void stop_all(StopBehavior behavior = StopBehavior::AsIs);

    void pause_all();
    void resume_all();

    // Assigns the scale to every unit currently managed.
    void set_time_scale(float scale);

    void   clear();
    size_t size() const { return units_.size(); }
    bool   empty() const { return units_.empty(); }

   private:
    std::vector<std::shared_ptr<Playable>> units_;
};

}  // namespace tweenkit
