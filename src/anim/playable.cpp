#include <tweenkit/playable.hpp>

namespace tweenkit
{

std::string_view to_string(TweenState state)
{
    switch (state)
    {
        case TweenState::Delayed:
            return "Delayed";
        case TweenState::Running:
            return "Running";
        case TweenState::Paused:
            return "Paused";
        case TweenState::Stopped:
            return "Stopped";
    }
    return "Unknown";
}

std::string_view to_string(StopBehavior behavior)
{
    switch (behavior)
    {
        case StopBehavior::AsIs:
            return "AsIs";
        case StopBehavior::ForceComplete:
            return "ForceComplete";
    }
    return "Unknown";
}

std::string_view to_string(LoopType type)
{
    switch (type)
    {
        case LoopType::None:
            return "None";
        case LoopType::Restart:
            return "Restart";
        case LoopType::PingPong:
            return "PingPong";
        case LoopType::Yoyo:
            return "Yoyo";
    }
    return "Unknown";
}

}  // namespace tweenkit
