// Sequence + TweenManager demo
// A card slides in, waits, fades out; a spinner runs alongside until the
// manager is stopped.

#include <cstdio>
#include <memory>
#include <tweenkit/tweenkit.hpp>

using namespace tweenkit;

int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    float slide = 0.0f;
    float alpha = 1.0f;
    float angle = 0.0f;

    auto card = make_sequence();
    card->append(tween_to<FloatTween>(-200.0f, 0.0f, 0.4f, [&](float x) { slide = x; }, ease::cubic_out))
        .append(tween_to<FloatTween>(0.0f, 0.0f, 0.5f, nullptr))   // hold
        .append(tween_to<FloatTween>(1.0f, 0.0f, 0.3f, [&](float a) { alpha = a; }))
        .on_complete([] { std::printf("card: done\n"); })
        .start();

    auto spinner = std::make_shared<FloatTween>();
    spinner->set_loop(LoopType::Restart, -1).on_update([&](float a) { angle = a; });
    spinner->start(0.0f, 360.0f, 0.6f);

    TweenManager manager;
    manager.add(card);
    manager.add(spinner);

    constexpr float dt = 1.0f / 30.0f;
    for (int frame = 0; frame < 60; ++frame)
    {
        manager.update(dt);
        if (frame % 5 == 0)
        {
            std::printf("frame %2d: slide=%7.2f alpha=%.2f angle=%6.1f member=%zu units=%zu\n",
                        frame,
                        slide,
                        alpha,
                        angle,
                        card->current_index(),
                        manager.size());
        }
        if (frame == 30)
        {
            manager.set_time_scale(2.0f);
        }
    }

    // The spinner never finishes on its own
    manager.stop_all(StopBehavior::ForceComplete);
    std::printf("stopped: units=%zu angle=%.1f\n", manager.size(), angle);

    return 0;
}
