// Basic tween demo
// Steps a few tweens at a fixed 60 Hz and prints their values.

#include <cstdio>
#include <tweenkit/tweenkit.hpp>

using namespace tweenkit;

int main()
{
    Logger::instance().add_sink(sinks::console_sink());

    constexpr float dt = 1.0f / 60.0f;

    // Plain float with a delay and a bounce
    FloatTween height;
    height.set_delay(0.25f)
        .on_start([] { std::printf("height: start\n"); })
        .on_complete([] { std::printf("height: complete\n"); });
    height.start(100.0f, 0.0f, 1.0f, ease::bounce_out);

    // Color fade that ping-pongs twice
    ColorTween glow;
    glow.configure({.loop_type = LoopType::PingPong, .loop_count = 2, .easing = ease::sine_in_out})
        .on_loop([] { std::printf("glow: loop\n"); });
    glow.start(colors::blue, colors::yellow, 0.5f);

    // Position driven through a callback, with a CSS-style bezier
    vec2 pos;
    auto move = tween_to<Vec2Tween>(
        vec2{0.0f, 0.0f}, vec2{320.0f, 240.0f}, 1.0f, [&](const vec2& p) { pos = p; }, ease::ease_in_out_cubic_bezier);

    // Easing by name, as a config file would select it
    FloatTween spin;
    spin.start(0.0f, 360.0f, 0.75f, ease::by_name("back_out"));

    for (int frame = 0; frame <= 90; ++frame)
    {
        height.update(dt);
        glow.update(dt);
        move->update(dt);
        spin.update(dt);

        if (frame % 15 == 0)
        {
            const Color& c = glow.current_value();
            std::printf("t=%.2f height=%7.2f glow=(%.2f %.2f %.2f) pos=(%6.1f %6.1f) spin=%6.1f\n",
                        frame * dt,
                        height.current_value(),
                        c.r,
                        c.g,
                        c.b,
                        pos.x,
                        pos.y,
                        spin.current_value());
        }
    }

    return 0;
}
