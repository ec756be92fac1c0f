#include <chrono>
#include <thread>
#include <tweenkit/tweenkit.hpp>

using namespace tweenkit;

int main()
{
    // Initialize logger with console output
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    // Also log to file
    Logger::instance().add_sink(sinks::file_sink("tweenkit_example.log"));

    TWEENKIT_LOG_INFO("example", "Logger example starting up");

    // Library lifecycle messages show up at Debug
    FloatTween t;
    t.start(0.0f, 1.0f, 0.25f);
    t.update(0.5f);

    // Rejected arguments are logged before the exception propagates
    try
    {
        t.start(0.0f, 1.0f, 0.0f);
    }
    catch (const std::invalid_argument& e)
    {
        TWEENKIT_LOG_WARN("example", "caught: {}", e.what());
    }

    // Each thread owns its tweens; only the logger is shared
    auto worker = [](int id)
    {
        FloatTween local;
        local.on_update([id](float v) { TWEENKIT_LOG_DEBUG("worker", "Worker {} value {}", id, v); });
        local.start(0.0f, 1.0f, 0.05f);
        for (int i = 0; i < 5; ++i)
        {
            local.update(0.01f);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    };

    std::thread t1(worker, 1);
    std::thread t2(worker, 2);

    t1.join();
    t2.join();

    TWEENKIT_LOG_INFO("example", "Logger example completed");

    return 0;
}
