#pragma once

/**
 * @file frame_clock.h
 * @brief Per-frame delta time and smoothed FPS feed
 */

#include <cstdint>
#include <functional>
#include <map>

namespace lucent {

/**
 * @brief Measures frame time and publishes an exponentially smoothed FPS
 *
 * Each tick() returns the seconds since the previous tick and updates
 * fps = fps * 0.9 + (1 / max(dt, 0.0001)) * 0.1, starting from 60.
 *
 * @par Example
 * @code
 * FrameClock clock;
 * int id = clock.onFps([](double fps) { std::cout << fps << "\n"; });
 * while (running) {
 *     double dt = clock.tick();
 *     manager.update(dt);
 *     manager.render(target);
 * }
 * @endcode
 */
class FrameClock {
public:
    using TimeSource = std::function<double()>;
    using FpsCallback = std::function<void(double)>;

    static constexpr double INITIAL_FPS = 60.0;
    static constexpr double SMOOTHING = 0.9;
    static constexpr double MIN_DT = 0.0001;

    /// @param now Seconds on a monotonic clock; defaults to steady_clock
    explicit FrameClock(TimeSource now = {});

    /// @brief Seconds since the previous tick (or since construction/reset)
    double tick();

    double fps() const { return m_fps; }

    /// @brief Seconds accumulated over all ticks
    double elapsed() const { return m_elapsed; }

    uint64_t frameCount() const { return m_frames; }

    /// @brief Subscribe to FPS updates; called once per tick
    /// @return Listener id for removeFpsListener()
    int onFps(FpsCallback callback);
    void removeFpsListener(int id);

    /// @brief Restart timing from now; FPS returns to its initial value
    void reset();

private:
    TimeSource m_now;
    double m_last = 0.0;
    double m_fps = INITIAL_FPS;
    double m_elapsed = 0.0;
    uint64_t m_frames = 0;

    int m_nextListenerId = 1;
    std::map<int, FpsCallback> m_listeners;
};

} // namespace lucent
