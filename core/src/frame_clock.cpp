// Lucent - Frame Clock

#include <lucent/frame_clock.h>
#include <algorithm>
#include <chrono>

namespace lucent {

namespace {

double steadyNow() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

FrameClock::FrameClock(TimeSource now)
    : m_now(now ? std::move(now) : TimeSource(steadyNow)) {
    m_last = m_now();
}

double FrameClock::tick() {
    double now = m_now();
    double dt = std::max(0.0, now - m_last);
    m_last = now;
    m_elapsed += dt;
    m_frames++;

    m_fps = m_fps * SMOOTHING + (1.0 / std::max(dt, MIN_DT)) * (1.0 - SMOOTHING);

    // Copy so listeners may unsubscribe from inside the callback
    auto listeners = m_listeners;
    for (const auto& [id, callback] : listeners) {
        callback(m_fps);
    }
    return dt;
}

int FrameClock::onFps(FpsCallback callback) {
    int id = m_nextListenerId++;
    m_listeners[id] = std::move(callback);
    return id;
}

void FrameClock::removeFpsListener(int id) {
    m_listeners.erase(id);
}

void FrameClock::reset() {
    m_last = m_now();
    m_fps = INITIAL_FPS;
    m_elapsed = 0.0;
    m_frames = 0;
}

} // namespace lucent
