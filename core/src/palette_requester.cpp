// Lucent - Palette Requester

#include <lucent/palette_requester.h>
#include <lucent/scene_manager.h>
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace lucent {

PaletteRequester::PaletteRequester(Loader loader, Palette fallback)
    : m_loader(std::move(loader))
    , m_fallback(std::move(fallback)) {
    if (!m_loader) {
        m_loader = [](const std::string& source) {
            return PaletteExtractor().fromSource(source);
        };
    }
}

PaletteRequester::~PaletteRequester() {
    auto deadline = std::chrono::steady_clock::now() + SHUTDOWN_GRACE;
    for (auto& pending : m_pending) {
        if (!pending.worker.joinable()) continue;
        if (pending.result.wait_until(deadline) == std::future_status::ready) {
            pending.worker.join();
        } else {
            std::cerr << "[PaletteRequester] Abandoning unfinished #" << pending.generation
                      << ": " << pending.source << std::endl;
            pending.worker.detach();
        }
    }
}

uint64_t PaletteRequester::request(const std::string& source) {
    uint64_t generation = ++m_generation;

    std::promise<Palette> promise;
    Pending pending{generation, source, promise.get_future(), {}};
    pending.worker = std::thread([loader = m_loader, source, promise = std::move(promise)]() mutable {
        try {
            promise.set_value(loader(source));
        } catch (...) {
            // Rethrown by future::get() in poll()
            promise.set_exception(std::current_exception());
        }
    });
    m_pending.push_back(std::move(pending));

    std::cout << "[PaletteRequester] Requested #" << generation << ": " << source << std::endl;
    return generation;
}

bool PaletteRequester::poll(SceneManager& manager) {
    bool applied = false;

    for (auto it = m_pending.begin(); it != m_pending.end();) {
        if (it->result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }

        it->worker.join();
        bool latest = it->generation == m_generation;
        try {
            Palette palette = it->result.get();
            if (latest) {
                manager.setPalette(palette);
                applied = true;
                std::cout << "[PaletteRequester] Applied #" << it->generation << " dominant "
                          << palette.dominant.toHex() << " secondary "
                          << palette.secondary.toHex() << std::endl;
            } else {
                std::cout << "[PaletteRequester] Discarding stale #" << it->generation
                          << " (latest #" << m_generation << ")" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[PaletteRequester] #" << it->generation << " failed for "
                      << it->source << ": " << e.what() << std::endl;
            if (latest) {
                manager.setPalette(m_fallback);
                applied = true;
            }
        }
        it = m_pending.erase(it);
    }

    return applied;
}

} // namespace lucent
