#pragma once

/**
 * @file palette_requester.h
 * @brief Runs palette extractions in the background and applies the latest
 */

#include <lucent/palette.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace lucent {

class SceneManager;

/**
 * @brief Issues extraction requests and applies results on the main thread
 *
 * Every request gets a new generation number. poll() applies a finished
 * result only if its generation is the latest one issued; results of older
 * requests are discarded even if they finish later. If the latest request
 * fails, the fallback palette is applied instead.
 *
 * Each request runs on its own worker thread. The destructor waits at most
 * SHUTDOWN_GRACE for unfinished requests and then abandons them, so a slow
 * download cannot hold up shutdown.
 */
class PaletteRequester {
public:
    /// Loads and quantizes a source; runs on a worker thread
    using Loader = std::function<Palette(const std::string&)>;

    static constexpr std::chrono::milliseconds SHUTDOWN_GRACE{500};

    /// @param loader Defaults to PaletteExtractor::fromSource
    explicit PaletteRequester(Loader loader = {}, Palette fallback = Palette::defaults());
    ~PaletteRequester();

    PaletteRequester(const PaletteRequester&) = delete;
    PaletteRequester& operator=(const PaletteRequester&) = delete;
    PaletteRequester(PaletteRequester&&) = default;
    PaletteRequester& operator=(PaletteRequester&&) = delete;

    /// @brief Start extracting @p source; returns its generation
    uint64_t request(const std::string& source);

    /**
     * @brief Apply finished results to @p manager
     * @return true if a palette (extracted or fallback) was applied
     */
    bool poll(SceneManager& manager);

    /// @brief Generation of the most recent request (0 before any)
    uint64_t generation() const { return m_generation; }

    /// @brief Requests whose results have not been collected yet
    size_t inFlight() const { return m_pending.size(); }

    void setFallback(const Palette& fallback) { m_fallback = fallback; }
    const Palette& fallback() const { return m_fallback; }

private:
    struct Pending {
        uint64_t generation;
        std::string source;
        std::future<Palette> result;
        std::thread worker;
    };

    Loader m_loader;
    Palette m_fallback;
    uint64_t m_generation = 0;
    std::vector<Pending> m_pending;
};

} // namespace lucent
