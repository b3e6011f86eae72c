#pragma once

/**
 * @file phrase_tracker.h
 * @brief Emits phrase boundaries every N bars of a track
 */

#include <functional>
#include <vector>

namespace lucent {

/**
 * @brief Turns bar start times (or a tempo) into phrase events
 *
 * Bar starts come from a track analysis when available; otherwise bars are
 * spaced 4 beats apart at the current tempo. advance() processes every bar
 * that has started since the previous call, in order, and fires the
 * callback for bars whose index is a multiple of barsPerPhrase.
 *
 * @par Example
 * @code
 * PhraseTracker phrases(128.0);
 * phrases.advance(clock.elapsed(), [&](int bar, double tempo) {
 *     manager.onPhrase(bar, tempo);
 * });
 * @endcode
 */
class PhraseTracker {
public:
    using PhraseCallback = std::function<void(int bar, double tempo)>;

    static constexpr int BEATS_PER_BAR = 4;
    static constexpr int DEFAULT_BARS_PER_PHRASE = 4;

    /**
     * @throws std::invalid_argument if tempo or barsPerPhrase is not positive
     */
    explicit PhraseTracker(double tempo = 120.0, int barsPerPhrase = DEFAULT_BARS_PER_PHRASE);

    /// @brief Use explicit bar start times (seconds, ascending); rewinds
    void setBars(std::vector<double> barStarts);

    /// @throws std::invalid_argument if @p bpm is not positive
    void setTempo(double bpm);
    double tempo() const { return m_tempo; }

    int barsPerPhrase() const { return m_barsPerPhrase; }

    /// @brief Seconds per bar at the current tempo
    double barDuration() const { return BEATS_PER_BAR * 60.0 / m_tempo; }

    /**
     * @brief Process all bars that started at or before @p now
     * @return Number of phrase events fired
     */
    int advance(double now, const PhraseCallback& callback);

    /// @brief Index of the next bar to be processed
    int nextBar() const { return m_nextBar; }

    /// @brief Rewind to bar 0
    void reset() { m_nextBar = 0; }

private:
    double barStart(int index) const;
    bool hasBar(int index) const;

    double m_tempo;
    int m_barsPerPhrase;
    std::vector<double> m_barStarts;
    int m_nextBar = 0;
};

} // namespace lucent
