// Lucent - Phrase Tracker

#include <lucent/phrase_tracker.h>
#include <cmath>
#include <stdexcept>

namespace lucent {

PhraseTracker::PhraseTracker(double tempo, int barsPerPhrase)
    : m_tempo(tempo)
    , m_barsPerPhrase(barsPerPhrase) {
    if (!(tempo > 0.0) || !std::isfinite(tempo)) {
        throw std::invalid_argument("PhraseTracker: tempo must be positive");
    }
    if (barsPerPhrase <= 0) {
        throw std::invalid_argument("PhraseTracker: barsPerPhrase must be positive");
    }
}

void PhraseTracker::setBars(std::vector<double> barStarts) {
    m_barStarts = std::move(barStarts);
    m_nextBar = 0;
}

void PhraseTracker::setTempo(double bpm) {
    if (!(bpm > 0.0) || !std::isfinite(bpm)) {
        throw std::invalid_argument("PhraseTracker: tempo must be positive");
    }
    m_tempo = bpm;
}

bool PhraseTracker::hasBar(int index) const {
    return m_barStarts.empty() || index < static_cast<int>(m_barStarts.size());
}

double PhraseTracker::barStart(int index) const {
    if (!m_barStarts.empty()) {
        return m_barStarts[index];
    }
    return index * barDuration();
}

int PhraseTracker::advance(double now, const PhraseCallback& callback) {
    int fired = 0;
    while (hasBar(m_nextBar) && now >= barStart(m_nextBar)) {
        if (m_nextBar % m_barsPerPhrase == 0) {
            if (callback) callback(m_nextBar, m_tempo);
            fired++;
        }
        m_nextBar++;
    }
    return fired;
}

} // namespace lucent
