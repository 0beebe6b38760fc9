#include "extraction/pair_extraction.hpp"

#include <algorithm>

namespace keydr {

PairEvents extractPairEvents(const std::vector<KeyTime>& keystrokes,
                             double hesitation_threshold_ms) {
    std::vector<const KeyTime*> filtered;
    filtered.reserve(keystrokes.size());
    for (const auto& kt : keystrokes) {
        if (!symbols::isCorrectionMarker(kt.symbol)) {
            filtered.push_back(&kt);
        }
    }

    PairEvents events;
    for (size_t i = 0; i + 1 < filtered.size(); i++) {
        const KeyTime& a = *filtered[i];
        const KeyTime& b = *filtered[i + 1];
        if (symbols::isWordBoundary(a.symbol) || symbols::isWordBoundary(b.symbol)) {
            continue;
        }

        PairEvent ev;
        ev.key = PairKey(a.symbol, b.symbol);
        ev.time_ms = b.time_ms;
        ev.correct = a.correct && b.correct;
        ev.hesitation = b.time_ms > hesitation_threshold_ms;
        events.bigrams.push_back(ev);

        if (i + 2 >= filtered.size()) continue;
        const KeyTime& c = *filtered[i + 2];
        if (symbols::isWordBoundary(c.symbol)) continue;

        PairEvent tri;
        tri.key = PairKey(a.symbol, b.symbol, c.symbol);
        tri.time_ms = b.time_ms + c.time_ms;
        tri.correct = a.correct && b.correct && c.correct;
        tri.hesitation = b.time_ms > hesitation_threshold_ms ||
                         c.time_ms > hesitation_threshold_ms;
        events.trigrams.push_back(tri);
    }
    return events;
}

double hesitationThreshold(double median_transition_ms, double floor_ms, double multiplier) {
    return std::max(floor_ms, multiplier * median_transition_ms);
}

double computeMedian(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) {
        return (values[mid - 1] + values[mid]) / 2.0;
    }
    return values[mid];
}

} // namespace keydr
