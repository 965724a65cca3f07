#include "confidence.hpp"

double estimate_confidence(std::span<const Segment> segments) {
    double total = 0.0;
    size_t count = 0;

    for (auto& seg : segments) {
        if (!seg.no_speech_prob) continue;
        total += 1.0 - *seg.no_speech_prob;
        count++;
    }

    return count > 0 ? total / static_cast<double>(count) : 0.0;
}
