#pragma once

#include "whisper/model.hpp"

#include <span>

// Mean of (1 - no_speech_prob) over the segments that report it; segments
// without the field are skipped. 0.0 when no segment qualifies.
double estimate_confidence(std::span<const Segment> segments);
