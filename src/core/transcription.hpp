#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

struct TranscriptionMetadata {
    std::string language = "unknown";
    double duration_s = 0.0;
    size_t segment_count = 0;
    double confidence = 0.0;
};

struct Transcription {
    std::string text;
    TranscriptionMetadata metadata;
};

nlohmann::json to_json(const Transcription& t);
