#pragma once

#include "../model_size.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct TranscriptionOptions {
    // Absent means auto-detect; an empty string is passed through as-is.
    std::optional<std::string> language;
    std::string task = "transcribe";
    bool use_low_precision = false;
};

struct Segment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::optional<double> no_speech_prob;
};

// Decoded model response. Fields the model did not report stay empty.
struct ModelOutput {
    std::string text;
    std::optional<std::string> language;
    std::optional<std::vector<Segment>> segments;
};

class WhisperModel {
public:
    virtual ~WhisperModel() = default;
    virtual std::expected<ModelOutput, std::string>
        transcribe(const std::string& audio_path, const TranscriptionOptions& options) = 0;
};

using ModelLoader =
    std::function<std::expected<std::unique_ptr<WhisperModel>, std::string>(ModelSize)>;
