#include "speech_to_text.hpp"

#include "confidence.hpp"
#include "temp_audio.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace {

std::string trim(const std::string& text) {
    auto start_pos = text.find_first_not_of(" \t\n\r\v\f");
    if (start_pos == std::string::npos) return {};
    auto end_pos = text.find_last_not_of(" \t\n\r\v\f");
    return text.substr(start_pos, end_pos - start_pos + 1);
}

} // namespace

SpeechToTextService::SpeechToTextService(ModelSize size, std::unique_ptr<WhisperModel> model,
                                         bool verbose)
    : size_(size), model_(std::move(model)), verbose_(verbose) {}

std::expected<Transcription, SttError>
SpeechToTextService::transcribe_audio(const std::string& path,
                                      const std::optional<std::string>& language) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        std::println(stderr, "stt: transcription failed: audio file not found: {}", path);
        return std::unexpected(SttError{SttErrorKind::FileNotFound,
                                        "audio file not found: " + path});
    }

    auto options = build_options(language);

    log("Transcribing audio: " + path);
    auto output = model_->transcribe(path, options);
    if (!output) {
        std::println(stderr, "stt: transcription failed: {}", output.error());
        return std::unexpected(SttError{SttErrorKind::TranscriptionError, output.error()});
    }

    auto result = normalize(std::move(*output));
    log(std::format("Transcription completed. Text: {}...", result.text.substr(0, 100)));
    return result;
}

std::expected<Transcription, SttError>
SpeechToTextService::transcribe_audio_file(std::istream& upload,
                                           const std::optional<std::string>& language,
                                           const Config::Staging& staging) {
    auto file = TempAudioFile::create(upload, staging.suffix, staging.dir);
    if (!file) {
        std::println(stderr, "staging: {}", file.error());
        return std::unexpected(SttError{SttErrorKind::StagingError, file.error()});
    }

    // `file` is removed on return, whatever the outcome.
    return transcribe_audio(file->path(), language);
}

TranscriptionOptions
SpeechToTextService::build_options(const std::optional<std::string>& language) {
    TranscriptionOptions options;
    options.language = language;
    options.task = "transcribe";
    options.use_low_precision = false;
    return options;
}

Transcription SpeechToTextService::normalize(ModelOutput output) {
    Transcription result;
    result.text = trim(output.text);
    result.metadata.language = output.language.value_or("unknown");

    if (output.segments) {
        auto& segments = *output.segments;
        result.metadata.segment_count = segments.size();
        result.metadata.duration_s = segments.empty() ? 0.0 : segments.back().end;
        result.metadata.confidence = estimate_confidence(segments);
    }

    return result;
}

void SpeechToTextService::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[stt] {}", msg);
    }
}
