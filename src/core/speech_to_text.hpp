#pragma once

#include "config.hpp"
#include "model_size.hpp"
#include "stt_error.hpp"
#include "transcription.hpp"
#include "whisper/model.hpp"

#include <expected>
#include <istream>
#include <memory>
#include <optional>
#include <string>

class SpeechToTextService {
public:
    SpeechToTextService(ModelSize size, std::unique_ptr<WhisperModel> model,
                        bool verbose = false);

    SpeechToTextService(const SpeechToTextService&) = delete;
    SpeechToTextService& operator=(const SpeechToTextService&) = delete;

    ModelSize model_size() const { return size_; }

    // Fails with FileNotFound before touching the model if `path` is missing.
    std::expected<Transcription, SttError>
        transcribe_audio(const std::string& path,
                         const std::optional<std::string>& language = std::nullopt);

    // Stages `upload` in a temp file for the duration of the call.
    std::expected<Transcription, SttError>
        transcribe_audio_file(std::istream& upload,
                              const std::optional<std::string>& language = std::nullopt,
                              const Config::Staging& staging = {});

    static TranscriptionOptions build_options(const std::optional<std::string>& language);
    static Transcription normalize(ModelOutput output);

private:
    void log(const std::string& msg);

    ModelSize size_;
    std::unique_ptr<WhisperModel> model_;
    bool verbose_;
};
