#pragma once

#include "config.hpp"
#include "speech_to_text.hpp"
#include "stt_error.hpp"
#include "whisper/model.hpp"

#include <expected>
#include <future>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Stands in for a SpeechToTextService whose model is only loaded on first use.
//
// The first caller to find the handle unloaded runs the loader; callers that
// arrive while that load is in flight wait for it and receive its outcome.
// A failed load leaves the handle unloaded, so the next call tries again.
// Once loaded the service is kept for the lifetime of the handle.
class LazySpeechToText {
public:
    LazySpeechToText(ModelLoader loader, std::string configured_size = {},
                     Config::Staging staging = {}, bool verbose = false);

    LazySpeechToText(const LazySpeechToText&) = delete;
    LazySpeechToText& operator=(const LazySpeechToText&) = delete;

    std::expected<void, SttError> ensure_loaded();
    bool loaded() const;

    std::expected<Transcription, SttError>
        transcribe_audio(const std::string& path,
                         const std::optional<std::string>& language = std::nullopt);

    std::expected<Transcription, SttError>
        transcribe_audio_file(std::istream& upload,
                              const std::optional<std::string>& language = std::nullopt);

private:
    using LoadResult = std::expected<void, SttError>;

    std::expected<std::unique_ptr<SpeechToTextService>, SttError> load_service();
    std::expected<SpeechToTextService*, SttError> acquire();
    void log(const std::string& msg);

    ModelLoader loader_;
    std::string configured_size_;
    Config::Staging staging_;
    bool verbose_;

    mutable std::mutex mutex_;
    std::unique_ptr<SpeechToTextService> service_;
    std::optional<std::shared_future<LoadResult>> pending_;
};
