#include "lazy_speech_to_text.hpp"

#include <exception>
#include <filesystem>
#include <format>
#include <new>
#include <print>

LazySpeechToText::LazySpeechToText(ModelLoader loader, std::string configured_size,
                                   Config::Staging staging, bool verbose)
    : loader_(std::move(loader)), configured_size_(std::move(configured_size)),
      staging_(std::move(staging)), verbose_(verbose) {}

std::expected<void, SttError> LazySpeechToText::ensure_loaded() {
    std::unique_lock lock(mutex_);
    if (service_) return {};

    if (pending_) {
        auto in_flight = *pending_;
        lock.unlock();
        return in_flight.get();
    }

    std::promise<LoadResult> promise;
    pending_ = promise.get_future().share();
    lock.unlock();

    std::expected<std::unique_ptr<SpeechToTextService>, SttError> service;
    try {
        service = load_service();
    } catch (...) {
        // Waiters see the same exception; the next call starts a fresh load.
        lock.lock();
        pending_.reset();
        lock.unlock();
        promise.set_exception(std::current_exception());
        throw;
    }

    LoadResult outcome;
    lock.lock();
    if (service) {
        service_ = std::move(*service);
    } else {
        outcome = std::unexpected(service.error());
    }
    pending_.reset();
    lock.unlock();

    promise.set_value(outcome);
    return outcome;
}

bool LazySpeechToText::loaded() const {
    std::lock_guard lock(mutex_);
    return service_ != nullptr;
}

std::expected<Transcription, SttError>
LazySpeechToText::transcribe_audio(const std::string& path,
                                   const std::optional<std::string>& language) {
    // A missing file never justifies loading the model.
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        std::println(stderr, "stt: transcription failed: audio file not found: {}", path);
        return std::unexpected(SttError{SttErrorKind::FileNotFound,
                                        "audio file not found: " + path});
    }

    auto service = acquire();
    if (!service) return std::unexpected(service.error());
    return (*service)->transcribe_audio(path, language);
}

std::expected<Transcription, SttError>
LazySpeechToText::transcribe_audio_file(std::istream& upload,
                                        const std::optional<std::string>& language) {
    auto service = acquire();
    if (!service) return std::unexpected(service.error());
    return (*service)->transcribe_audio_file(upload, language, staging_);
}

std::expected<std::unique_ptr<SpeechToTextService>, SttError>
LazySpeechToText::load_service() {
    auto size = resolve_model_size(configured_size_);
    if (!size) {
        std::println(stderr, "lazy: failed to load whisper model: {}", size.error());
        return std::unexpected(SttError{SttErrorKind::LoadError, size.error()});
    }

    log(std::format("Loading whisper model: {}", to_string(*size)));

    std::expected<std::unique_ptr<SpeechToTextService>, std::string> service;
    try {
        auto model = loader_(*size);
        if (model) {
            service = std::make_unique<SpeechToTextService>(*size, std::move(*model), verbose_);
        } else {
            service = std::unexpected(model.error());
        }
    } catch (const std::bad_alloc&) {
        service = std::unexpected(std::string("insufficient memory"));
    } catch (const std::exception& e) {
        service = std::unexpected(std::string(e.what()));
    }

    if (!service) {
        std::println(stderr, "lazy: failed to load whisper model {}: {}",
                     to_string(*size), service.error());
        return std::unexpected(SttError{SttErrorKind::LoadError, service.error()});
    }

    log("Whisper model loaded successfully");
    return std::move(*service);
}

std::expected<SpeechToTextService*, SttError> LazySpeechToText::acquire() {
    auto ready = ensure_loaded();
    if (!ready) return std::unexpected(ready.error());

    std::lock_guard lock(mutex_);
    return service_.get();
}

void LazySpeechToText::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[lazy] {}", msg);
    }
}
