#include "legacy.hpp"

std::expected<std::string, SttError> transcribe_text(LazySpeechToText& stt,
                                                     const std::string& path) {
    auto result = stt.transcribe_audio(path);
    if (!result) return std::unexpected(result.error());
    return std::move(result->text);
}
