#pragma once

#include "lazy_speech_to_text.hpp"
#include "stt_error.hpp"

#include <expected>
#include <string>

// Single-argument entry point kept for older callers: text only, language
// auto-detected.
std::expected<std::string, SttError> transcribe_text(LazySpeechToText& stt,
                                                     const std::string& path);
