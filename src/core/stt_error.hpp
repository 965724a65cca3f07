#pragma once

#include <string>
#include <string_view>

enum class SttErrorKind {
    FileNotFound,       // audio path does not exist; raised before any model work
    LoadError,          // model construction failed, including out-of-memory
    TranscriptionError, // the model failed during inference
    StagingError,       // the uploaded audio could not be written to a temp file
};

struct SttError {
    SttErrorKind kind;
    std::string message;
};

inline std::string_view to_string(SttErrorKind kind) {
    switch (kind) {
        case SttErrorKind::FileNotFound: return "file not found";
        case SttErrorKind::LoadError: return "load error";
        case SttErrorKind::TranscriptionError: return "transcription error";
        case SttErrorKind::StagingError: return "staging error";
    }
    return "unknown";
}
