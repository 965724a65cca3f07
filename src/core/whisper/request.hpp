#pragma once

#include "model.hpp"

#include <string>
#include <utility>
#include <vector>

namespace request {

using Fields = std::vector<std::pair<std::string, std::string>>;

// Multipart form fields for a transcription request in the given api format
// ("whisper.cpp" or "openai"). Only options that are present are emitted.
Fields form_fields(const TranscriptionOptions& options, const std::string& api_format);

// Path of the transcription endpoint relative to the server url.
std::string endpoint(const TranscriptionOptions& options, const std::string& api_format);

} // namespace request
