#pragma once

#include "model.hpp"

#include <expected>
#include <string>

// Decodes a whisper.cpp or OpenAI verbose_json transcription response.
std::expected<ModelOutput, std::string> parse_verbose_json(const std::string& body);
