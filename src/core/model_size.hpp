#pragma once

#include <expected>
#include <string>
#include <string_view>

// Whisper checkpoints, fastest first.
enum class ModelSize { Tiny, Base, Small, Medium, Large };

inline constexpr ModelSize kDefaultModelSize = ModelSize::Tiny;

std::string_view to_string(ModelSize size);
std::expected<ModelSize, std::string> parse_model_size(std::string_view name);

// WHISPER_MODEL wins when set and non-empty, then `configured`, then tiny.
std::expected<ModelSize, std::string> resolve_model_size(const std::string& configured);
