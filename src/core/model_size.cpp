#include "model_size.hpp"

#include <array>
#include <cstdlib>
#include <utility>

namespace {

constexpr std::array<std::pair<std::string_view, ModelSize>, 5> kSizes = {{
    {"tiny", ModelSize::Tiny},
    {"base", ModelSize::Base},
    {"small", ModelSize::Small},
    {"medium", ModelSize::Medium},
    {"large", ModelSize::Large},
}};

} // namespace

std::string_view to_string(ModelSize size) {
    for (auto& [name, value] : kSizes) {
        if (value == size) return name;
    }
    return "unknown";
}

std::expected<ModelSize, std::string> parse_model_size(std::string_view name) {
    for (auto& [candidate, value] : kSizes) {
        if (candidate == name) return value;
    }
    return std::unexpected("unsupported model size: " + std::string(name));
}

std::expected<ModelSize, std::string> resolve_model_size(const std::string& configured) {
    const char* env = std::getenv("WHISPER_MODEL");
    if (env && *env) return parse_model_size(env);
    if (!configured.empty()) return parse_model_size(configured);
    return kDefaultModelSize;
}
