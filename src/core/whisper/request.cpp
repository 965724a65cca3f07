#include "request.hpp"

namespace request {

Fields form_fields(const TranscriptionOptions& options, const std::string& api_format) {
    Fields fields;

    if (api_format == "openai") {
        fields.emplace_back("model", "whisper-1");
    } else {
        fields.emplace_back("temperature", "0.0");
        fields.emplace_back("translate", options.task == "translate" ? "true" : "false");
    }
    fields.emplace_back("response_format", "verbose_json");

    if (options.language) {
        fields.emplace_back("language", *options.language);
    }

    return fields;
}

std::string endpoint(const TranscriptionOptions& options, const std::string& api_format) {
    if (api_format == "openai") {
        return options.task == "translate" ? "/v1/audio/translations"
                                           : "/v1/audio/transcriptions";
    }
    return "/inference";
}

} // namespace request
