#include "transcription.hpp"

nlohmann::json to_json(const Transcription& t) {
    return {
        {"text", t.text},
        {"metadata", {
            {"language", t.metadata.language},
            {"duration", t.metadata.duration_s},
            {"segments", t.metadata.segment_count},
            {"confidence", t.metadata.confidence},
        }},
    };
}
