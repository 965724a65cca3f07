#include "verbose_json.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::expected<ModelOutput, std::string> parse_verbose_json(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            auto& err = j["error"];
            // OpenAI nests the message, whisper.cpp sends a plain string
            if (err.is_object()) {
                return std::unexpected("server error: " + err.value("message", err.dump()));
            }
            return std::unexpected("server error: " +
                                   (err.is_string() ? err.get<std::string>() : err.dump()));
        }
        if (!j.contains("text")) {
            return std::unexpected("unexpected response: " + body);
        }

        ModelOutput out;
        out.text = j["text"].get<std::string>();

        if (j.contains("language") && j["language"].is_string()) {
            out.language = j["language"].get<std::string>();
        }

        if (j.contains("segments") && j["segments"].is_array()) {
            std::vector<Segment> segments;
            for (auto& s : j["segments"]) {
                Segment seg;
                seg.start = s.value("start", 0.0);
                seg.end = s.value("end", 0.0);
                seg.text = s.value("text", "");
                if (s.contains("no_speech_prob") && s["no_speech_prob"].is_number()) {
                    seg.no_speech_prob = s["no_speech_prob"].get<double>();
                }
                segments.push_back(std::move(seg));
            }
            out.segments = std::move(segments);
        }

        return out;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
