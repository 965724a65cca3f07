#include "config.hpp"
#include "lazy_speech_to_text.hpp"
#include "legacy.hpp"
#include "transcription.hpp"
#include "whisper/lan_model.hpp"

#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] FILE...", prog);
    std::println(stderr, "Transcribe audio files; use - to read audio from stdin.");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH    Config file path");
    std::println(stderr, "  -l, --language LANG  Language hint (default: auto-detect)");
    std::println(stderr, "  -m, --model SIZE     tiny|base|small|medium|large");
    std::println(stderr, "      --legacy         Print text only, ignoring --language");
    std::println(stderr, "      --json           Print text and metadata as JSON");
    std::println(stderr, "  -v, --verbose        Enable verbose logging");
    std::println(stderr, "  -h, --help           Show this help");
}

static void print_error(const SttError& err) {
    std::println(stderr, "Error ({}): {}", to_string(err.kind), err.message);
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool legacy = false;
    bool as_json = false;
    std::string config_path;
    std::string model_size;
    std::optional<std::string> language;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--legacy") {
            legacy = true;
        } else if (arg == "--json") {
            as_json = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--language" || arg == "-l") {
            if (i + 1 < argc) language = argv[++i];
        } else if (arg == "--model" || arg == "-m") {
            if (i + 1 < argc) model_size = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--stdin") {
            inputs.emplace_back("-");
        } else {
            inputs.push_back(arg);
        }
    }

    if (inputs.empty()) {
        usage(argv[0]);
        return 1;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!model_size.empty()) config.model.size = model_size;

    if (config.model.backend != "lan") {
        std::println(stderr, "Unknown backend type: {}", config.model.backend);
        return 1;
    }

    if (verbose) {
        std::println(stderr, "[stt] Starting (backend: {} @ {}, model: {})",
                     config.model.api_format, config.model.url, config.model.size);
    }

    // Nothing is loaded until the first input is transcribed.
    LazySpeechToText stt(make_lan_loader(config.model), config.model.size,
                         config.staging, verbose);

    int rc = 0;
    for (auto& input : inputs) {
        if (legacy) {
            if (input == "-") {
                std::println(stderr, "--legacy takes file paths only");
                rc = 1;
                continue;
            }
            auto text = transcribe_text(stt, input);
            if (!text) {
                print_error(text.error());
                rc = 1;
                continue;
            }
            std::println("{}", *text);
            continue;
        }

        auto result = input == "-" ? stt.transcribe_audio_file(std::cin, language)
                                   : stt.transcribe_audio(input, language);
        if (!result) {
            print_error(result.error());
            rc = 1;
            continue;
        }

        if (as_json) {
            std::println("{}", to_json(*result).dump(2));
        } else {
            auto& md = result->metadata;
            std::println("{}", result->text);
            std::println(stderr, "  language: {}, duration: {:.2f}s, segments: {}, confidence: {:.2f}",
                         md.language, md.duration_s, md.segment_count, md.confidence);
        }
    }

    return rc;
}
