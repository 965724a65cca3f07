#pragma once

#include "../config.hpp"
#include "model.hpp"
#include "request.hpp"

#include <expected>
#include <memory>
#include <string>

// Whisper model served over HTTP by a whisper.cpp server or an
// OpenAI-compatible endpoint.
class LanModel : public WhisperModel {
public:
    // api_format: "whisper.cpp" or "openai"
    LanModel(std::string url, std::string api_format = "whisper.cpp");
    ~LanModel() override;

    LanModel(const LanModel&) = delete;
    LanModel& operator=(const LanModel&) = delete;

    // Makes `size` the server's active model. whisper.cpp servers are asked to
    // load <models_dir>/ggml-<size>.bin; OpenAI endpoints are only probed.
    static std::expected<std::unique_ptr<LanModel>, std::string>
        load(const Config::Model& cfg, ModelSize size);

    std::expected<ModelOutput, std::string>
        transcribe(const std::string& audio_path, const TranscriptionOptions& options) override;

private:
    std::expected<std::string, std::string> post(const std::string& path,
                                                 const request::Fields& fields,
                                                 const std::string& file_path,
                                                 long timeout_s);
    std::expected<std::string, std::string> get(const std::string& path);

    std::string url_;
    std::string api_format_;
};

// ggml checkpoint a whisper.cpp server is asked to load for `size`.
std::string model_file(const std::string& models_dir, ModelSize size);

// ModelLoader bound to the given backend settings.
ModelLoader make_lan_loader(Config::Model cfg);
