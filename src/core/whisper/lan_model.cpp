#include "lan_model.hpp"
#include "verbose_json.hpp"

#include <curl/curl.h>
#include <filesystem>
#include <format>
#include <print>

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Runs a prepared handle and returns the body of a 2xx response.
std::expected<std::string, std::string> perform(CURL* curl) {
    std::string response_body;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        return std::unexpected(std::format("HTTP {}: {}", status, response_body));
    }
    return response_body;
}

} // namespace

LanModel::LanModel(std::string url, std::string api_format)
    : url_(std::move(url)), api_format_(std::move(api_format)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanModel::~LanModel() {
    curl_global_cleanup();
}

std::expected<std::unique_ptr<LanModel>, std::string>
LanModel::load(const Config::Model& cfg, ModelSize size) {
    if (cfg.api_format != "whisper.cpp" && cfg.api_format != "openai") {
        return std::unexpected("unknown api format: " + cfg.api_format);
    }

    auto model = std::make_unique<LanModel>(cfg.url, cfg.api_format);

    if (cfg.api_format == "openai") {
        // Hosted models are selected per request; only check reachability.
        auto probe = model->get("/v1/models");
        if (!probe) return std::unexpected(probe.error());
        return model;
    }

    auto path = model_file(cfg.models_dir, size);
    auto res = model->post("/load", {{"model", path}}, {}, 300L);
    if (!res) {
        return std::unexpected(std::format("loading {} failed: {}", path, res.error()));
    }
    return model;
}

std::expected<ModelOutput, std::string>
LanModel::transcribe(const std::string& audio_path, const TranscriptionOptions& options) {
    if (options.use_low_precision) {
        // Server precision is fixed when the server starts.
        std::println(stderr, "lan: low precision requested, server default is used");
    }

    auto body = post(request::endpoint(options, api_format_),
                     request::form_fields(options, api_format_), audio_path, 120L);
    if (!body) return std::unexpected(body.error());

    return parse_verbose_json(*body);
}

std::expected<std::string, std::string> LanModel::post(const std::string& path,
                                                       const request::Fields& fields,
                                                       const std::string& file_path,
                                                       long timeout_s) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    if (!file_path.empty()) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "file");
        if (curl_mime_filedata(part, file_path.c_str()) != CURLE_OK) {
            curl_mime_free(mime);
            curl_easy_cleanup(curl);
            return std::unexpected("cannot read audio file: " + file_path);
        }
    }

    for (auto& [name, value] : fields) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, name.c_str());
        curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
    }

    std::string endpoint = url_ + path;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);

    auto res = perform(curl);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);
    return res;
}

std::expected<std::string, std::string> LanModel::get(const std::string& path) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint = url_ + path;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);

    auto res = perform(curl);
    curl_easy_cleanup(curl);
    return res;
}

std::string model_file(const std::string& models_dir, ModelSize size) {
    return (std::filesystem::path(models_dir) / std::format("ggml-{}.bin", to_string(size)))
        .string();
}

ModelLoader make_lan_loader(Config::Model cfg) {
    return [cfg = std::move(cfg)](ModelSize size)
               -> std::expected<std::unique_ptr<WhisperModel>, std::string> {
        auto model = LanModel::load(cfg, size);
        if (!model) return std::unexpected(model.error());
        return std::unique_ptr<WhisperModel>(std::move(*model));
    };
}
