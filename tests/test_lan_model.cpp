#include <catch2/catch_test_macros.hpp>

#include "whisper/lan_model.hpp"

TEST_CASE("LanModel loading", "[whisper]") {

    SECTION("ModelFilePath") {
        REQUIRE(model_file("models", ModelSize::Base) == "models/ggml-base.bin");
        REQUIRE(model_file("/opt/whisper", ModelSize::Large) == "/opt/whisper/ggml-large.bin");
    }

    SECTION("UnknownApiFormat") {
        Config::Model cfg;
        cfg.api_format = "grpc";
        auto model = make_lan_loader(cfg)(ModelSize::Tiny);
        REQUIRE_FALSE(model.has_value());
        REQUIRE(model.error() == "unknown api format: grpc");
    }

    SECTION("UnreachableWhisperCppServer") {
        Config::Model cfg;
        cfg.url = "http://127.0.0.1:1";
        auto model = make_lan_loader(cfg)(ModelSize::Base);
        REQUIRE_FALSE(model.has_value());
        REQUIRE(model.error().starts_with("loading models/ggml-base.bin failed: curl error"));
    }

    SECTION("UnreachableOpenAiEndpoint") {
        Config::Model cfg;
        cfg.url = "http://127.0.0.1:1";
        cfg.api_format = "openai";
        auto model = make_lan_loader(cfg)(ModelSize::Tiny);
        REQUIRE_FALSE(model.has_value());
        REQUIRE(model.error().starts_with("curl error"));
    }
}
