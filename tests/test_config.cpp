#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "model_size.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <string>

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.model.size == "tiny");
        REQUIRE(cfg.model.backend == "lan");
        REQUIRE(cfg.model.url == "http://localhost:8080");
        REQUIRE(cfg.model.api_format == "whisper.cpp");
        REQUIRE(cfg.model.models_dir == "models");
        REQUIRE(cfg.staging.suffix == ".webm");
        REQUIRE(cfg.staging.dir.empty());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "model": {
                "size": "small",
                "backend": "lan",
                "url": "http://10.0.0.1:9090",
                "api_format": "openai",
                "models_dir": "/opt/whisper"
            },
            "staging": { "suffix": ".wav", "dir": "/var/tmp" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model.size == "small");
        REQUIRE(cfg.model.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.model.api_format == "openai");
        REQUIRE(cfg.model.models_dir == "/opt/whisper");
        REQUIRE(cfg.staging.suffix == ".wav");
        REQUIRE(cfg.staging.dir == "/var/tmp");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "model": { "size": "base" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model.size == "base");
        // Other fields retain defaults
        REQUIRE(cfg.model.url == "http://localhost:8080");
        REQUIRE(cfg.staging.suffix == ".webm");
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model.size == "tiny");
        REQUIRE(cfg.model.backend == "lan");
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/stt_test_nonexistent_config_file.json");
        REQUIRE(cfg.model.size == "tiny");
    }
}

TEST_CASE("Model size", "[config]") {

    SECTION("ParseKnownSizes") {
        REQUIRE(parse_model_size("tiny") == ModelSize::Tiny);
        REQUIRE(parse_model_size("base") == ModelSize::Base);
        REQUIRE(parse_model_size("small") == ModelSize::Small);
        REQUIRE(parse_model_size("medium") == ModelSize::Medium);
        REQUIRE(parse_model_size("large") == ModelSize::Large);
        REQUIRE(to_string(ModelSize::Medium) == "medium");
    }

    SECTION("ParseUnknownSize") {
        auto size = parse_model_size("huge");
        REQUIRE_FALSE(size.has_value());
        REQUIRE(size.error() == "unsupported model size: huge");
    }

    SECTION("ResolveDefaultsToTiny") {
        ScopedModelEnv env(nullptr);
        REQUIRE(resolve_model_size("") == ModelSize::Tiny);
    }

    SECTION("ResolveUsesConfiguredSize") {
        ScopedModelEnv env(nullptr);
        REQUIRE(resolve_model_size("small") == ModelSize::Small);
    }

    SECTION("EnvironmentOverridesConfiguredSize") {
        ScopedModelEnv env("medium");
        REQUIRE(resolve_model_size("small") == ModelSize::Medium);
    }

    SECTION("EmptyEnvironmentIsIgnored") {
        ScopedModelEnv env("");
        REQUIRE(resolve_model_size("base") == ModelSize::Base);
    }
}
