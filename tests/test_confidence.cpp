#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "confidence.hpp"

#include <vector>

TEST_CASE("estimate_confidence", "[confidence]") {

    SECTION("EmptySegments") {
        std::vector<Segment> segments;
        REQUIRE(estimate_confidence(segments) == 0.0);
    }

    SECTION("NoSegmentReportsProbability") {
        std::vector<Segment> segments = {
            {.start = 0.0, .end = 1.0, .text = "a"},
            {.start = 1.0, .end = 2.0, .text = "b"},
        };
        REQUIRE(estimate_confidence(segments) == 0.0);
    }

    SECTION("AveragesInvertedProbabilities") {
        std::vector<Segment> segments = {
            {.no_speech_prob = 0.1},
            {.no_speech_prob = 0.3},
        };
        REQUIRE(estimate_confidence(segments) == Catch::Approx(0.8));
    }

    SECTION("SkipsSegmentsWithoutProbability") {
        std::vector<Segment> segments = {
            {.no_speech_prob = 0.0},
            {.text = "no field"},
        };
        REQUIRE(estimate_confidence(segments) == Catch::Approx(1.0));
    }

    SECTION("DurationIsNotAWeight") {
        std::vector<Segment> segments = {
            {.start = 0.0, .end = 100.0, .no_speech_prob = 0.0},
            {.start = 100.0, .end = 101.0, .no_speech_prob = 1.0},
        };
        REQUIRE(estimate_confidence(segments) == Catch::Approx(0.5));
    }
}
