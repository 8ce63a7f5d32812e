#include <catch2/catch.hpp>

#include "whisper/lan_backend.hpp"

TEST_CASE("Inference response parsing", "[lan]") {

    SECTION("VerboseJson") {
        auto result = parse_inference_response(R"({
            "task": "transcribe",
            "language": "english",
            "duration": 3.1,
            "text": " Hello there. General Kenobi.\n",
            "segments": [
                {"id": 0, "start": 0.0, "end": 1.4, "text": " Hello there."},
                {"id": 1, "start": 1.4, "end": 3.1, "text": " General Kenobi."}
            ]
        })");

        REQUIRE(result);
        REQUIRE(result->text == "Hello there. General Kenobi.");
        REQUIRE(result->language == "english");
        REQUIRE(result->segments.size() == 2);
        REQUIRE(result->segments[0] == Segment{.start = 0.0, .end = 1.4, .text = "Hello there."});
        REQUIRE(result->segments[1].end == 3.1);
    }

    SECTION("PlainJsonHasNoLanguage") {
        auto result = parse_inference_response(R"({"text": "just text"})");
        REQUIRE(result);
        REQUIRE(result->text == "just text");
        REQUIRE(result->language.empty());
        REQUIRE(result->segments.empty());
    }

    SECTION("ServerError") {
        auto result = parse_inference_response(R"({"error": "failed to read audio"})");
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == "server error: failed to read audio");
    }

    SECTION("MissingText") {
        auto result = parse_inference_response(R"({"segments": []})");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().starts_with("unexpected response"));
    }

    SECTION("NotJson") {
        auto result = parse_inference_response("<html>502 Bad Gateway</html>");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().starts_with("JSON parse error"));
    }
}
