#include <catch2/catch_test_macros.hpp>

#include "whisper/lan_transcriber.hpp"

TEST_CASE("LanTranscriber response parsing", "[whisper]") {

    SECTION("VerboseJson") {
        auto r = LanTranscriber::parse_response(R"({
            "task": "transcribe",
            "language": "english",
            "duration": 2.1,
            "text": " Hello there. ",
            "segments": [
                {"id": 0, "start": 0.0, "end": 1.0, "text": " Hello"},
                {"id": 1, "start": 1.0, "end": 2.1, "text": " there."}
            ]
        })");
        REQUIRE(r);
        REQUIRE(r->text == "Hello there.");
        REQUIRE(r->language == "english");
        REQUIRE(r->segments.size() == 2);
        REQUIRE(r->segments[1].start_s == 1.0);
        REQUIRE(r->segments[1].end_s == 2.1);
        REQUIRE(r->segments[1].text == "there.");
    }

    SECTION("PlainJson") {
        auto r = LanTranscriber::parse_response(R"({"text":"hi"})");
        REQUIRE(r);
        REQUIRE(r->text == "hi");
        REQUIRE(r->language.empty());
        REQUIRE(r->segments.empty());
    }

    SECTION("BlankTextIsNotAnError") {
        auto r = LanTranscriber::parse_response(R"({"text":"   "})");
        REQUIRE(r);
        REQUIRE(r->text.empty());
    }

    SECTION("ServerError") {
        auto r = LanTranscriber::parse_response(R"({"error":"failed to read WAV file"})");
        REQUIRE_FALSE(r);
        REQUIRE(r.error() == "server error: failed to read WAV file");

        auto openai = LanTranscriber::parse_response(R"({"error":{"message":"bad model"}})");
        REQUIRE_FALSE(openai);
        REQUIRE(openai.error() == "server error: bad model");
    }

    SECTION("NotJson") {
        auto r = LanTranscriber::parse_response("Internal Server Error");
        REQUIRE_FALSE(r);
        REQUIRE(r.error().starts_with("JSON parse error"));
    }
}
