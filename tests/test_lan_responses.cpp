#include <catch2/catch_test_macros.hpp>

#include "inference/lan_backend.hpp"
#include "inference/lan_diarization_model.hpp"
#include "inference/lan_health_check.hpp"

TEST_CASE("Transcript responses", "[lan]") {

    SECTION("TextIsTrimmed") {
        auto r = parse_transcript_response(R"({"text": "  hello world \n"})");
        REQUIRE(r.has_value());
        REQUIRE(*r == "hello world");
    }

    SECTION("EmptyTextIsNotAnError") {
        auto r = parse_transcript_response(R"({"text": ""})");
        REQUIRE(r.has_value());
        REQUIRE(r->empty());
    }

    SECTION("ServerError") {
        auto r = parse_transcript_response(R"({"error": "model not loaded"})");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().find("model not loaded") != std::string::npos);
    }

    SECTION("NotJson") {
        REQUIRE_FALSE(parse_transcript_response("<html>502</html>").has_value());
    }

    SECTION("WrongShape") {
        REQUIRE_FALSE(parse_transcript_response(R"({"result": "x"})").has_value());
        REQUIRE_FALSE(parse_transcript_response(R"({"text": 5})").has_value());
    }
}

TEST_CASE("Diarization responses", "[lan]") {

    SECTION("Segments") {
        auto r = parse_diarization_response(R"({"segments": [
            {"start": 1.5, "end": 3.0, "speaker": 1},
            {"start": 0.0, "end": 1.5, "speaker": -1}
        ]})");
        REQUIRE(r.has_value());
        REQUIRE(r->size() == 2);
        REQUIRE((*r)[0].start == 1.5);
        REQUIRE((*r)[0].speaker == 1);
        REQUIRE((*r)[1].speaker == -1);
    }

    SECTION("NoSegments") {
        auto r = parse_diarization_response(R"({"segments": []})");
        REQUIRE(r.has_value());
        REQUIRE(r->empty());
    }

    SECTION("ServerError") {
        REQUIRE_FALSE(parse_diarization_response(R"({"error": "audio too short"})").has_value());
    }

    SECTION("MissingFields") {
        REQUIRE_FALSE(parse_diarization_response(R"({"segments": [{"start": 1.0}]})").has_value());
        REQUIRE_FALSE(parse_diarization_response(R"({})").has_value());
        REQUIRE_FALSE(parse_diarization_response("nope").has_value());
    }
}

TEST_CASE("Health responses", "[lan]") {
    REQUIRE(is_healthy_response({.status = 200, .body = R"({"status": "ready"})"}));
    REQUIRE(is_healthy_response({.status = 200, .body = R"({"status": "ok", "model": "x"})"}));
    REQUIRE_FALSE(is_healthy_response({.status = 200, .body = R"({"status": "loading"})"}));
    REQUIRE_FALSE(is_healthy_response({.status = 503, .body = R"({"status": "ready"})"}));
    REQUIRE_FALSE(is_healthy_response({.status = 200, .body = "OK"}));
    REQUIRE_FALSE(is_healthy_response({.status = 200, .body = R"({"status": 1})"}));
    REQUIRE_FALSE(is_healthy_response({.status = 200, .body = R"(["ready"])"}));
}
