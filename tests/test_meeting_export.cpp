#include <catch2/catch_test_macros.hpp>

#include "meeting/meeting_export.hpp"

TEST_CASE("Meeting export", "[export]") {
    Meeting m{.id = "m1", .title = "Sync"};
    m.utterances = {
        Utterance::make(0, 0.0, 2.5, "Good morning."),
        Utterance::make(1, 2.5, 4.25, "Morning!"),
        Utterance::make(0, 5.0, 4.0, "Backwards."),
    };

    SECTION("PlainText") {
        REQUIRE(to_plain_text(m) ==
                "Speaker 1: Good morning.\n"
                "Speaker 2: Morning!\n"
                "Speaker 1: Backwards.");
    }

    SECTION("Rttm") {
        REQUIRE(to_rttm(m) ==
                "SPEAKER meeting 1 0.000 2.500 <NA> <NA> speaker_0 <NA> <NA>\n"
                "SPEAKER meeting 1 2.500 1.750 <NA> <NA> speaker_1 <NA> <NA>\n"
                "SPEAKER meeting 1 5.000 0.000 <NA> <NA> speaker_0 <NA> <NA>");
    }

    SECTION("EmptyMeeting") {
        Meeting empty{.id = "m2"};
        REQUIRE(to_plain_text(empty).empty());
        REQUIRE(to_rttm(empty).empty());
    }

    SECTION("FormatNames") {
        REQUIRE(export_format_from_string("txt") == ExportFormat::PlainText);
        REQUIRE(export_format_from_string("text") == ExportFormat::PlainText);
        REQUIRE(export_format_from_string("rttm") == ExportFormat::Rttm);
        REQUIRE_FALSE(export_format_from_string("srt").has_value());
        REQUIRE(export_meeting(m, ExportFormat::Rttm) == to_rttm(m));
    }
}
