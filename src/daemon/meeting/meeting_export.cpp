#include "meeting_export.hpp"

#include <algorithm>
#include <format>

std::optional<ExportFormat> export_format_from_string(std::string_view s) {
    if (s == "txt" || s == "text") return ExportFormat::PlainText;
    if (s == "rttm") return ExportFormat::Rttm;
    return std::nullopt;
}

std::string to_plain_text(const Meeting& meeting) {
    std::string out;
    for (const auto& u : meeting.utterances) {
        if (!out.empty()) out += '\n';
        out += std::format("Speaker {}: {}", u.speaker_index + 1, u.text);
    }
    return out;
}

std::string to_rttm(const Meeting& meeting) {
    std::string out;
    for (const auto& u : meeting.utterances) {
        if (!out.empty()) out += '\n';
        double duration = std::max(0.0, u.end_time - u.start_time);
        out += std::format("SPEAKER meeting 1 {:.3f} {:.3f} <NA> <NA> speaker_{} <NA> <NA>",
                           u.start_time, duration, u.speaker_index);
    }
    return out;
}

std::string export_meeting(const Meeting& meeting, ExportFormat format) {
    switch (format) {
        case ExportFormat::PlainText: return to_plain_text(meeting);
        case ExportFormat::Rttm: return to_rttm(meeting);
    }
    return {};
}
