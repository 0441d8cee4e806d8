#pragma once

#include "meeting.hpp"

#include <optional>
#include <string>
#include <string_view>

enum class ExportFormat { PlainText, Rttm };

std::optional<ExportFormat> export_format_from_string(std::string_view s);

// "Speaker N: text" per utterance, speakers numbered from 1.
std::string to_plain_text(const Meeting& meeting);

// NIST RTTM speaker turns, one SPEAKER line per utterance.
std::string to_rttm(const Meeting& meeting);

std::string export_meeting(const Meeting& meeting, ExportFormat format);
