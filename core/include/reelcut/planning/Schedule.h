#pragma once

#include <chrono>
#include <string>

namespace reelcut {
namespace planning {

// Parses "YYYY-MM-DD"; throws std::runtime_error on malformed or impossible dates.
std::chrono::year_month_day parse_date(const std::string& text);

// Current UTC calendar date.
std::chrono::year_month_day today();

std::chrono::year_month_day add_days(std::chrono::year_month_day date, int days);

// "YYYY-MM-DDTHH:MM:00"
std::string format_publish_time(std::chrono::year_month_day date, int hour, int minute);

// "DD.MM.YYYY"
std::string format_title_date(std::chrono::year_month_day date);

/**
 * Publication slot of a part: base + (firstDayOffset + partIndex) days at
 * hour:minute. partIndex is 0-based.
 */
std::chrono::year_month_day publish_date(std::chrono::year_month_day base, int firstDayOffset, int partIndex);

}  // namespace planning
}  // namespace reelcut
