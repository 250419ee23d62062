#include "reelcut/planning/Schedule.h"

#include <cstdio>
#include <stdexcept>

namespace reelcut {
namespace planning {

using namespace std::chrono;

year_month_day parse_date(const std::string& text) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    char tail = '\0';
    if (std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) {
        throw std::runtime_error("Invalid date (expected YYYY-MM-DD): " + text);
    }
    const year_month_day date{year{y}, month{m}, day{d}};
    if (!date.ok()) {
        throw std::runtime_error("Invalid calendar date: " + text);
    }
    return date;
}

year_month_day today() {
    return year_month_day{floor<days>(system_clock::now())};
}

year_month_day add_days(year_month_day date, int count) {
    return year_month_day{sys_days{date} + days{count}};
}

std::string format_publish_time(year_month_day date, int hour, int minute) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:00",
                  static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()), hour, minute);
    return buf;
}

std::string format_title_date(year_month_day date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02u.%02u.%04d",
                  static_cast<unsigned>(date.day()), static_cast<unsigned>(date.month()),
                  static_cast<int>(date.year()));
    return buf;
}

year_month_day publish_date(year_month_day base, int firstDayOffset, int partIndex) {
    return add_days(base, firstDayOffset + partIndex);
}

}  // namespace planning
}  // namespace reelcut
