#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace DateUtils {

enum class LocaleHint {
    AUTO,
    DMY,
    MDY
};

/**
 * @brief Parses a date or date-time cell into Unix seconds (wall-clock time, zones dropped).
 * @details Accepted date parts: YYYY-MM-DD, YYYY/MM/DD, YYYY.MM.DD, DD/MM/YYYY or MM/DD/YYYY,
 * DD-MM-YYYY, two-digit-year variants, all with 1 or 2 digit day and month, and English month
 * names (05-Mar-2024, 5 March 2024, Mar 5, 2024). An optional time part follows a space or 'T':
 * HH:MM[:SS[.fff]] with an optional AM/PM marker and an optional Z, UTC, GMT or +HH[:MM] zone.
 * Bare 9-10 digit integers are read as epoch seconds.
 */
bool parseDateTime(const std::string& value, int64_t& outUnixSeconds, LocaleHint hint = LocaleHint::AUTO);

std::string formatCalendarDay(int64_t unixSeconds);

// Calendar day ("YYYY-MM-DD") of a cell whose date part parses, std::nullopt otherwise.
// An unreadable time part does not prevent the day from being returned.
std::optional<std::string> calendarDay(const std::string& value, LocaleHint hint = LocaleHint::AUTO);

} // namespace DateUtils
