#include "DateUtils.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <vector>

namespace DateUtils {
namespace {
bool parseDigits(const std::string& s, int& out) {
    if (s.empty() || s.size() > 4) return false;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) return false;
    const char* b = s.data();
    const char* e = b + s.size();
    auto [p, ec] = std::from_chars(b, e, out, 10);
    return ec == std::errc{} && p == e;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t days, int& year, int& month, int& day) {
    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
    month = static_cast<int>(m);
    day = static_cast<int>(d);
}

bool parseLikelyEpochSeconds(const std::string& s, int64_t& out) {
    if (s.size() < 9 || s.size() > 10) return false;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) return false;
    const char* b = s.data();
    const char* e = b + s.size();
    auto [p, ec] = std::from_chars(b, e, out, 10);
    if (ec != std::errc{} || p != e) return false;
    constexpr int64_t kEpochMin = 0;           // 1970-01-01T00:00:00Z
    constexpr int64_t kEpochMax = 2524608000;  // 2050-01-01T00:00:00Z
    return out >= kEpochMin && out <= kEpochMax;
}

int expandTwoDigitYear(int yy) {
    return (yy >= 70) ? (1900 + yy) : (2000 + yy);
}

// Month number for an English month name or its three-letter abbreviation, 0 otherwise.
int monthFromName(const std::string& token) {
    static const char* kMonthNames[12] = {"january", "february", "march", "april", "may", "june",
                                          "july", "august", "september", "october", "november", "december"};
    const std::string t = CommonUtils::toLower(token);
    if (t.size() < 3) return 0;
    if (t == "sept") return 9;
    for (int i = 0; i < 12; ++i) {
        const std::string name = kMonthNames[i];
        if (t == name || t == name.substr(0, 3)) return i + 1;
    }
    return 0;
}

bool parseYearField(const std::string& s, int& year) {
    if (s.size() != 4 && s.size() != 2) return false;
    if (!parseDigits(s, year)) return false;
    if (s.size() == 2) year = expandTwoDigitYear(year);
    return true;
}

bool parseDatePart(const std::string& datePart, LocaleHint hint, int& year, int& month, int& day) {
    const char sep = datePart.find('-') != std::string::npos ? '-'
                   : datePart.find('/') != std::string::npos ? '/'
                   : '.';
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        const size_t pos = datePart.find(sep, start);
        fields.push_back(datePart.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    if (fields.size() != 3) return false;

    // DD-Mon-YYYY, Mon-DD-YYYY.
    const int namedMiddle = monthFromName(fields[1]);
    const int namedFirst = monthFromName(fields[0]);
    if (namedMiddle != 0 || namedFirst != 0) {
        const std::string& dayField = namedMiddle != 0 ? fields[0] : fields[1];
        if (dayField.size() > 2 || !parseDigits(dayField, day)) return false;
        month = namedMiddle != 0 ? namedMiddle : namedFirst;
        return parseYearField(fields[2], year);
    }

    int a = 0;
    int b = 0;
    int c = 0;
    if (!parseDigits(fields[0], a) || !parseDigits(fields[1], b) || !parseDigits(fields[2], c)) return false;

    // Year first: YYYY-MM-DD, YYYY/MM/DD.
    if (fields[0].size() == 4) {
        year = a;
        month = b;
        day = c;
        return true;
    }
    if (fields[0].size() > 2 || fields[1].size() > 2) return false;
    if (!parseYearField(fields[2], year)) return false;

    if ((sep == '-' || sep == '.') && fields[2].size() == 4) {
        // DD-MM-YYYY, DD.MM.YYYY
        day = a;
        month = b;
        return true;
    }

    if (hint == LocaleHint::DMY) {
        day = a;
        month = b;
    } else if (hint == LocaleHint::MDY) {
        month = a;
        day = b;
    } else if (a > 12 && b <= 12) {
        day = a;
        month = b;
    } else {
        month = a;
        day = b;
    }
    return true;
}

// Case-insensitive removal of a trailing marker such as "pm" or "utc".
bool stripSuffix(std::string& s, const std::string& lowerSuffix) {
    if (s.size() < lowerSuffix.size()) return false;
    if (CommonUtils::toLower(s.substr(s.size() - lowerSuffix.size())) != lowerSuffix) return false;
    s = CommonUtils::trim(s.substr(0, s.size() - lowerSuffix.size()));
    return true;
}

// HH, HHMM or HH:MM after the sign of a UTC offset.
bool isUtcOffset(std::string offset) {
    if (offset.size() == 5 && offset[2] == ':') offset.erase(2, 1);
    if (offset.size() != 2 && offset.size() != 4) return false;
    int hours = 0;
    int minutes = 0;
    if (!parseDigits(offset.substr(0, 2), hours)) return false;
    if (offset.size() == 4 && !parseDigits(offset.substr(2), minutes)) return false;
    return hours <= 14 && minutes < 60;
}

// Zone designators are accepted and dropped; the wall-clock time is kept.
bool parseTimePart(std::string timePart, int& hour, int& minute, int& second) {
    hour = minute = second = 0;
    timePart = CommonUtils::trim(timePart);
    if (timePart.empty()) return true;

    bool twelveHour = false;
    bool pm = false;
    if (stripSuffix(timePart, "am")) {
        twelveHour = true;
    } else if (stripSuffix(timePart, "pm")) {
        twelveHour = true;
        pm = true;
    }

    const size_t sign = timePart.find_first_of("+-");
    if (sign != std::string::npos) {
        if (!isUtcOffset(timePart.substr(sign + 1))) return false;
        timePart = CommonUtils::trim(timePart.substr(0, sign));
    }
    if (!stripSuffix(timePart, "utc") && !stripSuffix(timePart, "gmt")) stripSuffix(timePart, "z");

    const size_t dot = timePart.find('.');
    if (dot != std::string::npos) timePart.erase(dot);

    const size_t c1 = timePart.find(':');
    if (c1 == std::string::npos) return false;
    const size_t c2 = timePart.find(':', c1 + 1);
    if (!parseDigits(timePart.substr(0, c1), hour)) return false;
    if (c2 == std::string::npos) {
        if (!parseDigits(timePart.substr(c1 + 1), minute)) return false;
    } else if (!parseDigits(timePart.substr(c1 + 1, c2 - c1 - 1), minute) ||
               !parseDigits(timePart.substr(c2 + 1), second)) {
        return false;
    }

    if (twelveHour) {
        if (hour < 1 || hour > 12) return false;
        hour = hour % 12 + (pm ? 12 : 0);
    }
    return true;
}

// "Mar 5, 2024 9:00" and "5 March 2024" spread the date over three tokens; otherwise the
// date ends at the first space or at a 'T' between digits.
void splitDateTime(const std::string& s, std::string& datePart, std::string& timePart) {
    const std::vector<std::string> tokens = CommonUtils::splitOnAny(s, " ,");
    if (tokens.size() >= 3 && (monthFromName(tokens[0]) != 0 || monthFromName(tokens[1]) != 0)) {
        datePart = tokens[0] + "-" + tokens[1] + "-" + tokens[2];
        timePart = CommonUtils::join(std::vector<std::string>(tokens.begin() + 3, tokens.end()), " ");
        return;
    }

    size_t sep = s.find(' ');
    if (sep == std::string::npos) {
        for (size_t i = 1; i + 1 < s.size(); ++i) {
            if ((s[i] == 'T' || s[i] == 't') && std::isdigit(static_cast<unsigned char>(s[i - 1])) != 0 &&
                std::isdigit(static_cast<unsigned char>(s[i + 1])) != 0) {
                sep = i;
                break;
            }
        }
    }
    if (sep == std::string::npos) {
        datePart = s;
        timePart.clear();
        return;
    }
    datePart = s.substr(0, sep);
    timePart = CommonUtils::trim(s.substr(sep + 1));
}

bool parseCivilDate(const std::string& s, LocaleHint hint, int& year, int& month, int& day, std::string& timePart) {
    std::string datePart;
    splitDateTime(s, datePart, timePart);
    if (!parseDatePart(datePart, hint, year, month, day)) return false;
    if (month < 1 || month > 12) return false;
    return day >= 1 && day <= daysInMonth(year, month);
}
} // namespace

bool parseDateTime(const std::string& value, int64_t& outUnixSeconds, LocaleHint hint) {
    const std::string s = CommonUtils::trim(value);
    if (s.empty()) return false;

    if (parseLikelyEpochSeconds(s, outUnixSeconds)) {
        return true;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    std::string timePart;
    if (!parseCivilDate(s, hint, year, month, day, timePart)) return false;
    if (!parseTimePart(timePart, hour, minute, second)) return false;
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) return false;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    outUnixSeconds = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second;
    return true;
}

std::string formatCalendarDay(int64_t unixSeconds) {
    int64_t days = unixSeconds / 86400;
    if (unixSeconds % 86400 < 0) --days;

    int year = 0;
    int month = 0;
    int day = 0;
    civilFromDays(days, year, month, day);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return std::string(buf);
}

std::optional<std::string> calendarDay(const std::string& value, LocaleHint hint) {
    const std::string s = CommonUtils::trim(value);
    if (s.empty()) return std::nullopt;

    int64_t ts = 0;
    if (parseLikelyEpochSeconds(s, ts)) return formatCalendarDay(ts);

    int year = 0;
    int month = 0;
    int day = 0;
    std::string timePart;
    if (!parseCivilDate(s, hint, year, month, day, timePart)) return std::nullopt;
    return formatCalendarDay(daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400);
}

} // namespace DateUtils
