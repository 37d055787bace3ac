#include "aamva/date_resolver.h"
#include "aamva/text_utils.h"
#include <cstdio>

namespace aamva {
namespace normalize {

constexpr size_t DATE_DIGITS = 8;

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

bool isValidDate(int year, int month, int day) {
    if (year < 1 || year > 9999) {
        return false;
    }
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= daysInMonth(year, month);
}

// Howard Hinnant's days_from_civil
int64_t daysFromCivil(const CalendarDate& date) {
    int64_t y = date.year;
    const int64_t m = date.month;
    const int64_t d = date.day;

    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;

    return era * 146097 + doe - 719468;
}

std::string toIsoString(const CalendarDate& date) {
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d",
                  date.year, date.month, date.day);
    return buffer;
}

static int readNumber(const char* digits, size_t count) {
    int value = 0;
    for (size_t i = 0; i < count; i++) {
        value = value * 10 + (digits[i] - '0');
    }
    return value;
}

bool parseIsoDate(std::string_view text, CalendarDate& date) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!utils::isAsciiDigit(text[i])) {
            return false;
        }
    }

    CalendarDate parsed;
    parsed.year = readNumber(text.data(), 4);
    parsed.month = readNumber(text.data() + 5, 2);
    parsed.day = readNumber(text.data() + 8, 2);

    if (!isValidDate(parsed.year, parsed.month, parsed.day)) {
        return false;
    }

    date = parsed;
    return true;
}

bool DateResolver::tryLayout(const char* digits, DateLayout layout, CalendarDate& date) {
    CalendarDate candidate;

    switch (layout) {
        case DateLayout::MMDDCCYY:
            candidate.month = readNumber(digits, 2);
            candidate.day = readNumber(digits + 2, 2);
            candidate.year = readNumber(digits + 4, 4);
            break;
        case DateLayout::CCYYMMDD:
            candidate.year = readNumber(digits, 4);
            candidate.month = readNumber(digits + 4, 2);
            candidate.day = readNumber(digits + 6, 2);
            break;
    }

    if (!isValidDate(candidate.year, candidate.month, candidate.day)) {
        return false;
    }

    date = candidate;
    return true;
}

bool DateResolver::resolveDate(std::string_view raw, CalendarDate& date, DateLayout* layout) {
    char digits[DATE_DIGITS];
    size_t count = 0;

    for (char c : raw) {
        if (!utils::isAsciiDigit(c)) {
            continue;
        }
        if (count == DATE_DIGITS) {
            return false;  // Too many digits
        }
        digits[count++] = c;
    }

    if (count != DATE_DIGITS) {
        return false;
    }

    // Month-first is the common US layout; calendar order is the fallback
    for (DateLayout candidate : {DateLayout::MMDDCCYY, DateLayout::CCYYMMDD}) {
        if (tryLayout(digits, candidate, date)) {
            if (layout) {
                *layout = candidate;
            }
            return true;
        }
    }

    return false;
}

std::optional<std::string> DateResolver::resolve(std::string_view raw) {
    CalendarDate date;
    if (!resolveDate(raw, date)) {
        return std::nullopt;
    }
    return toIsoString(date);
}

} // namespace normalize
} // namespace aamva
