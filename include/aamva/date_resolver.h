#ifndef AAMVA_DATE_RESOLVER_H
#define AAMVA_DATE_RESOLVER_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace aamva {
namespace normalize {

// Proleptic Gregorian calendar date
struct CalendarDate {
    int year = 0;
    int month = 0;
    int day = 0;
};

// Date layouts found in AAMVA date elements
enum class DateLayout : uint8_t {
    MMDDCCYY = 0,   // US issuers
    CCYYMMDD = 1    // Canadian issuers, some US revisions
};

bool isLeapYear(int year);
int daysInMonth(int year, int month);
bool isValidDate(int year, int month, int day);

// Days since 1970-01-01 (negative before)
int64_t daysFromCivil(const CalendarDate& date);

// "YYYY-MM-DD"
std::string toIsoString(const CalendarDate& date);

// Parse strict "YYYY-MM-DD"
bool parseIsoDate(std::string_view text, CalendarDate& date);

/**
 * Resolves 8-digit AAMVA dates to YYYY-MM-DD
 *
 * Non-digit characters are discarded and exactly 8 digits must remain.
 * MMDDCCYY is tried first, then CCYYMMDD; a layout is accepted only when the
 * month is 1-12 and the day exists in that month and year.
 */
class DateResolver {
public:
    static std::optional<std::string> resolve(std::string_view raw);

    // Same as resolve, reporting the date and the layout that matched
    static bool resolveDate(std::string_view raw, CalendarDate& date,
                            DateLayout* layout = nullptr);

private:
    static bool tryLayout(const char* digits, DateLayout layout, CalendarDate& date);
};

} // namespace normalize
} // namespace aamva

#endif // AAMVA_DATE_RESOLVER_H
