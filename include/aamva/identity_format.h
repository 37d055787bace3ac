#ifndef AAMVA_IDENTITY_FORMAT_H
#define AAMVA_IDENTITY_FORMAT_H

#include "aamva/types.h"
#include "aamva/date_resolver.h"
#include <cstdint>
#include <optional>
#include <string>

namespace aamva {

// Document validity relative to a reference date
enum class LicenseState : uint8_t {
    UNKNOWN = 0,        // No usable expiration date
    VALID = 1,
    EXPIRING_SOON = 2,  // Within the expiring window
    EXPIRED = 3
};

struct LicenseStatus {
    LicenseState state = LicenseState::UNKNOWN;
    int64_t days_until_expiration = 0;  // Negative once expired
};

constexpr int DEFAULT_EXPIRING_WINDOW_DAYS = 30;

// "John Johnson"
std::string displayName(const ParsedIdentity& identity);

// "John Michael Johnson"
std::string fullDisplayName(const ParsedIdentity& identity);

// "123 Main St\nSan Francisco, CA, 941100000"; absent with no address parts
std::optional<std::string> formattedAddress(const ParsedIdentity& identity);

// MM/DD/YYYY
std::optional<std::string> formattedDateOfBirth(const ParsedIdentity& identity);

// Completed years between date of birth and today
// Absent without a valid date of birth or when today precedes it. A Feb 29
// birthday is reached on Mar 1 in common years.
std::optional<int> age(const ParsedIdentity& identity, const normalize::CalendarDate& today);

/**
 * Expiration status of the document as of today
 * The caller supplies the reference date; nothing here reads the clock.
 */
LicenseStatus licenseStatus(const ParsedIdentity& identity,
                            const normalize::CalendarDate& today,
                            int expiring_window_days = DEFAULT_EXPIRING_WINDOW_DAYS);

} // namespace aamva

#endif // AAMVA_IDENTITY_FORMAT_H
