#include "aamva/identity_format.h"
#include "aamva/text_utils.h"
#include <vector>

namespace aamva {

std::string displayName(const ParsedIdentity& identity) {
    std::vector<std::string> parts;
    if (!identity.first_name.empty()) {
        parts.push_back(identity.first_name);
    }
    if (!identity.last_name.empty()) {
        parts.push_back(identity.last_name);
    }
    return parts.empty() ? "Unknown" : utils::join(parts, " ");
}

std::string fullDisplayName(const ParsedIdentity& identity) {
    std::vector<std::string> parts;
    if (!identity.first_name.empty()) {
        parts.push_back(identity.first_name);
    }
    if (identity.middle_name) {
        parts.push_back(*identity.middle_name);
    }
    if (!identity.last_name.empty()) {
        parts.push_back(identity.last_name);
    }
    return parts.empty() ? "Unknown" : utils::join(parts, " ");
}

std::optional<std::string> formattedAddress(const ParsedIdentity& identity) {
    std::vector<std::string> lines;

    if (identity.street_address) {
        lines.push_back(*identity.street_address);
    }

    std::vector<std::string> city_state_zip;
    for (const auto* part : {&identity.city, &identity.state, &identity.zip_code}) {
        if (*part) {
            city_state_zip.push_back(**part);
        }
    }
    if (!city_state_zip.empty()) {
        lines.push_back(utils::join(city_state_zip, ", "));
    }

    if (lines.empty()) {
        return std::nullopt;
    }
    return utils::join(lines, "\n");
}

std::optional<std::string> formattedDateOfBirth(const ParsedIdentity& identity) {
    normalize::CalendarDate date;
    if (!identity.date_of_birth || !normalize::parseIsoDate(*identity.date_of_birth, date)) {
        return std::nullopt;
    }

    std::string text = identity.date_of_birth->substr(5, 2) + "/" +
                       identity.date_of_birth->substr(8, 2) + "/" +
                       identity.date_of_birth->substr(0, 4);
    return text;
}

std::optional<int> age(const ParsedIdentity& identity, const normalize::CalendarDate& today) {
    normalize::CalendarDate birth;
    if (!identity.date_of_birth || !normalize::parseIsoDate(*identity.date_of_birth, birth)) {
        return std::nullopt;
    }

    int years = today.year - birth.year;
    if (today.month < birth.month || (today.month == birth.month && today.day < birth.day)) {
        years--;
    }

    if (years < 0) {
        return std::nullopt;
    }
    return years;
}

LicenseStatus licenseStatus(const ParsedIdentity& identity,
                            const normalize::CalendarDate& today,
                            int expiring_window_days) {
    LicenseStatus status;

    normalize::CalendarDate expiration;
    if (!identity.expiration_date ||
        !normalize::parseIsoDate(*identity.expiration_date, expiration)) {
        return status;
    }

    status.days_until_expiration =
        normalize::daysFromCivil(expiration) - normalize::daysFromCivil(today);

    // A card is valid through its expiration date
    if (status.days_until_expiration < 0) {
        status.state = LicenseState::EXPIRED;
    } else if (status.days_until_expiration <= expiring_window_days) {
        status.state = LicenseState::EXPIRING_SOON;
    } else {
        status.state = LicenseState::VALID;
    }

    return status;
}

} // namespace aamva
