#include "aamva/field_extractor.h"
#include "aamva/element_table.h"
#include "aamva/name_caser.h"
#include "aamva/date_resolver.h"
#include "aamva/text_utils.h"
#include "aamva/log.h"

namespace aamva {

using normalize::NameCaser;
using normalize::DateResolver;

// Trimmed value, absent when nothing is left
static std::optional<std::string> trimmedValue(std::string_view raw) {
    std::string_view value = utils::trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string(value);
}

// Trimmed value passed through a normalizer, absent when empty
template <typename Normalizer>
static std::optional<std::string> normalizedValue(std::string_view raw, Normalizer normalizer) {
    std::string_view value = utils::trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    std::string result = normalizer(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

static std::optional<std::string> resolveDocumentDate(ElementId id, std::string_view raw) {
    auto date = DateResolver::resolve(raw);
    if (!date) {
        AAMVA_LOG_DEBUG("{} value ({} bytes) is not a valid date, ignoring",
                        elementCode(id), raw.size());
    }
    return date;
}

FieldExtractor::FieldExtractor(DobPolicy dob_policy)
    : dob_policy_(dob_policy) {}

ExtractResult FieldExtractor::extract(RecordTokenizer& records) const {
    ElementValues values;

    records.reset();
    RawRecord record;
    while (records.next(record)) {
        values[static_cast<size_t>(record.id)] = record.value;
    }

    return assemble(values);
}

ExtractResult FieldExtractor::extract(const std::vector<RawRecord>& records) const {
    ElementValues values;

    for (const auto& record : records) {
        values[static_cast<size_t>(record.id)] = record.value;
    }

    return assemble(values);
}

ExtractResult FieldExtractor::assemble(const ElementValues& values) const {
    ExtractResult result;
    result.success = false;

    ParsedIdentity identity;
    PendingFields pending;

    for (size_t i = 0; i < ELEMENT_COUNT; i++) {
        if (values[i]) {
            applyElement(static_cast<ElementId>(i), *values[i], identity, pending);
        }
    }

    // Direct elements first, then the composite DAA
    normalize::SplitName composite;
    if (pending.composite) {
        composite = normalize::FullNameSplitter::split(*pending.composite);
        identity.full_name = normalizedValue(*pending.composite,
                                             normalize::FullNameSplitter::normalize);
    }

    auto last = pending.last ? pending.last : pending.last_alt ? pending.last_alt : composite.last;
    auto first = pending.first ? pending.first : pending.first_alt ? pending.first_alt : composite.first;
    auto middle = pending.middle ? pending.middle : composite.middle;

    // A body with no usable name is not a license, whatever else it carries
    if (!last || !first) {
        AAMVA_LOG_DEBUG("No usable name elements (last: {}, first: {})",
                        last.has_value(), first.has_value());
        result.error = ErrorCode::INVALID_FORMAT;
        result.error_message = "No name could be derived from DCS/DAC/DAA elements";
        return result;
    }

    if (pending.date_of_birth_unresolved) {
        if (dob_policy_ == DobPolicy::REQUIRE_VALID) {
            AAMVA_LOG_DEBUG("DBB value is not a valid date");
            result.error = ErrorCode::INVALID_FIELD;
            result.error_message = "Failed to parse field: DBB (date of birth)";
            return result;
        }
        AAMVA_LOG_DEBUG("DBB value is not a valid date, ignoring");
    }

    identity.last_name = *last;
    identity.first_name = *first;
    identity.middle_name = middle;

    result.success = true;
    result.identity = std::move(identity);
    return result;
}

void FieldExtractor::applyElement(ElementId id, std::string_view value, ParsedIdentity& identity,
                                  PendingFields& pending) {
    switch (id) {
        case ElementId::FAMILY_NAME:
            pending.last = normalizedValue(value, NameCaser::normalize);
            break;
        case ElementId::FIRST_NAME:
            pending.first = normalizedValue(value, NameCaser::normalize);
            break;
        case ElementId::MIDDLE_NAME:
            pending.middle = normalizedValue(value, NameCaser::normalize);
            break;
        case ElementId::FULL_NAME:
            pending.composite = value;
            break;
        case ElementId::FAMILY_NAME_ALT:
            pending.last_alt = normalizedValue(value, NameCaser::normalize);
            break;
        case ElementId::GIVEN_NAME_ALT:
            pending.first_alt = normalizedValue(value, NameCaser::normalize);
            break;

        case ElementId::DATE_OF_BIRTH: {
            // Blank DBB is treated like a missing one
            std::string_view trimmed = utils::trim(value);
            if (!trimmed.empty()) {
                identity.date_of_birth = DateResolver::resolve(trimmed);
                pending.date_of_birth_unresolved = !identity.date_of_birth;
            }
            break;
        }
        case ElementId::EXPIRATION_DATE:
            identity.expiration_date = resolveDocumentDate(id, value);
            break;
        case ElementId::ISSUE_DATE:
            identity.issue_date = resolveDocumentDate(id, value);
            break;

        case ElementId::STREET_ADDRESS:
            identity.street_address = normalizedValue(value, normalize::AddressCaser::normalize);
            break;
        case ElementId::CITY:
            identity.city = normalizedValue(value, utils::titleCaseWords);
            break;
        case ElementId::JURISDICTION:
            identity.state = normalizedValue(value, utils::toUpper);
            break;
        case ElementId::POSTAL_CODE:
            identity.zip_code = normalizedValue(value, normalize::ZipTrimmer::normalize);
            break;

        case ElementId::CUSTOMER_ID:
            identity.license_number = trimmedValue(value);
            break;
        case ElementId::HEIGHT:
            identity.height = trimmedValue(value);
            break;
        case ElementId::EYE_COLOR:
            identity.eye_color = trimmedValue(value);
            break;
    }
}

} // namespace aamva
