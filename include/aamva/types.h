#ifndef AAMVA_TYPES_H
#define AAMVA_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aamva {

// Failure kinds reported by the decoder
enum class ErrorCode : uint8_t {
    NONE = 0,
    EMPTY_INPUT = 1,        // Payload has zero length
    INVALID_FORMAT = 2,     // No ANSI header, or no name could be derived
    INVALID_FIELD = 3       // Date of birth present but unresolvable
};

// Subfile type announced in the header
enum class DocumentType : uint8_t {
    UNKNOWN = 0,
    DRIVER_LICENSE = 1,     // "DL"
    ID_CARD = 2             // "ID"
};

// Handling of a DBB element that resolves under no date layout
enum class DobPolicy : uint8_t {
    REQUIRE_VALID = 0,      // Fail the parse with INVALID_FIELD
    BEST_EFFORT = 1         // Leave date_of_birth absent
};

// Data element identifiers understood by the decoder
enum class ElementId : uint8_t {
    FAMILY_NAME = 0,        // DCS
    FIRST_NAME,             // DAC
    MIDDLE_NAME,            // DAD
    FULL_NAME,              // DAA (LAST,FIRST[,MIDDLE])
    DATE_OF_BIRTH,          // DBB
    STREET_ADDRESS,         // DAG
    CITY,                   // DAI
    JURISDICTION,           // DAJ
    POSTAL_CODE,            // DAK
    CUSTOMER_ID,            // DAQ
    EXPIRATION_DATE,        // DBA
    ISSUE_DATE,             // DBD
    HEIGHT,                 // DAU
    EYE_COLOR,              // DAY
    FAMILY_NAME_ALT,        // DAB (pre-2005 cards)
    GIVEN_NAME_ALT          // DCT (pre-2009 cards)
};

constexpr size_t ELEMENT_COUNT = 16;

// One element record; value views into the caller's payload
struct RawRecord {
    ElementId id = ElementId::FAMILY_NAME;
    std::string_view value;
};

// Subfile designator entry from the header
struct SubfileDesignator {
    std::string type;       // "DL", "ID", "ZC", ...
    uint32_t offset = 0;
    uint32_t length = 0;
};

// Header fields recovered by the validator
struct HeaderInfo {
    std::string issuer_id;          // 6-digit IIN
    int aamva_version = -1;         // -1 when absent
    int jurisdiction_version = -1;  // -1 when absent
    int entry_count = -1;           // -1 when absent
    std::vector<SubfileDesignator> subfiles;
    DocumentType document_type = DocumentType::UNKNOWN;
};

// Normalized identity extracted from a payload
struct ParsedIdentity {
    // Required
    std::string last_name;
    std::string first_name;

    std::optional<std::string> middle_name;
    std::optional<std::string> full_name;           // DAA as "Last,First,Middle"
    std::optional<std::string> date_of_birth;       // YYYY-MM-DD

    // Address
    std::optional<std::string> street_address;
    std::optional<std::string> city;
    std::optional<std::string> state;               // Jurisdiction code
    std::optional<std::string> zip_code;

    // Document
    std::optional<std::string> license_number;
    std::optional<std::string> issue_date;          // YYYY-MM-DD
    std::optional<std::string> expiration_date;     // YYYY-MM-DD

    // Physical
    std::optional<std::string> height;
    std::optional<std::string> eye_color;

    // Header metadata
    std::string issuer_id;
    int aamva_version = -1;
    DocumentType document_type = DocumentType::UNKNOWN;
};

// Parse result returned by the parser
struct ParseResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string error_message;

    // Valid only if success
    ParsedIdentity identity;
};

// Short description of an error code
const char* errorCodeName(ErrorCode code);

} // namespace aamva

#endif // AAMVA_TYPES_H
