#ifndef AAMVA_HEADER_VALIDATOR_H
#define AAMVA_HEADER_VALIDATOR_H

#include "aamva/types.h"
#include <cstddef>
#include <string>
#include <string_view>

namespace aamva {

// Header layout constants (AAMVA DL/ID Card Design Standard)
constexpr std::string_view FILE_TYPE_MARKER = "ANSI ";
constexpr size_t IIN_LENGTH = 6;
constexpr size_t SUBFILE_TYPE_LENGTH = 2;
constexpr size_t SUBFILE_DESIGNATOR_LENGTH = 10;   // type + offset(4) + length(4)
constexpr size_t DEFAULT_HEADER_SEARCH_WINDOW = 32;
constexpr size_t DEFAULT_MAX_PAYLOAD_SIZE = 4096;

// Header validation result
struct HeaderResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string error_message;

    HeaderInfo header;
    std::string_view body;  // Views into the validated payload
};

/**
 * Validates the compliance preamble and ANSI issuer header
 *
 * The "ANSI " marker must begin within the first search_window bytes and be
 * followed by a 6-digit IIN. Version, entry count and subfile designators are
 * read when present; scanners and older cards often truncate them.
 */
class HeaderValidator {
public:
    HeaderValidator();
    HeaderValidator(size_t search_window, size_t max_payload_size);

    /**
     * Validate raw and split off the record body
     * The returned body views into raw, which must outlive it.
     */
    HeaderResult validate(std::string_view raw) const;

private:
    // Reads the fields following the IIN; returns the offset of the body
    size_t parseHeaderFields(std::string_view raw, size_t pos, HeaderInfo& header) const;

    size_t search_window_;
    size_t max_payload_size_;
};

} // namespace aamva

#endif // AAMVA_HEADER_VALIDATOR_H
