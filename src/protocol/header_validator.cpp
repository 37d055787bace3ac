#include "aamva/header_validator.h"
#include "aamva/text_utils.h"
#include "aamva/log.h"
#include <algorithm>

namespace aamva {

static bool allDigits(std::string_view text) {
    return std::all_of(text.begin(), text.end(), utils::isAsciiDigit);
}

static bool readDigits(std::string_view raw, size_t pos, size_t count, uint32_t& value) {
    if (pos + count > raw.size() || !allDigits(raw.substr(pos, count))) {
        return false;
    }
    value = 0;
    for (size_t i = 0; i < count; i++) {
        value = value * 10 + static_cast<uint32_t>(raw[pos + i] - '0');
    }
    return true;
}

static DocumentType documentTypeFromCode(std::string_view code) {
    if (code == "DL") {
        return DocumentType::DRIVER_LICENSE;
    }
    if (code == "ID") {
        return DocumentType::ID_CARD;
    }
    return DocumentType::UNKNOWN;
}

HeaderValidator::HeaderValidator()
    : HeaderValidator(DEFAULT_HEADER_SEARCH_WINDOW, DEFAULT_MAX_PAYLOAD_SIZE) {}

HeaderValidator::HeaderValidator(size_t search_window, size_t max_payload_size)
    : search_window_(search_window), max_payload_size_(max_payload_size) {}

HeaderResult HeaderValidator::validate(std::string_view raw) const {
    HeaderResult result;
    result.success = false;

    if (raw.empty()) {
        result.error = ErrorCode::EMPTY_INPUT;
        result.error_message = "No barcode data provided";
        return result;
    }

    if (max_payload_size_ > 0 && raw.size() > max_payload_size_) {
        AAMVA_LOG_DEBUG("Rejecting payload of {} bytes (limit {})", raw.size(), max_payload_size_);
        result.error = ErrorCode::INVALID_FORMAT;
        result.error_message = "Payload exceeds maximum size";
        return result;
    }

    // The marker may only start inside the leading window
    std::string_view leading = raw.substr(0, search_window_ + FILE_TYPE_MARKER.size());
    size_t marker = leading.find(FILE_TYPE_MARKER);
    if (marker == std::string_view::npos || marker >= search_window_) {
        AAMVA_LOG_DEBUG("No ANSI marker in first {} bytes", search_window_);
        result.error = ErrorCode::INVALID_FORMAT;
        result.error_message = "Invalid AAMVA barcode format - missing ANSI header";
        return result;
    }

    size_t pos = marker + FILE_TYPE_MARKER.size();
    if (pos + IIN_LENGTH > raw.size() || !allDigits(raw.substr(pos, IIN_LENGTH))) {
        AAMVA_LOG_DEBUG("ANSI marker at offset {} not followed by an IIN", marker);
        result.error = ErrorCode::INVALID_FORMAT;
        result.error_message = "Invalid AAMVA barcode format - missing issuer identification number";
        return result;
    }

    result.header.issuer_id = std::string(raw.substr(pos, IIN_LENGTH));
    pos = parseHeaderFields(raw, pos + IIN_LENGTH, result.header);

    std::string_view body = raw.substr(pos);

    // Subfile type code that opens the DL/ID subfile
    if (body.size() >= SUBFILE_TYPE_LENGTH) {
        DocumentType type = documentTypeFromCode(body.substr(0, SUBFILE_TYPE_LENGTH));
        if (type != DocumentType::UNKNOWN) {
            result.header.document_type = type;
            body.remove_prefix(SUBFILE_TYPE_LENGTH);
        }
    }

    if (result.header.document_type == DocumentType::UNKNOWN) {
        for (const auto& subfile : result.header.subfiles) {
            DocumentType type = documentTypeFromCode(subfile.type);
            if (type != DocumentType::UNKNOWN) {
                result.header.document_type = type;
                break;
            }
        }
    }

    result.success = true;
    result.body = body;
    return result;
}

size_t HeaderValidator::parseHeaderFields(std::string_view raw, size_t pos,
                                          HeaderInfo& header) const {
    uint32_t value = 0;

    if (!readDigits(raw, pos, 2, value)) {
        return pos;
    }
    header.aamva_version = static_cast<int>(value);
    pos += 2;

    // Jurisdiction version only exists from AAMVA version 02 onwards
    if (header.aamva_version >= 2) {
        if (!readDigits(raw, pos, 2, value)) {
            return pos;
        }
        header.jurisdiction_version = static_cast<int>(value);
        pos += 2;
    }

    if (!readDigits(raw, pos, 2, value)) {
        return pos;
    }
    header.entry_count = static_cast<int>(value);
    pos += 2;

    // Designators: 2-letter type, 4-digit offset, 4-digit length
    for (int i = 0; i < header.entry_count; i++) {
        if (pos + SUBFILE_DESIGNATOR_LENGTH > raw.size() ||
            !utils::isAsciiUpper(raw[pos]) || !utils::isAsciiUpper(raw[pos + 1])) {
            break;
        }

        SubfileDesignator designator;
        if (!readDigits(raw, pos + 2, 4, designator.offset) ||
            !readDigits(raw, pos + 6, 4, designator.length)) {
            break;
        }
        designator.type = std::string(raw.substr(pos, SUBFILE_TYPE_LENGTH));

        header.subfiles.push_back(designator);
        pos += SUBFILE_DESIGNATOR_LENGTH;
    }

    return pos;
}

} // namespace aamva
