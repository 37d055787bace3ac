#ifndef AAMVA_FIELD_EXTRACTOR_H
#define AAMVA_FIELD_EXTRACTOR_H

#include "aamva/types.h"
#include "aamva/record_tokenizer.h"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aamva {

// Extraction result
struct ExtractResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string error_message;

    ParsedIdentity identity;
};

/**
 * Maps element records onto ParsedIdentity fields
 *
 * When an element repeats, the last occurrence wins. Name precedence:
 * - last:   DCS, DAB, then DAA
 * - first:  DAC, DCT, then DAA
 * - middle: DAD, then DAA
 *
 * Fails with INVALID_FORMAT when no last or first name can be derived, and
 * otherwise with INVALID_FIELD when a non-blank DBB is unresolvable under
 * DobPolicy::REQUIRE_VALID. Everything else degrades to an absent field.
 */
class FieldExtractor {
public:
    explicit FieldExtractor(DobPolicy dob_policy = DobPolicy::REQUIRE_VALID);

    // Consume a tokenizer from its start
    ExtractResult extract(RecordTokenizer& records) const;

    ExtractResult extract(const std::vector<RawRecord>& records) const;

private:
    using ElementValues = std::array<std::optional<std::string_view>, ELEMENT_COUNT>;

    // Values resolved only after every element has been seen
    struct PendingFields {
        std::optional<std::string> last;
        std::optional<std::string> last_alt;
        std::optional<std::string> first;
        std::optional<std::string> first_alt;
        std::optional<std::string> middle;
        std::optional<std::string_view> composite;

        // DBB present, non-blank and matching no date layout
        bool date_of_birth_unresolved = false;
    };

    ExtractResult assemble(const ElementValues& values) const;

    // Apply one element's value to the identity being built
    static void applyElement(ElementId id, std::string_view value, ParsedIdentity& identity,
                             PendingFields& pending);

    DobPolicy dob_policy_;
};

} // namespace aamva

#endif // AAMVA_FIELD_EXTRACTOR_H
