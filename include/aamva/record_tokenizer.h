#ifndef AAMVA_RECORD_TOKENIZER_H
#define AAMVA_RECORD_TOKENIZER_H

#include "aamva/types.h"
#include <cstddef>
#include <string_view>
#include <vector>

namespace aamva {

// Record separators. CR is the standard one; LF shows up when
// keyboard-wedge scanners translate line endings.
constexpr char RECORD_SEPARATOR = '\r';
constexpr char RECORD_SEPARATOR_ALT = '\n';

// Splits a record body into element records
// Unrecognized or short records are skipped. The tokenizer only keeps the scan
// position, so it can be reset and re-run on the same body.
class RecordTokenizer {
public:
    explicit RecordTokenizer(std::string_view body);

    // Advance to the next recognized record
    // Returns false once the body is exhausted
    bool next(RawRecord& record);

    // Restart from the beginning of the body
    void reset();

    size_t position() const;
    bool hasMore() const;

    // Number of candidates dropped so far
    size_t skipped() const;

    // Tokenize the whole body in one pass
    static std::vector<RawRecord> tokenize(std::string_view body);

private:
    std::string_view body_;
    size_t pos_;
    size_t skipped_;
};

} // namespace aamva

#endif // AAMVA_RECORD_TOKENIZER_H
