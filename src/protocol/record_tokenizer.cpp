#include "aamva/record_tokenizer.h"
#include "aamva/element_table.h"
#include "aamva/log.h"

namespace aamva {

static bool isSeparator(char c) {
    return c == RECORD_SEPARATOR || c == RECORD_SEPARATOR_ALT;
}

RecordTokenizer::RecordTokenizer(std::string_view body)
    : body_(body), pos_(0), skipped_(0) {}

bool RecordTokenizer::next(RawRecord& record) {
    while (pos_ < body_.size()) {
        size_t start = pos_;
        size_t end = start;
        while (end < body_.size() && !isSeparator(body_[end])) {
            end++;
        }

        // Step past the separator for the next call
        pos_ = end < body_.size() ? end + 1 : end;

        std::string_view candidate = body_.substr(start, end - start);
        if (candidate.empty()) {
            continue;
        }

        ElementId id = ElementId::FAMILY_NAME;
        if (candidate.size() < ELEMENT_ID_LENGTH ||
            !lookupElement(candidate.substr(0, ELEMENT_ID_LENGTH), id)) {
            skipped_++;
            AAMVA_LOG_TRACE("Skipping record at offset {} ({} bytes)", start, candidate.size());
            continue;
        }

        record.id = id;
        record.value = candidate.substr(ELEMENT_ID_LENGTH);
        return true;
    }

    return false;
}

void RecordTokenizer::reset() {
    pos_ = 0;
    skipped_ = 0;
}

size_t RecordTokenizer::position() const {
    return pos_;
}

bool RecordTokenizer::hasMore() const {
    return pos_ < body_.size();
}

size_t RecordTokenizer::skipped() const {
    return skipped_;
}

std::vector<RawRecord> RecordTokenizer::tokenize(std::string_view body) {
    std::vector<RawRecord> records;

    RecordTokenizer tokenizer(body);
    RawRecord record;
    while (tokenizer.next(record)) {
        records.push_back(record);
    }

    return records;
}

} // namespace aamva
