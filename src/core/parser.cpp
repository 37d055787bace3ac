#include "aamva/parser.h"
#include "aamva/header_validator.h"
#include "aamva/record_tokenizer.h"
#include "aamva/field_extractor.h"
#include "aamva/log.h"

namespace aamva {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "None";
        case ErrorCode::EMPTY_INPUT: return "Empty input";
        case ErrorCode::INVALID_FORMAT: return "Invalid format";
        case ErrorCode::INVALID_FIELD: return "Invalid field";
    }
    return "Unknown";
}

struct AAMVAParser::Impl {
    ParserConfig config;
    HeaderValidator header_validator;
    FieldExtractor field_extractor;

    explicit Impl(const ParserConfig& cfg)
        : config(cfg)
        , header_validator(cfg.header_search_window, cfg.max_payload_size)
        , field_extractor(cfg.dob_policy) {}
};

AAMVAParser::AAMVAParser()
    : AAMVAParser(ParserConfig{}) {}

AAMVAParser::AAMVAParser(const ParserConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

AAMVAParser::~AAMVAParser() = default;

AAMVAParser::AAMVAParser(AAMVAParser&&) noexcept = default;
AAMVAParser& AAMVAParser::operator=(AAMVAParser&&) noexcept = default;

ParseResult AAMVAParser::parse(std::string_view raw) const {
    ParseResult result;
    result.success = false;

    auto header = impl_->header_validator.validate(raw);
    if (!header.success) {
        result.error = header.error;
        result.error_message = header.error_message;
        return result;
    }

    RecordTokenizer records(header.body);
    auto extracted = impl_->field_extractor.extract(records);

    if (records.skipped() > 0) {
        AAMVA_LOG_TRACE("Skipped {} unrecognized records", records.skipped());
    }

    if (!extracted.success) {
        result.error = extracted.error;
        result.error_message = extracted.error_message;
        return result;
    }

    result.success = true;
    result.identity = std::move(extracted.identity);
    result.identity.issuer_id = header.header.issuer_id;
    result.identity.aamva_version = header.header.aamva_version;
    result.identity.document_type = header.header.document_type;

    return result;
}

const ParserConfig& AAMVAParser::config() const {
    return impl_->config;
}

ParseResult parse(std::string_view raw) {
    static const AAMVAParser parser;
    return parser.parse(raw);
}

} // namespace aamva
