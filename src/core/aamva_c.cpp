#include "aamva/aamva_c.h"
#include "aamva/aamva.h"
#include "aamva/log.h"
#include <cstring>
#include <exception>
#include <new>

/* ============================================================================
 * Internal wrapper structure
 * ============================================================================ */

struct aamva_parser_t {
    aamva::AAMVAParser parser;

    aamva_parser_t() = default;

    explicit aamva_parser_t(const aamva::ParserConfig& config)
        : parser(config) {}
};

/* ============================================================================
 * Helper functions
 * ============================================================================ */

template <size_t N>
static void copyField(char (&dest)[N], const std::string& src) {
    std::strncpy(dest, src.c_str(), N - 1);
    dest[N - 1] = '\0';
}

template <size_t N>
static void copyField(char (&dest)[N], const std::optional<std::string>& src) {
    if (src) {
        copyField(dest, *src);
    }
}

static void convert_identity_to_c(const aamva::ParsedIdentity& src, aamva_identity_t* dest) {
    std::memset(dest, 0, sizeof(aamva_identity_t));

    // Name
    copyField(dest->last_name, src.last_name);
    copyField(dest->first_name, src.first_name);
    copyField(dest->middle_name, src.middle_name);
    copyField(dest->full_name, src.full_name);
    copyField(dest->date_of_birth, src.date_of_birth);

    // Address
    copyField(dest->street_address, src.street_address);
    copyField(dest->city, src.city);
    copyField(dest->state, src.state);
    copyField(dest->zip_code, src.zip_code);

    // Document
    copyField(dest->license_number, src.license_number);
    copyField(dest->issue_date, src.issue_date);
    copyField(dest->expiration_date, src.expiration_date);

    // Physical
    copyField(dest->height, src.height);
    copyField(dest->eye_color, src.eye_color);

    // Header
    copyField(dest->issuer_id, src.issuer_id);
    dest->aamva_version = src.aamva_version;
    dest->document_type = static_cast<aamva_document_t>(src.document_type);
}

static aamva::ParserConfig convert_config_from_c(const aamva_config_t* config) {
    aamva::ParserConfig cfg;
    cfg.dob_policy = config->dob_policy == AAMVA_DOB_BEST_EFFORT
        ? aamva::DobPolicy::BEST_EFFORT
        : aamva::DobPolicy::REQUIRE_VALID;
    cfg.header_search_window = config->header_search_window;
    cfg.max_payload_size = config->max_payload_size;
    return cfg;
}

/* ============================================================================
 * Library functions implementation
 * ============================================================================ */

extern "C" {

const char* aamva_version(void) {
    return aamva::VERSION;
}

aamva_config_t aamva_default_config(void) {
    aamva::ParserConfig defaults;

    aamva_config_t config;
    config.dob_policy = AAMVA_DOB_REQUIRE_VALID;
    config.header_search_window = defaults.header_search_window;
    config.max_payload_size = defaults.max_payload_size;
    return config;
}

aamva_parser_t* aamva_create(void) {
    try {
        return new aamva_parser_t();
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

aamva_parser_t* aamva_create_with_config(const aamva_config_t* config) {
    if (!config) {
        return aamva_create();
    }

    try {
        return new aamva_parser_t(convert_config_from_c(config));
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

void aamva_destroy(aamva_parser_t* parser) {
    delete parser;
}

int aamva_parse(const aamva_parser_t* parser,
                const char* data,
                size_t data_len,
                aamva_result_t* result) {
    if (!parser || !result || (!data && data_len > 0)) {
        return -1;
    }

    std::memset(result, 0, sizeof(aamva_result_t));

    try {
        std::string_view raw = data ? std::string_view(data, data_len) : std::string_view();
        auto cpp_result = parser->parser.parse(raw);

        result->success = cpp_result.success ? 1 : 0;
        result->error = static_cast<aamva_error_t>(cpp_result.error);
        copyField(result->error_message, cpp_result.error_message);

        if (cpp_result.success) {
            convert_identity_to_c(cpp_result.identity, &result->identity);
        }

        return 0;
    } catch (const std::exception& e) {
        AAMVA_LOG_ERROR("aamva_parse failed: {}", e.what());
        result->error = AAMVA_ERROR_INTERNAL;
        copyField(result->error_message, std::string("Internal error"));
        return -1;
    }
}

const char* aamva_error_string(aamva_error_t error) {
    if (error == AAMVA_ERROR_INTERNAL) {
        return "Internal error";
    }
    return aamva::errorCodeName(static_cast<aamva::ErrorCode>(error));
}

} /* extern "C" */
