#ifndef AAMVA_PARSER_H
#define AAMVA_PARSER_H

#include "aamva/types.h"
#include "aamva/header_validator.h"
#include <cstddef>
#include <memory>
#include <string_view>

namespace aamva {

// Configuration options for the parser
struct ParserConfig {
    // What to do with a date of birth that resolves under no layout
    DobPolicy dob_policy = DobPolicy::REQUIRE_VALID;

    // "ANSI " must begin within this many leading bytes
    size_t header_search_window = DEFAULT_HEADER_SEARCH_WINDOW;

    // Larger payloads are rejected (PDF-417 tops out below 2 KB)
    size_t max_payload_size = DEFAULT_MAX_PAYLOAD_SIZE;
};

// Decodes AAMVA DL/ID barcode payloads
// parse() is const and keeps no state between calls, so one instance can be
// shared across threads.
class AAMVAParser {
public:
    AAMVAParser();
    explicit AAMVAParser(const ParserConfig& config);
    ~AAMVAParser();

    // Non-copyable
    AAMVAParser(const AAMVAParser&) = delete;
    AAMVAParser& operator=(const AAMVAParser&) = delete;

    // Movable
    AAMVAParser(AAMVAParser&&) noexcept;
    AAMVAParser& operator=(AAMVAParser&&) noexcept;

    // Parse a raw barcode payload
    // Returns ParseResult with success/failure and the parsed identity
    ParseResult parse(std::string_view raw) const;

    const ParserConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Parse with the default configuration
ParseResult parse(std::string_view raw);

} // namespace aamva

#endif // AAMVA_PARSER_H
