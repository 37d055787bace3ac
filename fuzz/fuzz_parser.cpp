// =============================================================================
// AAMVA Fuzz Target - libFuzzer entry point
// =============================================================================
// Build with: cmake -DAAMVA_BUILD_FUZZERS=ON -DCMAKE_CXX_COMPILER=clang++
//
// Run with: ./fuzz_parser fuzz/corpus -max_len=4096 -timeout=5
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <string_view>

#include "aamva/aamva.h"
#include "aamva/aamva_c.h"
#include "aamva/header_validator.h"
#include "aamva/record_tokenizer.h"
#include "aamva/name_caser.h"
#include "aamva/date_resolver.h"

using namespace aamva;

// Global parser instances (initialized once)
static AAMVAParser* g_parser = nullptr;
static AAMVAParser* g_lenient_parser = nullptr;

extern "C" int LLVMFuzzerInitialize(int* argc, char*** argv) {
    (void)argc;
    (void)argv;

    g_parser = new AAMVAParser();

    ParserConfig lenient;
    lenient.dob_policy = DobPolicy::BEST_EFFORT;
    lenient.max_payload_size = 0;
    g_lenient_parser = new AAMVAParser(lenient);

    return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::string_view input(reinterpret_cast<const char*>(data), size);

    // Full pipeline with both date-of-birth policies
    {
        auto result = g_parser->parse(input);
        if (result.success) {
            auto address = formattedAddress(result.identity);
            (void)address;
        }
    }

    {
        auto result = g_lenient_parser->parse(input);
        (void)result;
    }

    // Tokenizer directly on the raw bytes
    {
        auto records = RecordTokenizer::tokenize(input);
        (void)records;
    }

    // Normalizers on the raw bytes
    {
        auto name = normalize::NameCaser::normalize(input);
        // Idempotence must hold for any input
        if (normalize::NameCaser::normalize(name) != name) {
            __builtin_trap();
        }

        auto split = normalize::FullNameSplitter::split(input);
        (void)split;

        auto date = normalize::DateResolver::resolve(input);
        (void)date;
    }

    // C API
    {
        aamva_parser_t* parser = aamva_create();
        if (parser) {
            aamva_result_t result;
            aamva_parse(parser, reinterpret_cast<const char*>(data), size, &result);
            aamva_destroy(parser);
        }
    }

    return 0;
}
