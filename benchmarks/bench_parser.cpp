// =============================================================================
// AAMVA Decoder Performance Benchmarks
// =============================================================================
// This file contains performance benchmarks for the decoding pipeline
// using Google Benchmark framework.
//
// Run with: ./aamva_benchmarks --benchmark_format=console
// =============================================================================

#include <benchmark/benchmark.h>
#include "aamva/parser.h"
#include "aamva/header_validator.h"
#include "aamva/record_tokenizer.h"
#include "aamva/name_caser.h"
#include "aamva/date_resolver.h"
#include <random>
#include <string>
#include <vector>

using namespace aamva;

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

// Full payload in the shape produced by most US issuers
std::string createLicensePayload(const std::string& last = "JOHNSON") {
    std::string payload = "@\n\x1e\rANSI 636045090002DL00410278ZC03200024DL";
    payload += "DAQ12345678\r";
    payload += "DCS" + last + "\r";
    payload += "DACJOHN\rDADMICHAEL\rDBB01151990\rDBA01152030\rDBD01152020\r";
    payload += "DAG123 MAIN ST\rDAISAN FRANCISCO\rDAJCA\rDAK941100000  \r";
    payload += "DAU070 in\rDAYBRO\rDCF0123456789\rDCGUSA\rDDEN\rDDFN\rDDGN\r";
    payload += "ZCZCAGRN\rZCZCBBLK\r";
    return payload;
}

// Create random printable text of a given size
std::string createRandomText(size_t size, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(32, 126);

    std::string text(size, ' ');
    for (size_t i = 0; i < size; i++) {
        text[i] = static_cast<char>(dist(rng));
    }
    return text;
}

}  // namespace

// =============================================================================
// End-to-end Parsing Benchmarks
// =============================================================================

static void BM_ParseLicense(benchmark::State& state) {
    AAMVAParser parser;
    auto payload = createLicensePayload();

    for (auto _ : state) {
        auto result = parser.parse(payload);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * payload.size());
}
BENCHMARK(BM_ParseLicense);

static void BM_ParseLicense_FreeFunction(benchmark::State& state) {
    auto payload = createLicensePayload("MCDONALD");

    for (auto _ : state) {
        auto result = aamva::parse(payload);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ParseLicense_FreeFunction);

static void BM_RejectNonBarcode(benchmark::State& state) {
    AAMVAParser parser;
    auto text = createRandomText(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto result = parser.parse(text);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RejectNonBarcode)->Arg(64)->Arg(512)->Arg(2048);

// =============================================================================
// Stage Benchmarks
// =============================================================================

static void BM_HeaderValidation(benchmark::State& state) {
    HeaderValidator validator;
    auto payload = createLicensePayload();

    for (auto _ : state) {
        auto result = validator.validate(payload);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_HeaderValidation);

static void BM_Tokenize(benchmark::State& state) {
    HeaderValidator validator;
    auto payload = createLicensePayload();
    auto header = validator.validate(payload);

    for (auto _ : state) {
        auto records = RecordTokenizer::tokenize(header.body);
        benchmark::DoNotOptimize(records);
    }

    state.SetBytesProcessed(state.iterations() * header.body.size());
}
BENCHMARK(BM_Tokenize);

static void BM_NameCaser(benchmark::State& state) {
    const std::string name = "MCDONALD-O'BRIEN DE LA CRUZ III";

    for (auto _ : state) {
        auto result = normalize::NameCaser::normalize(name);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_NameCaser);

static void BM_DateResolver_MonthFirst(benchmark::State& state) {
    for (auto _ : state) {
        auto result = normalize::DateResolver::resolve("01151990");
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DateResolver_MonthFirst);

static void BM_DateResolver_Fallback(benchmark::State& state) {
    for (auto _ : state) {
        auto result = normalize::DateResolver::resolve("19900115");
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DateResolver_Fallback);

// =============================================================================
// Main
// =============================================================================

BENCHMARK_MAIN();
