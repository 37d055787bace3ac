#include <gtest/gtest.h>
#include "aamva/parser.h"
#include "aamva/log.h"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace aamva;

// =============================================================================
// Thread Safety Test Fixture
// =============================================================================

class ThreadSafetyTest : public ::testing::Test {
protected:
    // License payload with a per-thread surname and customer number
    std::string createLicense(const std::string& last_name, int number) {
        return "@\n\x1e\rANSI 636045090002DL00410278ZC03200024DL\r"
               "DCS" + last_name + "\r"
               "DACJOHN\r"
               "DBB01151990\r"
               "DAJCA\r"
               "DAQ" + std::to_string(number) + "\r";
    }

    static constexpr int num_threads = 8;
    static constexpr int parses_per_thread = 500;
};

// =============================================================================
// Shared parser
// =============================================================================

TEST_F(ThreadSafetyTest, SharedParser_ConcurrentParses) {
    const AAMVAParser parser;
    const std::vector<std::string> surnames = {
        "SMITH", "MCDONALD", "O'BRIEN", "NGUYEN", "GARCIA", "SMITH-JONES", "LEE", "KIM"
    };
    const std::vector<std::string> expected = {
        "Smith", "McDonald", "O'Brien", "Nguyen", "Garcia", "Smith-Jones", "Lee", "Kim"
    };

    std::atomic<int> failures{0};
    std::atomic<int> parsed{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < parses_per_thread; i++) {
                std::string payload = createLicense(surnames[t], t * 10000 + i);
                auto result = parser.parse(payload);

                if (!result.success ||
                    result.identity.last_name != expected[t] ||
                    result.identity.license_number != std::to_string(t * 10000 + i)) {
                    failures++;
                } else {
                    parsed++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(parsed.load(), num_threads * parses_per_thread);
}

TEST_F(ThreadSafetyTest, SharedParser_MixedValidAndInvalid) {
    const AAMVAParser parser;
    std::atomic<int> wrong_outcomes{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < parses_per_thread; i++) {
                if ((i + t) % 2 == 0) {
                    if (!parser.parse(createLicense("DOE", i)).success) {
                        wrong_outcomes++;
                    }
                } else {
                    auto result = parser.parse("not a barcode " + std::to_string(i));
                    if (result.success || result.error != ErrorCode::INVALID_FORMAT) {
                        wrong_outcomes++;
                    }
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(wrong_outcomes.load(), 0);
}

TEST_F(ThreadSafetyTest, FreeFunction_ConcurrentFirstUse) {
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 50; i++) {
                if (!parse(createLicense("ROE", t * 100 + i)).success) {
                    failures++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
}

// =============================================================================
// Logger
// =============================================================================

TEST_F(ThreadSafetyTest, Logger_ConcurrentAccess) {
    std::vector<std::shared_ptr<spdlog::logger>> loggers(num_threads);
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&loggers, t]() {
            loggers[t] = logger();
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& instance : loggers) {
        ASSERT_NE(instance, nullptr);
        EXPECT_EQ(instance.get(), loggers[0].get());
        EXPECT_EQ(instance->name(), LOGGER_NAME);
    }
}
