#include <gtest/gtest.h>
#include "aamva/record_tokenizer.h"
#include "aamva/element_table.h"
#include <string>

using namespace aamva;

// =============================================================================
// Element table
// =============================================================================

TEST(ElementTableTest, LooksUpKnownCodes) {
    ElementId id = ElementId::FAMILY_NAME;

    EXPECT_TRUE(lookupElement("DBB", id));
    EXPECT_EQ(id, ElementId::DATE_OF_BIRTH);

    EXPECT_TRUE(lookupElement("DCT", id));
    EXPECT_EQ(id, ElementId::GIVEN_NAME_ALT);
}

TEST(ElementTableTest, RejectsUnknownCodes) {
    ElementId id = ElementId::FAMILY_NAME;

    EXPECT_FALSE(lookupElement("DCF", id));
    EXPECT_FALSE(lookupElement("dcs", id));
    EXPECT_FALSE(lookupElement("DC", id));
    EXPECT_FALSE(lookupElement("DCSX", id));
    EXPECT_FALSE(lookupElement("", id));
}

TEST(ElementTableTest, CodesRoundTrip) {
    for (size_t i = 0; i < ELEMENT_COUNT; i++) {
        auto id = static_cast<ElementId>(i);
        ElementId found = ElementId::FAMILY_NAME;

        ASSERT_TRUE(lookupElement(elementCode(id), found)) << elementCode(id);
        EXPECT_EQ(found, id);
        EXPECT_STRNE(elementName(id), "Unknown");
    }
}

// =============================================================================
// Tokenizer
// =============================================================================

TEST(RecordTokenizerTest, SplitsRecords) {
    auto records = RecordTokenizer::tokenize("DCSJOHNSON\rDACJOHN\rDBB01151990\r");

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].id, ElementId::FAMILY_NAME);
    EXPECT_EQ(records[0].value, "JOHNSON");
    EXPECT_EQ(records[1].id, ElementId::FIRST_NAME);
    EXPECT_EQ(records[1].value, "JOHN");
    EXPECT_EQ(records[2].id, ElementId::DATE_OF_BIRTH);
    EXPECT_EQ(records[2].value, "01151990");
}

TEST(RecordTokenizerTest, SkipsShortAndUnknownRecords) {
    RecordTokenizer tokenizer("\rDL\rZZZ123\rDCSDOE\rAB\r\r");

    RawRecord record;
    ASSERT_TRUE(tokenizer.next(record));
    EXPECT_EQ(record.id, ElementId::FAMILY_NAME);
    EXPECT_EQ(record.value, "DOE");

    EXPECT_FALSE(tokenizer.next(record));
    EXPECT_EQ(tokenizer.skipped(), 3u);
}

TEST(RecordTokenizerTest, LowercasePrefixIsUnrecognized) {
    auto records = RecordTokenizer::tokenize("dcsdoe\rDACJANE\r");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].id, ElementId::FIRST_NAME);
}

TEST(RecordTokenizerTest, AcceptsLineFeedSeparators) {
    auto records = RecordTokenizer::tokenize("DCSDOE\nDACJANE\r\nDADMARIE\n");

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[2].id, ElementId::MIDDLE_NAME);
    EXPECT_EQ(records[2].value, "MARIE");
}

TEST(RecordTokenizerTest, EmptyValueIsKept) {
    auto records = RecordTokenizer::tokenize("DAD\rDCSDOE");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, ElementId::MIDDLE_NAME);
    EXPECT_TRUE(records[0].value.empty());
}

TEST(RecordTokenizerTest, LastRecordWithoutSeparator) {
    auto records = RecordTokenizer::tokenize("DCSDOE\rDAQ12345678");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].value, "12345678");
}

TEST(RecordTokenizerTest, ValueKeepsPadding) {
    auto records = RecordTokenizer::tokenize("DAK94110  \rDAG123 MAIN ST\r");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].value, "94110  ");
    EXPECT_EQ(records[1].value, "123 MAIN ST");
}

TEST(RecordTokenizerTest, EmptyBody) {
    EXPECT_TRUE(RecordTokenizer::tokenize("").empty());
    EXPECT_TRUE(RecordTokenizer::tokenize("\r\r\n").empty());
}

TEST(RecordTokenizerTest, ResetRestartsScan) {
    std::string body = "DCSDOE\rXX\rDACJANE\r";
    RecordTokenizer tokenizer(body);

    RawRecord record;
    size_t first_pass = 0;
    while (tokenizer.next(record)) {
        first_pass++;
    }
    EXPECT_FALSE(tokenizer.hasMore());
    EXPECT_EQ(tokenizer.position(), body.size());
    EXPECT_EQ(tokenizer.skipped(), 1u);

    tokenizer.reset();
    EXPECT_EQ(tokenizer.position(), 0u);
    EXPECT_EQ(tokenizer.skipped(), 0u);
    EXPECT_TRUE(tokenizer.hasMore());

    size_t second_pass = 0;
    while (tokenizer.next(record)) {
        second_pass++;
    }
    EXPECT_EQ(first_pass, 2u);
    EXPECT_EQ(second_pass, first_pass);
}

TEST(RecordTokenizerTest, ValuesViewIntoBody) {
    std::string body = "DCSDOE\r";
    auto records = RecordTokenizer::tokenize(body);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].value.data(), body.data() + 3);
}
