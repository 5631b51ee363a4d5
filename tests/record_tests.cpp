#include <gtest/gtest.h>
#include "../src/errors.hpp"
#include "../src/record.hpp"
#include "test_helpers.hpp"
#include <string>
#include <vector>

using namespace hexbin;

namespace {
struct RecordExpectation {
    uint8_t size;
    uint16_t address;
    uint8_t type;
    std::vector<uint8_t> data;
    uint8_t checksum;
};

void expect_record(std::string_view text, const RecordExpectation& expected) {
    const Record record = parse_record(1, text);

    EXPECT_EQ(record.line_number, 1u);
    EXPECT_EQ(record.size, expected.size);
    EXPECT_EQ(record.address, expected.address);
    EXPECT_EQ(record.type, expected.type);
    expectBytes(record.data, expected.data, std::string(text));
    EXPECT_EQ(record.checksum, expected.checksum);
}

void expect_malformed(std::string_view text) {
    try {
        parse_record(7, text);
        FAIL() << "Expected MalformedLineError for '" << text << "'";
    } catch (const MalformedLineError& e) {
        EXPECT_EQ(e.line_number(), 7u);
        EXPECT_EQ(e.text(), std::string(text));
    }
}
} // namespace

TEST(RecordTests, ParsesDataRecord) {
    expect_record(Lines::DATA_AT_30, {3, 0x0030, 0x00, {0x02, 0x33, 0x7A}, 0x1E});
}

TEST(RecordTests, ParsesEofRecord) {
    expect_record(Lines::END, {0, 0x0000, 0x01, {}, 0xFF});
}

TEST(RecordTests, ParsesLowerCaseHexAndTrailingWhitespace) {
    expect_record(":0300300002337a1e \t\r\n", {3, 0x0030, 0x00, {0x02, 0x33, 0x7A}, 0x1E});
}

TEST(RecordTests, KeepsUnknownTypeCode) {
    expect_record(Lines::UNDEFINED_TYPE_6, {0, 0x0000, 0x06, {}, 0xFA});
}

TEST(RecordTests, RejectsMalformedLines) {
    expect_malformed("");
    expect_malformed("0300300002337A1E");     // no colon
    expect_malformed(" :00000001FF");         // leading whitespace
    expect_malformed(":0300300002337A1");     // odd data span
    expect_malformed(":03003000GG337A1E");    // not hex
    expect_malformed(":00000001");            // no checksum
    expect_malformed(":");
    expect_malformed(":00000001FF junk");
    expect_malformed(":00 000001FF");         // separators
}

TEST(RecordTests, ChecksumLawHoldsForValidRecords) {
    for (const char* text : {Lines::DATA_AT_30, Lines::DATA_AABB_AT_0, Lines::DATA_CCDD_AT_2,
                             Lines::END, Lines::SEGMENT_1, Lines::START_SEGMENT,
                             Lines::EXTENDED_LINEAR, Lines::START_LINEAR}) {
        const Record record = parse_record(1, text);
        unsigned sum = record.size + (record.address >> 8) + (record.address & 0xFF) + record.type + record.checksum;
        for (uint8_t byte : record.data)
            sum += byte;
        EXPECT_EQ(sum % 256, 0u) << text;
        EXPECT_EQ(record.expected_checksum(), record.checksum) << text;
        EXPECT_TRUE(record.is_valid()) << text;
        EXPECT_NO_THROW(validate(record)) << text;
    }
}

TEST(RecordTests, ChecksumTruncatesLargeDataSums) {
    // 0xFF * 4 overflows a byte several times over.
    const Record record = makeRecord(1, RecordType::DATA, 0xFFFF, {0xFF, 0xFF, 0xFF, 0xFF});
    // 4 + 0xFF + 0xFF + 0 + 4 * 0xFF = 0x5FE, low byte 0xFE, negated 0x02
    EXPECT_EQ(record.expected_checksum(), 0x02);
}

TEST(RecordTests, ChecksumMismatchCarriesDetails) {
    const Record record = parse_record(1, Lines::DATA_AT_30_BAD);
    EXPECT_FALSE(record.is_valid());

    try {
        validate(record);
        FAIL() << "Expected ChecksumMismatchError";
    } catch (const ChecksumMismatchError& e) {
        EXPECT_EQ(e.line_number(), 1u);
        EXPECT_EQ(e.expected(), 0x1E);
        EXPECT_EQ(e.actual(), 0x1F);
        EXPECT_EQ(std::string(e.what()),
                  "Checksum failed for line 1, expected 1E, got 1F\n"
                  "0001: DATA: 3 bytes from 0x0030: 02 33 7A (INVALID CHECKSUM)");
    }
}

TEST(RecordTests, WrongDeclaredSizeFailsChecksum) {
    // Declares two bytes but carries one.
    const Record record = parse_record(3, ":0200000011EE");
    EXPECT_EQ(record.size, 2);
    EXPECT_EQ(record.data.size(), 1u);
    EXPECT_THROW(validate(record), ChecksumMismatchError);
}

TEST(RecordTests, DataAsInteger) {
    EXPECT_EQ(parse_record(1, Lines::SEGMENT_1).data_as_integer(), 0x0001u);
    EXPECT_EQ(parse_record(1, ":020000021000EC").data_as_integer(), 0x1000u);
    EXPECT_EQ(parse_record(1, Lines::START_SEGMENT).data_as_integer(), 0x12345678u);
    EXPECT_EQ(parse_record(1, Lines::END).data_as_integer(), 0u);
}

TEST(RecordTests, DataAsHex) {
    const Record record = parse_record(1, Lines::DATA_AT_30);
    EXPECT_EQ(record.data_as_hex(), "02337A");
    EXPECT_EQ(record.data_as_hex(" "), "02 33 7A");
}

TEST(RecordTests, RendersHumanReadable) {
    EXPECT_EQ(parse_record(1, Lines::DATA_AT_30).to_string(), "0001: DATA: 3 bytes from 0x0030: 02 33 7A");
    EXPECT_EQ(parse_record(2, Lines::END).to_string(), "0002: EOF: 0 bytes from 0x0000: ");
    EXPECT_EQ(parse_record(12, Lines::SEGMENT_1).to_string(),
              "0012: EXTENDED_SEGMENT_ADDRESS: 2 bytes from 0x0000: 00 01");
    EXPECT_EQ(parse_record(1, Lines::DATA_AT_30_BAD).to_string(),
              "0001: DATA: 3 bytes from 0x0030: 02 33 7A (INVALID CHECKSUM)");
    EXPECT_EQ(parse_record(5, Lines::UNDEFINED_TYPE_6).to_string(), "0005: UNKNOWN: 0 bytes from 0x0000: ");
}

TEST(RecordTests, StreamsHumanReadable) {
    std::ostringstream oss;
    oss << parse_record(1, Lines::DATA_AT_30);
    EXPECT_EQ(oss.str(), "0001: DATA: 3 bytes from 0x0030: 02 33 7A");
}

TEST(RecordTests, CanonicalTextRoundTrips) {
    EXPECT_EQ(parse_record(1, Lines::DATA_AT_30).to_text(), Lines::DATA_AT_30);
    EXPECT_EQ(parse_record(1, Lines::START_LINEAR).to_text(), Lines::START_LINEAR);
    EXPECT_EQ(parse_record(1, ":02000000aabb99  \n").to_text(), ":02000000AABB99");
    // Checksum and size are reproduced as written, even when wrong.
    EXPECT_EQ(parse_record(1, ":0200000011EE").to_text(), ":0200000011EE");
}

TEST(RecordTests, LineNumbersBeyondIntRange) {
    const size_t line = 3000000000u;
    EXPECT_EQ(parse_record(line, Lines::END).line_number, line);
    EXPECT_EQ(parse_record(line, Lines::END).to_string(), "3000000000: EOF: 0 bytes from 0x0000: ");

    try {
        parse_record(line, "bad");
        FAIL() << "Expected MalformedLineError";
    } catch (const MalformedLineError& e) {
        EXPECT_EQ(e.line_number(), line);
        EXPECT_EQ(std::string(e.what()), "Invalid line 3000000000: 'bad'");
    }
}

TEST(RecordTests, TypeNames) {
    EXPECT_EQ(type_name(0), "DATA");
    EXPECT_EQ(type_name(1), "EOF");
    EXPECT_EQ(type_name(2), "EXTENDED_SEGMENT_ADDRESS");
    EXPECT_EQ(type_name(3), "START_SEGMENT_ADDRESS");
    EXPECT_EQ(type_name(4), "EXTENDED_LINEAR_ADDRESS");
    EXPECT_EQ(type_name(5), "START_LINEAR_ADDRESS");
    EXPECT_EQ(type_name(6), "UNKNOWN");
    EXPECT_EQ(type_name(0xFF), "UNKNOWN");
}
