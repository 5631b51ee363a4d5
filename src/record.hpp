#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace hexbin {

enum class RecordType : uint8_t
{
    DATA = 0x00,
    END_OF_FILE = 0x01,
    EXTENDED_SEGMENT_ADDRESS = 0x02,
    START_SEGMENT_ADDRESS = 0x03,
    EXTENDED_LINEAR_ADDRESS = 0x04,
    START_LINEAR_ADDRESS = 0x05,
};

// "DATA", "EOF", ... for the six known codes, "UNKNOWN" for anything else.
std::string_view type_name(uint8_t type);

/**
 * One line of an Intel HEX file.
 *
 * `type` keeps the raw code from the line so that codes outside RecordType
 * survive parsing and can be reported by whoever dispatches on them.
 */
struct Record
{
    size_t line_number = 0;
    uint8_t size = 0;
    uint16_t address = 0;
    uint8_t type = 0;
    std::vector<uint8_t> data;
    uint8_t checksum = 0;

    bool is(RecordType t) const { return type == static_cast<uint8_t>(t); }

    // Two's complement of the byte sum of every field but the checksum.
    uint8_t expected_checksum() const;
    bool is_valid() const { return checksum == expected_checksum(); }

    // Big-endian; only the last eight bytes of longer data are retained.
    uint64_t data_as_integer() const;
    std::string data_as_hex(std::string_view separator = "") const;

    // "0007: DATA: 3 bytes from 0x0030: 02 33 7A"
    std::string to_string() const;
    // ":0300300002337A1E"
    std::string to_text() const;
};

std::ostream& operator<<(std::ostream& os, const Record& record);

/**
 * Parse one line of text into a Record.
 *
 * Accepts exactly `:SSAAAATT[DD...]CC` with case-insensitive hex digits,
 * followed by optional trailing whitespace. Throws MalformedLineError for
 * anything else. The checksum is not checked here, see validate().
 */
Record parse_record(size_t line_number, std::string_view text);

// Throws ChecksumMismatchError if the stored checksum is wrong.
void validate(const Record& record);

} // namespace hexbin
