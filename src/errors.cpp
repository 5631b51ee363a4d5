#include "errors.hpp"
#include "record.hpp"
#include <iomanip>
#include <sstream>
#include <utility>

namespace hexbin {

namespace {
std::string hex_byte(uint8_t value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(value);
    return oss.str();
}
} // namespace

MalformedLineError::MalformedLineError(size_t line_number, std::string text)
    : HexError(line_number, "Invalid line " + std::to_string(line_number) + ": '" + text + "'"),
      offending(std::move(text))
{
}

ChecksumMismatchError::ChecksumMismatchError(size_t line_number, uint8_t expected, uint8_t actual, const std::string& rendered)
    : HexError(line_number, "Checksum failed for line " + std::to_string(line_number) +
                                ", expected " + hex_byte(expected) + ", got " + hex_byte(actual) + "\n" + rendered),
      expected_value(expected), actual_value(actual)
{
}

UnexpectedRecordAfterEofError::UnexpectedRecordAfterEofError(size_t line_number)
    : HexError(line_number, "Unexpected record after EOF record at line " + std::to_string(line_number))
{
}

UnhandledRecordTypeError::UnhandledRecordTypeError(size_t line_number, uint8_t type, const std::string& rendered)
    : HexError(line_number, "Unhandled record type " + std::string(type_name(type)) + " (0x" + hex_byte(type) +
                                ") at line " + std::to_string(line_number) + ": " + rendered),
      code(type)
{
}

AddressRangeError::AddressRangeError(size_t line_number, const std::string& rendered)
    : HexError(line_number, "Address out of range at line " + std::to_string(line_number) + ": " + rendered)
{
}

MissingEofError::MissingEofError(size_t last_line_number)
    : HexError(last_line_number, "Missing EOF record")
{
}

} // namespace hexbin
