#include "record.hpp"
#include "errors.hpp"
#include <array>
#include <cctype>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace hexbin {

namespace {

constexpr std::array<std::string_view, 6> TYPE_NAMES = {
    "DATA",
    "EOF",
    "EXTENDED_SEGMENT_ADDRESS",
    "START_SEGMENT_ADDRESS",
    "EXTENDED_LINEAR_ADDRESS",
    "START_LINEAR_ADDRESS",
};

// size, address, type and checksum
constexpr size_t FIXED_DIGITS = 10;

bool from_hex(uint8_t& res, char ch) {
    if ('0' <= ch && ch <= '9')
        res = ch - '0';
    else if ('a' <= ch && ch <= 'f')
        res = ch - 'a' + 10;
    else if ('A' <= ch && ch <= 'F')
        res = ch - 'A' + 10;
    else
        return false;

    return true;
}

std::string_view trim_trailing_space(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

} // namespace

std::string_view type_name(uint8_t type) {
    if (type < TYPE_NAMES.size())
        return TYPE_NAMES[type];
    return "UNKNOWN";
}

uint8_t Record::expected_checksum() const {
    uint8_t sum = size;
    sum += static_cast<uint8_t>(address >> 8);
    sum += static_cast<uint8_t>(address & 0xFF);
    sum += type;
    for (uint8_t byte : data)
        sum += byte;
    return static_cast<uint8_t>(0x100 - sum);
}

uint64_t Record::data_as_integer() const {
    uint64_t result = 0;
    for (uint8_t byte : data)
        result = (result << 8) | byte;
    return result;
}

std::string Record::data_as_hex(std::string_view separator) const {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (size_t i = 0; i < data.size(); ++i) {
        if (i > 0) oss << separator;
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string Record::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << line_number << ": "
        << type_name(type) << ": "
        << static_cast<int>(size) << " bytes from 0x"
        << std::uppercase << std::hex << std::setw(4) << address << ": "
        << data_as_hex(" ");
    if (!is_valid())
        oss << " (INVALID CHECKSUM)";
    return oss.str();
}

std::string Record::to_text() const {
    std::ostringstream oss;
    oss << ':' << std::uppercase << std::hex << std::setfill('0')
        << std::setw(2) << static_cast<int>(size)
        << std::setw(4) << address
        << std::setw(2) << static_cast<int>(type)
        << data_as_hex()
        << std::setw(2) << static_cast<int>(checksum);
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Record& record) {
    return os << record.to_string();
}

Record parse_record(size_t line_number, std::string_view text) {
    std::string_view body = trim_trailing_space(text);
    if (body.empty() || body.front() != ':')
        throw MalformedLineError(line_number, std::string(text));
    body.remove_prefix(1);

    // The fixed fields are whole bytes, so an odd total means an odd data span.
    if (body.size() < FIXED_DIGITS || body.size() % 2 != 0)
        throw MalformedLineError(line_number, std::string(text));

    std::vector<uint8_t> bytes;
    bytes.reserve(body.size() / 2);
    for (size_t i = 0; i < body.size(); i += 2) {
        uint8_t hi, lo;
        if (!from_hex(hi, body[i]) || !from_hex(lo, body[i + 1]))
            throw MalformedLineError(line_number, std::string(text));
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    Record record;
    record.line_number = line_number;
    record.size = bytes[0];
    record.address = static_cast<uint16_t>((bytes[1] << 8) | bytes[2]);
    record.type = bytes[3];
    record.data.assign(bytes.begin() + 4, bytes.end() - 1);
    record.checksum = bytes.back();
    return record;
}

void validate(const Record& record) {
    if (!record.is_valid())
        throw ChecksumMismatchError(record.line_number, record.expected_checksum(), record.checksum, record.to_string());
}

} // namespace hexbin
