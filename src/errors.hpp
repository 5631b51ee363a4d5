#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace hexbin {

// Base of every fatal decoding error. None of these are recoverable: the
// run that raised one is abandoned and its partial image discarded.
class HexError : public std::runtime_error
{
    size_t line;

public:
    HexError(size_t line_number, const std::string& message)
        : std::runtime_error(message), line(line_number) {}

    size_t line_number() const { return line; }
};

class MalformedLineError : public HexError
{
    std::string offending;

public:
    MalformedLineError(size_t line_number, std::string text);

    const std::string& text() const { return offending; }
};

class ChecksumMismatchError : public HexError
{
    uint8_t expected_value;
    uint8_t actual_value;

public:
    ChecksumMismatchError(size_t line_number, uint8_t expected, uint8_t actual, const std::string& rendered);

    uint8_t expected() const { return expected_value; }
    uint8_t actual() const { return actual_value; }
};

class UnexpectedRecordAfterEofError : public HexError
{
public:
    explicit UnexpectedRecordAfterEofError(size_t line_number);
};

class UnhandledRecordTypeError : public HexError
{
    uint8_t code;

public:
    UnhandledRecordTypeError(size_t line_number, uint8_t type, const std::string& rendered);

    uint8_t type() const { return code; }
};

// The record would place data, or move the base, outside the 64-bit
// address space or beyond the largest image the buffer can hold.
class AddressRangeError : public HexError
{
public:
    AddressRangeError(size_t line_number, const std::string& rendered);
};

// line_number() is the last record consumed, 0 for an empty input.
class MissingEofError : public HexError
{
public:
    explicit MissingEofError(size_t last_line_number);
};

} // namespace hexbin
