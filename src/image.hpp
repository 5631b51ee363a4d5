#pragma once
#include "reader.hpp"
#include "record.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace hexbin {

/**
 * Folds a sequence of records into a flat memory image.
 *
 * Each record is checked against the EOF state, checksum-validated and then
 * dispatched on its type. DATA records land at base_address + address; the
 * image grows with zero bytes up to the write position as needed. Only
 * EXTENDED_SEGMENT_ADDRESS moves the base. Linear addressing records are
 * rejected with UnhandledRecordTypeError. A segment operand wider than 64
 * bits after the shift, or a write that would end past the 64-bit address
 * space or the vector's max_size(), throws AddressRangeError.
 *
 * An assembler handles one run. After finish() (or run()) returns, it
 * refuses further use with std::logic_error.
 */
class ImageAssembler
{
public:
    // Consumes the whole source and returns the finished image.
    std::vector<uint8_t> run(RecordSource& records);

    void consume(const Record& record);
    // Throws MissingEofError unless an EOF record has been consumed.
    std::vector<uint8_t> finish();

    uint64_t base_address() const { return base; }
    bool eof_seen() const { return eof; }
    size_t records_seen() const { return count; }

    // Bytes captured verbatim from data[0] and data[1] of the last
    // START_SEGMENT_ADDRESS record. They take no part in address resolution.
    std::optional<uint8_t> start_cs() const { return cs; }
    std::optional<uint8_t> start_ip() const { return ip; }

    // Image as built so far.
    const std::vector<uint8_t>& image() const { return buffer; }

private:
    // False if [address, address + bytes.size()) cannot be represented.
    bool write_at(uint64_t address, const std::vector<uint8_t>& bytes);
    void ensure_open() const;

    uint64_t base = 0;
    bool eof = false;
    bool finished = false;
    size_t count = 0;
    size_t last_line = 0;
    std::optional<uint8_t> cs;
    std::optional<uint8_t> ip;
    std::vector<uint8_t> buffer;
};

// Writes the image verbatim. Throws std::runtime_error if the stream fails.
void dump(const std::vector<uint8_t>& image, std::ostream& sink);

} // namespace hexbin
