#include "image.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>

namespace hexbin {

namespace {
// Widest segment operand whose value still survives the << 4.
constexpr size_t MAX_SEGMENT_BYTES = 8;
constexpr uint64_t MAX_SEGMENT_VALUE = std::numeric_limits<uint64_t>::max() >> 4;
} // namespace

std::vector<uint8_t> ImageAssembler::run(RecordSource& records) {
    ensure_open();
    while (auto record = records.next()) {
        consume(*record);
    }
    return finish();
}

void ImageAssembler::consume(const Record& record) {
    ensure_open();
    if (eof)
        throw UnexpectedRecordAfterEofError(record.line_number);

    validate(record);
    ++count;
    last_line = record.line_number;

    switch (static_cast<RecordType>(record.type)) {
    case RecordType::DATA: {
        const uint64_t address = base + record.address;
        if (address < base)
            throw AddressRangeError(record.line_number, record.to_string());
        if (!write_at(address, record.data))
            throw AddressRangeError(record.line_number, record.to_string());
        break;
    }
    case RecordType::END_OF_FILE:
        eof = true;
        break;
    case RecordType::EXTENDED_SEGMENT_ADDRESS: {
        if (record.data.size() > MAX_SEGMENT_BYTES)
            throw AddressRangeError(record.line_number, record.to_string());
        const uint64_t segment = record.data_as_integer();
        if (segment > MAX_SEGMENT_VALUE)
            throw AddressRangeError(record.line_number, record.to_string());
        base = segment << 4;
        break;
    }
    case RecordType::START_SEGMENT_ADDRESS:
        cs = record.data.size() > 0 ? std::optional<uint8_t>(record.data[0]) : std::nullopt;
        ip = record.data.size() > 1 ? std::optional<uint8_t>(record.data[1]) : std::nullopt;
        break;
    default:
        throw UnhandledRecordTypeError(record.line_number, record.type, record.to_string());
    }
}

std::vector<uint8_t> ImageAssembler::finish() {
    ensure_open();
    if (!eof)
        throw MissingEofError(last_line);

    finished = true;
    return std::move(buffer);
}

bool ImageAssembler::write_at(uint64_t address, const std::vector<uint8_t>& bytes) {
    if (bytes.empty())
        return true;
    const uint64_t end = address + bytes.size();
    if (end < address || end > buffer.max_size())
        return false;
    if (end > buffer.size())
        buffer.resize(end, 0x00);
    std::copy(bytes.begin(), bytes.end(), buffer.begin() + static_cast<std::ptrdiff_t>(address));
    return true;
}

void ImageAssembler::ensure_open() const {
    if (finished)
        throw std::logic_error("ImageAssembler already finished");
}

void dump(const std::vector<uint8_t>& image, std::ostream& sink) {
    sink.write(reinterpret_cast<const char*>(image.data()), image.size());
    sink.flush();
    if (!sink)
        throw std::runtime_error("Failed to write image to output");
}

} // namespace hexbin
