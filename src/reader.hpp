#pragma once
#include "record.hpp"
#include <istream>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

namespace hexbin {

// Forward-only sequence of records. next() returns std::nullopt once the
// sequence is exhausted.
class RecordSource
{
public:
    virtual ~RecordSource() = default;
    virtual std::optional<Record> next() = 0;
};

/**
 * Reads Intel HEX text one line at a time.
 *
 * Every physical line counts towards the line number, but empty and
 * whitespace-only lines are skipped. Parsing happens lazily in next(), so a
 * malformed line is reported only when it is reached.
 */
class HexReader : public RecordSource
{
    std::istream& input;
    size_t line = 0;

public:
    explicit HexReader(std::istream& in) : input(in) {}
    std::optional<Record> next() override;

    size_t lines_read() const { return line; }
};

// Replays records that were parsed elsewhere.
class VectorSource : public RecordSource
{
    std::vector<Record> records;
    size_t position = 0;

public:
    explicit VectorSource(std::vector<Record> recs) : records(std::move(recs)) {}
    std::optional<Record> next() override;
};

// Writes Record::to_string() for every record, one per line. Checksums are
// annotated, not enforced.
void explain(RecordSource& source, std::ostream& out);

} // namespace hexbin
