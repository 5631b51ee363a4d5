#include "reader.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace hexbin {

namespace {
bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}
} // namespace

std::optional<Record> HexReader::next() {
    std::string text;
    while (std::getline(input, text)) {
        ++line;
        if (is_blank(text))
            continue;
        return parse_record(line, text);
    }
    return std::nullopt;
}

std::optional<Record> VectorSource::next() {
    if (position >= records.size())
        return std::nullopt;
    return records[position++];
}

void explain(RecordSource& source, std::ostream& out) {
    while (auto record = source.next()) {
        out << *record << '\n';
    }
}

} // namespace hexbin
