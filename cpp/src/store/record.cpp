#include "engram/store/record.hpp"

#include "engram/error.hpp"
#include "engram/hash.hpp"

namespace engram::store {

Record& Record::set(const std::string& col, std::string value) {
    columns[col] = std::move(value);
    return *this;
}

Record& Record::set(const std::string& col, double value) {
    columns[col] = format_double(value);
    return *this;
}

Record& Record::set(const std::string& col, int64_t value) {
    columns[col] = std::to_string(value);
    return *this;
}

Record& Record::set(const std::string& col, bool value) {
    columns[col] = value ? "true" : "false";
    return *this;
}

bool Record::has(const std::string& col) const {
    if (col == "id" || col == "ts" || col == "content_hash") return true;
    return columns.count(col) != 0;
}

std::string Record::value(const std::string& col) const {
    if (col == "id") return id;
    if (col == "ts") return std::to_string(ts);
    if (col == "content_hash") return content_hash;
    auto it = columns.find(col);
    return it == columns.end() ? std::string() : it->second;
}

std::string Record::text(const std::string& col) const {
    if (!has(col)) {
        throw DataIntegrityError("missing column '" + col + "'", id);
    }
    return value(col);
}

double Record::real(const std::string& col) const {
    std::string raw = text(col);
    try {
        size_t pos = 0;
        double v = std::stod(raw, &pos);
        if (pos != raw.size()) throw std::invalid_argument(raw);
        return v;
    } catch (const std::logic_error&) {
        throw DataIntegrityError("malformed real '" + raw + "' in column '" + col + "'", id);
    }
}

int64_t Record::integer(const std::string& col) const {
    if (col == "ts") return ts;
    std::string raw = text(col);
    try {
        size_t pos = 0;
        int64_t v = std::stoll(raw, &pos);
        if (pos != raw.size()) throw std::invalid_argument(raw);
        return v;
    } catch (const std::logic_error&) {
        throw DataIntegrityError("malformed integer '" + raw + "' in column '" + col + "'", id);
    }
}

bool Record::flag(const std::string& col) const {
    std::string raw = text(col);
    if (raw == "true" || raw == "t" || raw == "1") return true;
    if (raw == "false" || raw == "f" || raw == "0") return false;
    throw DataIntegrityError("malformed boolean '" + raw + "' in column '" + col + "'", id);
}

std::string Record::text_or(const std::string& col, const std::string& def) const {
    return has(col) ? value(col) : def;
}

double Record::real_or(const std::string& col, double def) const {
    return has(col) && !value(col).empty() ? real(col) : def;
}

int64_t Record::integer_or(const std::string& col, int64_t def) const {
    return has(col) && !value(col).empty() ? integer(col) : def;
}

} // namespace engram::store
