#include "Table.h"
#include "BasketryExceptions.h"
#include "CSVUtils.h"
#include "CommonUtils.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_set>

namespace {
bool parseFiniteDouble(const std::string& raw, double& out) {
    std::string cleaned = CommonUtils::trim(raw);
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

bool isBlankRecord(const std::vector<std::string>& fields) {
    return std::all_of(fields.begin(), fields.end(), [](const std::string& f) {
        return CommonUtils::trim(f).empty();
    });
}
} // namespace

void Table::addColumn(std::string name, std::vector<std::string> values) {
    if (!columns_.empty() && values.size() != rowCount_) {
        throw Basketry::DatasetException("Column '" + name + "' has " + std::to_string(values.size()) +
                                         " rows, expected " + std::to_string(rowCount_));
    }

    TableColumn col;
    col.name = std::move(name);
    col.missing.resize(values.size(), static_cast<uint8_t>(0));
    for (size_t r = 0; r < values.size(); ++r) {
        if (isMissingToken(values[r])) col.missing[r] = static_cast<uint8_t>(1);
    }
    col.values = std::move(values);

    if (columns_.empty()) rowCount_ = col.values.size();
    columns_.push_back(std::move(col));
}

const TableColumn& Table::column(size_t index) const {
    if (index >= columns_.size()) {
        throw Basketry::DatasetException("Column index out of range: " + std::to_string(index));
    }
    return columns_[index];
}

int Table::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

bool Table::isStringLike(size_t index) const {
    const TableColumn& col = column(index);
    for (size_t r = 0; r < col.values.size(); ++r) {
        if (col.missing[r]) continue;
        double ignored = 0.0;
        if (!parseFiniteDouble(col.values[r], ignored)) return true;
    }
    return false;
}

size_t Table::distinctCount(size_t index) const {
    const TableColumn& col = column(index);
    std::unordered_set<std::string> uniq;
    for (size_t r = 0; r < col.values.size(); ++r) {
        if (col.missing[r]) continue;
        uniq.insert(col.values[r]);
    }
    return uniq.size();
}

Table Table::selectColumns(const std::vector<std::string>& names) const {
    Table out;
    std::unordered_set<std::string> seen;
    for (const auto& name : names) {
        if (!seen.insert(name).second) {
            throw Basketry::DatasetException("Column selected twice: " + name);
        }
        const int idx = findColumnIndex(name);
        if (idx < 0) throw Basketry::DatasetException("Selected column not found: " + name);
        const TableColumn& src = columns_[static_cast<size_t>(idx)];
        TableColumn copy = src;
        if (out.columns_.empty()) out.rowCount_ = copy.values.size();
        out.columns_.push_back(std::move(copy));
    }
    return out;
}

bool Table::isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

Table TableLoader::fromFile(const std::string& path, char delimiter, LoadReport* report) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Basketry::IOException("Could not open file: " + path);
    return fromStream(in, delimiter, report);
}

Table TableLoader::fromString(const std::string& text, char delimiter, LoadReport* report) {
    std::istringstream in(text);
    return fromStream(in, delimiter, report);
}

Table TableLoader::fromStream(std::istream& in, char delimiter, LoadReport* report) {
    CSVUtils::skipBOM(in);
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw Basketry::IOException("Failed while reading table input");

    if (delimiter == kAutoDelimiter) {
        const size_t eol = content.find_first_of("\r\n");
        delimiter = CSVUtils::sniffDelimiter(content.substr(0, eol));
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Basketry::DatasetException("Invalid delimiter character");
    }

    LoadReport local;
    local.delimiter = delimiter;

    std::istringstream stream(content);
    CSVUtils::Record record;
    std::vector<std::string> header;
    while (CSVUtils::readRecord(stream, delimiter, record)) {
        if (record.fields.empty() || isBlankRecord(record.fields)) continue;
        if (record.malformed || record.limitExceeded) {
            throw Basketry::DatasetException("Malformed or empty CSV header");
        }
        header = record.fields;
        break;
    }
    if (header.empty()) throw Basketry::DatasetException("Malformed or empty CSV header");
    header = CSVUtils::normalizeHeader(header);

    std::vector<std::vector<std::string>> cells(header.size());
    while (CSVUtils::readRecord(stream, delimiter, record)) {
        if (record.fields.empty() || isBlankRecord(record.fields)) continue;
        if (record.malformed || record.limitExceeded) {
            ++local.malformedRows;
            continue;
        }
        if (record.fields.size() < header.size()) {
            ++local.paddedRows;
            record.fields.resize(header.size());
        } else if (record.fields.size() > header.size()) {
            ++local.truncatedRows;
            record.fields.resize(header.size());
        }
        for (size_t c = 0; c < header.size(); ++c) {
            cells[c].push_back(std::move(record.fields[c]));
        }
        ++local.rowsLoaded;
    }

    Table table;
    for (size_t c = 0; c < header.size(); ++c) {
        table.addColumn(header[c], std::move(cells[c]));
    }
    if (report) *report = local;
    return table;
}
