#include "CSVUtils.h"

#include <array>
#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;

    const int first = is.peek();
    if (first == EOF || static_cast<unsigned char>(first) != 0xEF) {
        return;
    }

    is.get();
    const int second = is.peek();
    if (second == EOF || static_cast<unsigned char>(second) != 0xBB) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        return;
    }

    is.get();
    const int third = is.peek();
    if (third == EOF || static_cast<unsigned char>(third) != 0xBF) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        is.unget();
        return;
    }

    is.get();
}

bool readRecord(std::istream& is, char delimiter, Record& out, const ParseLimits& limits) {
    out.fields.clear();
    out.malformed = false;
    out.limitExceeded = false;
    if (is.peek() == EOF) return false;

    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawContent = false;
    size_t recordBytes = 0;
    char c;

    auto flushField = [&]() {
        out.fields.push_back(fieldQuoted ? field : trimUnquotedField(field));
        field.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && out.fields.size() > limits.maxColumns) {
            out.limitExceeded = true;
        }
    };

    while (is.get(c)) {
        ++recordBytes;
        if (limits.maxRecordBytes > 0 && recordBytes > limits.maxRecordBytes) {
            out.limitExceeded = true;
            break;
        }

        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    field.push_back('"');
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                field.push_back('\n');
            } else {
                field.push_back(c);
            }
        } else if (c == '"' && CSVUtils::trimUnquotedField(field).empty() && !fieldQuoted) {
            field.clear();
            inQuotes = true;
            fieldQuoted = true;
            sawContent = true;
        } else if (c == delimiter) {
            flushField();
            sawContent = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            // Text after a closing quote is kept verbatim, matching lenient readers.
            field.push_back(c);
            if (c != ' ' && c != '\t') sawContent = true;
        }

        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) {
            out.limitExceeded = true;
            break;
        }
        if (out.limitExceeded) break;
    }

    if (inQuotes) out.malformed = true;
    if (sawContent || !field.empty()) flushField();
    return true;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }

        std::string original = out[i];
        if (seen.find(out[i]) != seen.end()) {
            size_t suffix = 2;
            while (seen.find(original + "_" + std::to_string(suffix)) != seen.end()) {
                ++suffix;
            }
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }

    return out;
}

char sniffDelimiter(const std::string& headerLine) {
    static constexpr std::array<char, 4> kCandidates = {',', '\t', ';', '|'};
    std::array<size_t, 4> counts{};

    bool inQuotes = false;
    for (char c : headerLine) {
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (inQuotes) continue;
        for (size_t i = 0; i < kCandidates.size(); ++i) {
            if (c == kCandidates[i]) ++counts[i];
        }
    }

    size_t best = 0;
    for (size_t i = 1; i < kCandidates.size(); ++i) {
        if (counts[i] > counts[best]) best = i;
    }
    return counts[best] == 0 ? ',' : kCandidates[best];
}

std::string escapeField(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos ||
                             value.find('"') != std::string::npos ||
                             value.find('\n') != std::string::npos ||
                             value.find('\r') != std::string::npos;
    if (!needsQuotes) return value;

    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}
} // namespace CSVUtils
