#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization, header normalization and field escaping.
// This module does not assign semantic roles to columns.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;     // 8 MiB
    size_t maxRecordBytes = 64 * 1024 * 1024;   // 64 MiB
    size_t maxColumns = 20000;
};

struct Record {
    std::vector<std::string> fields;
    bool malformed = false;      // unterminated quoted field
    bool limitExceeded = false;  // one of ParseLimits was hit
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record (quoted fields may span physical lines).
 * @return false when the stream is exhausted before any character is read.
 * @post A blank physical line yields a record with no fields.
 */
bool readRecord(std::istream& is, char delimiter, Record& out, const ParseLimits& limits = ParseLimits{});

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

/**
 * @brief Picks the most frequent of `,` `\t` `;` `|` outside quotes in a header line.
 * @details Falls back to `,` when no candidate occurs; ties keep the earlier candidate.
 */
char sniffDelimiter(const std::string& headerLine);

// Quotes a field when it contains the delimiter, a quote or a line break.
std::string escapeField(const std::string& value, char delimiter = ',');
} // namespace CSVUtils
