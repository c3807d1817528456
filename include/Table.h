#pragma once
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

using MissingMask = std::vector<uint8_t>;

struct TableColumn {
    std::string name;
    std::vector<std::string> values;
    MissingMask missing;
};

/**
 * @brief Column-major table of string cells.
 * @details Every cell is kept as text; a cell is missing when blank or a null token
 * (na, n/a, null, none, nan, missing). All columns share the same row count.
 */
class Table {
public:
    Table() = default;

    /**
     * @brief Appends a column and derives its missing mask.
     * @pre values.size() == rowCount() unless this is the first column.
     * @throws Basketry::DatasetException on a row count mismatch.
     */
    void addColumn(std::string name, std::vector<std::string> values);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }
    bool empty() const noexcept { return rowCount_ == 0; }

    const std::vector<TableColumn>& columns() const noexcept { return columns_; }
    const TableColumn& column(size_t index) const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    // True when at least one present cell does not parse as a finite number.
    bool isStringLike(size_t index) const;
    size_t distinctCount(size_t index) const;

    /**
     * @brief Returns a table holding only the named columns, in the requested order.
     * @throws Basketry::DatasetException when a name is unknown or listed twice.
     */
    Table selectColumns(const std::vector<std::string>& names) const;

    static bool isMissingToken(const std::string& raw);

private:
    size_t rowCount_ = 0;
    std::vector<TableColumn> columns_;
};

struct LoadReport {
    char delimiter = ',';
    size_t rowsLoaded = 0;
    size_t malformedRows = 0;
    size_t paddedRows = 0;
    size_t truncatedRows = 0;
};

class TableLoader {
public:
    static constexpr char kAutoDelimiter = '\0';

    /**
     * @brief Loads a delimited text file into a Table.
     * @details Delimiter kAutoDelimiter sniffs the header line. Short rows are padded with
     * missing cells, long rows truncated, blank lines and unterminated quoted records skipped.
     * @throws Basketry::IOException when the file cannot be read.
     * @throws Basketry::DatasetException on a missing or malformed header.
     */
    static Table fromFile(const std::string& path, char delimiter = kAutoDelimiter, LoadReport* report = nullptr);
    static Table fromStream(std::istream& in, char delimiter = kAutoDelimiter, LoadReport* report = nullptr);
    static Table fromString(const std::string& text, char delimiter = kAutoDelimiter, LoadReport* report = nullptr);
};
