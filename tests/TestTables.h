#pragma once

#include "Table.h"

#include <string>
#include <utility>
#include <vector>

namespace TestTables {

using ColumnSpec = std::pair<std::string, std::vector<std::string>>;

inline Table make(const std::vector<ColumnSpec>& columns) {
    Table table;
    for (const auto& [name, values] : columns) table.addColumn(name, values);
    return table;
}

} // namespace TestTables
