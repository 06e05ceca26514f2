#ifndef MORK_TABLE_H
#define MORK_TABLE_H

#include <string>
#include <unordered_map>

namespace Mork {

// Column name -> cell value.
using Row = std::unordered_map<std::string, std::string>;

struct Table {
    // Table-scope cells from the metatable, e.g. the row scope under "r".
    std::unordered_map<std::string, std::string> meta;

    // Row id -> row.
    std::unordered_map<std::string, Row> rows;
};

// Tables are keyed by "<id>:<scope>", since ids are only unique within a scope.
using TableMap = std::unordered_map<std::string, Table>;

} // namespace Mork

#endif // MORK_TABLE_H
