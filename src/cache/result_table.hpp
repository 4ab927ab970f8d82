#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace querycache {

// Tabular query result: named columns, rows of JSON scalars.
struct ResultTable {
    std::vector<std::string> columns;
    std::vector<std::vector<nlohmann::json>> rows;

    bool empty() const { return rows.empty(); }
    size_t row_count() const { return rows.size(); }
};

// {"columns":[...],"rows":[[...],...]}
std::string serialize_table(const ResultTable& table);

// Throws nlohmann::json::exception on malformed JSON and
// std::runtime_error when a row's width does not match the columns.
ResultTable deserialize_table(const std::string& payload);

// Column names as a JSON array string.
std::string column_manifest(const std::vector<std::string>& columns);

// Inverse of column_manifest(); empty input yields no columns.
std::vector<std::string> parse_column_manifest(const std::string& manifest);

} // namespace querycache
