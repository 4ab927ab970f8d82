#include "result_table.hpp"
#include <stdexcept>

namespace querycache {

std::string serialize_table(const ResultTable& table) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : table.rows) {
        rows.push_back(row);
    }
    nlohmann::json j = {
        {"columns", table.columns},
        {"rows", std::move(rows)}
    };
    return j.dump();
}

ResultTable deserialize_table(const std::string& payload) {
    nlohmann::json j = nlohmann::json::parse(payload);

    ResultTable table;
    table.columns = j.at("columns").get<std::vector<std::string>>();

    const auto& rows = j.at("rows");
    if (!rows.is_array()) {
        throw std::runtime_error("result payload: rows is not an array");
    }
    table.rows.reserve(rows.size());
    for (const auto& row : rows) {
        if (!row.is_array() || row.size() != table.columns.size()) {
            throw std::runtime_error("result payload: row width does not match columns");
        }
        table.rows.push_back(row.get<std::vector<nlohmann::json>>());
    }
    return table;
}

std::string column_manifest(const std::vector<std::string>& columns) {
    return nlohmann::json(columns).dump();
}

std::vector<std::string> parse_column_manifest(const std::string& manifest) {
    if (manifest.empty()) return {};
    return nlohmann::json::parse(manifest).get<std::vector<std::string>>();
}

} // namespace querycache
