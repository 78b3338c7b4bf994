/**
 * @file DataTable.hpp
 * @brief Tabular data held in the Table registry.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace geoflow::domain {

struct DataTable {
    std::string id;
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;
    std::filesystem::path sourcePath;

    std::optional<std::size_t> columnIndex(const std::string& column) const {
        for (std::size_t i = 0; i < columns.size(); ++i) {
            if (columns[i] == column) return i;
        }
        return std::nullopt;
    }
};

} // namespace geoflow::domain
