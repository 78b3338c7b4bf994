/**
 * @file DataStore.hpp
 * @brief Connection to a collection of tables, held in the DataStore registry.
 */

#pragma once

#include <filesystem>
#include <string>

namespace geoflow::domain {

/**
 * @struct DataStore
 * @brief Folder-backed datastore: each table is a delimited file "<table>.csv" in the folder.
 */
struct DataStore {
    std::string id;
    std::filesystem::path folder;
    std::string delimiter = ",";

    std::filesystem::path tablePath(const std::string& table) const {
        return folder / (table + ".csv");
    }
};

} // namespace geoflow::domain
