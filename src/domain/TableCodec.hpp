/**
 * @file TableCodec.hpp
 * @brief Interface for reading and writing delimited tables.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "domain/DataTable.hpp"

namespace geoflow::domain {

class TableCodec {
public:
    virtual ~TableCodec() = default;

    /** @brief First row is the header. @throws std::runtime_error on I/O failure. */
    virtual std::unique_ptr<DataTable> readTable(const std::filesystem::path& path, char delimiter) = 0;

    virtual void writeTable(const DataTable& table, const std::filesystem::path& path,
                            char delimiter, bool writeHeader) = 0;
};

} // namespace geoflow::domain
