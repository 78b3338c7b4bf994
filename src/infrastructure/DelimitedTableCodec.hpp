/**
 * @file DelimitedTableCodec.hpp
 * @brief TableCodec for delimited text (CSV and friends).
 */

#pragma once

#include <string>
#include <vector>

#include "domain/TableCodec.hpp"

namespace geoflow::infrastructure {

/**
 * @class DelimitedTableCodec
 * @brief Fields containing the delimiter, quotes or newlines are double-quoted;
 * embedded quotes are doubled.
 */
class DelimitedTableCodec : public domain::TableCodec {
public:
    std::unique_ptr<domain::DataTable> readTable(const std::filesystem::path& path, char delimiter) override;
    void writeTable(const domain::DataTable& table, const std::filesystem::path& path,
                    char delimiter, bool writeHeader) override;

    /** @brief Splits delimited text into records. Quoted fields may span lines. */
    static std::vector<std::vector<std::string>> ParseRecords(const std::string& text, char delimiter);

    static std::string FormatRecord(const std::vector<std::string>& fields, char delimiter);
};

} // namespace geoflow::infrastructure
