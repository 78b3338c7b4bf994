/**
 * @file DelimitedTableCodec.cpp
 * @brief Implementation of DelimitedTableCodec.
 */

#include "infrastructure/DelimitedTableCodec.hpp"

#include <stdexcept>

#include "infrastructure/AtomicFileWriter.hpp"

namespace geoflow::infrastructure {

std::unique_ptr<domain::DataTable> DelimitedTableCodec::readTable(const std::filesystem::path& path, char delimiter) {
    std::vector<std::vector<std::string>> records = ParseRecords(AtomicFileWriter::Read(path), delimiter);
    if (records.empty()) {
        throw std::runtime_error("Delimited file has no header row: " + path.string());
    }

    auto table = std::make_unique<domain::DataTable>();
    table->columns = std::move(records.front());
    table->sourcePath = path;
    for (std::size_t i = 1; i < records.size(); ++i) {
        std::vector<std::string>& row = records[i];
        row.resize(table->columns.size());
        table->rows.push_back(std::move(row));
    }
    return table;
}

void DelimitedTableCodec::writeTable(const domain::DataTable& table, const std::filesystem::path& path,
                                     char delimiter, bool writeHeader) {
    std::string text;
    if (writeHeader) {
        text += FormatRecord(table.columns, delimiter);
    }
    for (const auto& row : table.rows) {
        text += FormatRecord(row, delimiter);
    }
    AtomicFileWriter::Write(path, text);
}

std::vector<std::vector<std::string>> DelimitedTableCodec::ParseRecords(const std::string& text, char delimiter) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool inQuotes = false;
    bool recordHasContent = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == '"') {
            inQuotes = true;
            recordHasContent = true;
        } else if (c == delimiter) {
            record.push_back(field);
            field.clear();
            recordHasContent = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            if (recordHasContent || !field.empty()) {
                record.push_back(field);
                records.push_back(record);
            }
            record.clear();
            field.clear();
            recordHasContent = false;
        } else {
            field += c;
            recordHasContent = true;
        }
    }
    if (inQuotes) {
        throw std::runtime_error("Delimited text ends inside a quoted field.");
    }
    if (recordHasContent || !field.empty()) {
        record.push_back(field);
        records.push_back(record);
    }
    return records;
}

std::string DelimitedTableCodec::FormatRecord(const std::vector<std::string>& fields, char delimiter) {
    std::string line;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += delimiter;
        const std::string& field = fields[i];
        if (field.find_first_of(std::string{delimiter, '"', '\n', '\r'}) == std::string::npos) {
            line += field;
            continue;
        }
        line += '"';
        for (char c : field) {
            if (c == '"') line += '"';
            line += c;
        }
        line += '"';
    }
    return line + "\n";
}

} // namespace geoflow::infrastructure
