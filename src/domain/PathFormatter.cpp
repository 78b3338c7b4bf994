/**
 * @file PathFormatter.cpp
 * @brief Implementation of the path formatter codes.
 */

#include "domain/PathFormatter.hpp"

#include <filesystem>

namespace geoflow::domain {

FormatterCode ParseFormatterCode(const std::string& code) {
    if (code == "%F") return FormatterCode::FileNameWithExtension;
    if (code == "%f") return FormatterCode::FileName;
    if (code == "%P") return FormatterCode::FullPath;
    if (code == "%p") return FormatterCode::ParentPath;
    if (code == "%E") return FormatterCode::Extension;
    throw UnknownFormatterError(code);
}

std::string ApplyFormatter(const std::string& path, FormatterCode code) {
    const std::filesystem::path p(path);
    switch (code) {
        case FormatterCode::FileNameWithExtension: return p.filename().generic_string();
        case FormatterCode::FileName: return p.stem().generic_string();
        case FormatterCode::FullPath: return p.generic_string();
        case FormatterCode::ParentPath: return p.parent_path().generic_string();
        case FormatterCode::Extension: return p.extension().generic_string();
    }
    return std::string();
}

std::string ApplyFormatter(const std::string& path, const std::string& code) {
    return ApplyFormatter(path, ParseFormatterCode(code));
}

std::string FormatPath(const std::string& path, const std::string& pattern) {
    std::string out;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '%') {
            out += pattern[i];
            continue;
        }
        if (i + 1 >= pattern.size()) {
            throw UnknownFormatterError("%");
        }
        const char next = pattern[i + 1];
        if (next == '%') {
            out += '%';
        } else {
            out += ApplyFormatter(path, std::string{'%', next});
        }
        ++i;
    }
    return out;
}

} // namespace geoflow::domain
