/**
 * @file PropertyStore.cpp
 * @brief Implementation of PropertyStore.
 */

#include "domain/PropertyStore.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace geoflow::domain {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string FormatDouble(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

bool HasEnvPrefix(const std::string& token) {
    if (token.size() < 4) return false;
    std::string prefix = token.substr(0, 4);
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return prefix == "env:";
}

} // namespace

std::string PropertyValueToString(const PropertyValue& value) {
    return std::visit(Overloaded{
        [](const std::string& s) { return s; },
        [](bool b) { return std::string(b ? "true" : "false"); },
        [](std::int64_t i) { return std::to_string(i); },
        [](double d) { return FormatDouble(d); },
        [](const std::filesystem::path& p) { return p.generic_string(); },
        [](const std::vector<std::string>& list) {
            std::string out = "[";
            for (std::size_t i = 0; i < list.size(); ++i) {
                if (i > 0) out += ",";
                out += list[i];
            }
            return out + "]";
        }
    }, value);
}

std::string PropertyTypeName(const PropertyValue& value) {
    return std::visit(Overloaded{
        [](const std::string&) { return std::string("str"); },
        [](bool) { return std::string("bool"); },
        [](std::int64_t) { return std::string("int"); },
        [](double) { return std::string("float"); },
        [](const std::filesystem::path&) { return std::string("path"); },
        [](const std::vector<std::string>&) { return std::string("list"); }
    }, value);
}

const PropertyValue& PropertyStore::get(const std::string& name) const {
    auto it = m_values.find(name);
    if (it == m_values.end()) {
        throw MissingPropertyError(name);
    }
    return it->second;
}

PropertyValue PropertyStore::get(const std::string& name, const PropertyValue& fallback) const {
    auto it = m_values.find(name);
    return (it == m_values.end()) ? fallback : it->second;
}

std::optional<PropertyValue> PropertyStore::find(const std::string& name) const {
    auto it = m_values.find(name);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PropertyStore::contains(const std::string& name) const {
    return m_values.count(name) > 0;
}

void PropertyStore::set(const std::string& name, PropertyValue value) {
    if (IsWriteOnce(name) && contains(name)) {
        throw ImmutablePropertyError(name);
    }
    m_values[name] = std::move(value);
}

void PropertyStore::clear(const std::vector<std::string>& keep) {
    for (auto it = m_values.begin(); it != m_values.end();) {
        if (std::find(keep.begin(), keep.end(), it->first) == keep.end()) {
            it = m_values.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<std::string> PropertyStore::names() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [name, value] : m_values) {
        result.push_back(name);
    }
    return result;
}

ExpansionResult PropertyStore::expand(const std::string& raw) const {
    ExpansionResult result;
    std::string& out = result.value;
    std::size_t pos = 0;

    while (pos < raw.size()) {
        std::size_t start = raw.find("${", pos);
        if (start == std::string::npos) {
            out.append(raw, pos, std::string::npos);
            break;
        }
        out.append(raw, pos, start - pos);

        std::size_t end = raw.find('}', start + 2);
        if (end == std::string::npos) {
            out.append(raw, start, std::string::npos);
            result.unresolved.push_back(raw.substr(start + 2));
            break;
        }

        std::string token = raw.substr(start + 2, end - start - 2);
        std::optional<std::string> replacement;
        if (HasEnvPrefix(token)) {
            const char* env = std::getenv(token.substr(4).c_str());
            if (env) {
                replacement = std::string(env);
            }
        } else if (auto value = find(token)) {
            replacement = PropertyValueToString(*value);
        }

        if (replacement) {
            out += *replacement;
        } else {
            out.append(raw, start, end - start + 1);
            result.unresolved.push_back(token);
        }
        pos = end + 1;
    }
    return result;
}

bool PropertyStore::IsWriteOnce(const std::string& name) {
    return name == kWorkingDir || name == kTempDir;
}

} // namespace geoflow::domain
