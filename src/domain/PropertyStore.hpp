/**
 * @file PropertyStore.hpp
 * @brief Named, typed workflow properties with ${Name} substitution.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace geoflow::domain {

/**
 * @brief Value held by a property.
 */
using PropertyValue = std::variant<std::string, bool, std::int64_t, double,
                                   std::filesystem::path, std::vector<std::string>>;

/**
 * @brief Renders a property value as text (lists as "[a,b]", booleans as "true"/"false").
 */
std::string PropertyValueToString(const PropertyValue& value);

/** @brief Name of the type held by @p value ("str", "bool", "int", "float", "path", "list"). */
std::string PropertyTypeName(const PropertyValue& value);

class MissingPropertyError : public std::runtime_error {
public:
    explicit MissingPropertyError(const std::string& name)
        : std::runtime_error("Property \"" + name + "\" is not defined."), m_name(name) {}

    const std::string& getName() const { return m_name; }

private:
    std::string m_name;
};

class ImmutablePropertyError : public std::runtime_error {
public:
    explicit ImmutablePropertyError(const std::string& name)
        : std::runtime_error("Property \"" + name + "\" is set once per workflow and cannot be changed.") {}
};

/**
 * @struct ExpansionResult
 * @brief Output of PropertyStore::expand().
 */
struct ExpansionResult {
    std::string value;                    ///< Text with every resolvable token substituted.
    std::vector<std::string> unresolved;  ///< Names of tokens left verbatim, in order of appearance.

    bool isComplete() const { return unresolved.empty(); }
};

/**
 * @class PropertyStore
 * @brief Mapping of property name to typed value, read by every command.
 *
 * WorkingDir and TempDir may be set once; a second set() throws
 * ImmutablePropertyError. clear() is the only way to drop them.
 * The store never logs.
 */
class PropertyStore {
public:
    static constexpr const char* kWorkingDir = "WorkingDir";
    static constexpr const char* kTempDir = "TempDir";

    /** @brief Returns the stored value or throws MissingPropertyError. */
    const PropertyValue& get(const std::string& name) const;

    /** @brief Returns the stored value or @p fallback. */
    PropertyValue get(const std::string& name, const PropertyValue& fallback) const;

    std::optional<PropertyValue> find(const std::string& name) const;

    bool contains(const std::string& name) const;

    void set(const std::string& name, PropertyValue value);

    /**
     * @brief Removes every property except the ones named in @p keep.
     */
    void clear(const std::vector<std::string>& keep = {});

    /** @brief Property names in sorted order. */
    std::vector<std::string> names() const;

    /**
     * @brief Substitutes ${Name} and ${env:NAME} tokens in @p raw.
     *
     * Unresolved tokens (and a trailing "${" without a closing brace) are kept
     * verbatim; their names are listed in the result for the caller to report.
     */
    ExpansionResult expand(const std::string& raw) const;

    static bool IsWriteOnce(const std::string& name);

private:
    std::map<std::string, PropertyValue> m_values;
};

} // namespace geoflow::domain
