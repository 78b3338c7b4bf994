/**
 * @file EntityRegistry.hpp
 * @brief Keyed store of live workflow entities (layers, tables, datastores).
 */

#pragma once

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/CollisionPolicy.hpp"

namespace geoflow::domain {

/**
 * @class EntityRegistry
 * @brief Owns entities by string ID; at most one live entry per ID.
 *
 * registerEntity() is the only mutator that can meet an existing ID and it
 * resolves the conflict per CollisionPolicy before returning. The registry
 * never logs: callers turn the RegisterOutcome into log records.
 */
template <typename T>
class EntityRegistry {
public:
    T* get(const std::string& id) {
        auto it = m_entries.find(id);
        return (it == m_entries.end()) ? nullptr : it->second.get();
    }

    const T* get(const std::string& id) const {
        auto it = m_entries.find(id);
        return (it == m_entries.end()) ? nullptr : it->second.get();
    }

    bool exists(const std::string& id) const {
        return m_entries.find(id) != m_entries.end();
    }

    /**
     * @brief Inserts @p entity under @p id, consulting @p policy only when the ID exists.
     * @throws std::invalid_argument for an empty ID or a null entity.
     */
    RegisterOutcome registerEntity(const std::string& id, std::unique_ptr<T> entity, CollisionPolicy policy) {
        if (id.empty()) {
            throw std::invalid_argument("Registry IDs cannot be empty.");
        }
        if (!entity) {
            throw std::invalid_argument("Cannot register a null entity under \"" + id + "\".");
        }

        RegisterOutcome outcome;
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            m_entries.emplace(id, std::move(entity));
            outcome.inserted = true;
            return outcome;
        }

        switch (policy) {
            case CollisionPolicy::Replace:
                it->second = std::move(entity);
                outcome.inserted = true;
                break;
            case CollisionPolicy::ReplaceAndWarn:
                it->second = std::move(entity);
                outcome.inserted = true;
                outcome.warned = true;
                break;
            case CollisionPolicy::Warn:
                outcome.warned = true;
                break;
            case CollisionPolicy::Fail:
                outcome.failed = true;
                break;
        }
        return outcome;
    }

    /** @brief Removes @p id if present. Removing a missing ID is a no-op. */
    void remove(const std::string& id) {
        m_entries.erase(id);
    }

    /** @brief IDs in sorted order. */
    std::vector<std::string> ids() const {
        std::vector<std::string> result;
        result.reserve(m_entries.size());
        for (const auto& entry : m_entries) {
            result.push_back(entry.first);
        }
        return result;
    }

    std::size_t size() const { return m_entries.size(); }

    void clear() { m_entries.clear(); }

private:
    std::map<std::string, std::unique_ptr<T>> m_entries;
};

} // namespace geoflow::domain
