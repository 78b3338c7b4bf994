/**
 * @file WorkflowContext.hpp
 * @brief Shared state every command of one workflow run reads and mutates.
 */

#pragma once

#include <memory>
#include <vector>

#include "domain/ArchiveService.hpp"
#include "domain/DataStore.hpp"
#include "domain/DataTable.hpp"
#include "domain/Downloader.hpp"
#include "domain/EntityRegistry.hpp"
#include "domain/GeoLayer.hpp"
#include "domain/GeometryEngine.hpp"
#include "domain/LayerCodec.hpp"
#include "domain/ProgramRunner.hpp"
#include "domain/PropertyStore.hpp"
#include "domain/TableCodec.hpp"

namespace geoflow::application {

class Command;

/**
 * @struct WorkflowServices
 * @brief External collaborators commands delegate their effects to.
 * Any of them may be null; a command that needs a missing one fails at run time.
 */
struct WorkflowServices {
    std::shared_ptr<domain::LayerCodec> layerCodec;
    std::shared_ptr<domain::TableCodec> tableCodec;
    std::shared_ptr<domain::GeometryEngine> geometryEngine;
    std::shared_ptr<domain::ArchiveService> archiveService;
    std::shared_ptr<domain::Downloader> downloader;
    std::shared_ptr<domain::ProgramRunner> programRunner;
};

/** @brief Registry the ID checks of the validator look into. */
enum class EntityKind { GeoLayer, Table, DataStore };

inline std::string EntityKindToString(EntityKind kind) {
    switch (kind) {
        case EntityKind::GeoLayer: return "GeoLayer";
        case EntityKind::Table: return "Table";
        case EntityKind::DataStore: return "DataStore";
        default: return "GeoLayer";
    }
}

/**
 * @struct WorkflowContext
 * @brief Properties, registries and services of one workflow processor.
 *
 * Passed by reference into every command; commands run strictly one after
 * another so no locking is involved.
 */
struct WorkflowContext {
    domain::PropertyStore properties;
    domain::EntityRegistry<domain::GeoLayer> geoLayers;
    domain::EntityRegistry<domain::DataTable> tables;
    domain::EntityRegistry<domain::DataStore> dataStores;
    WorkflowServices services;

    /** Command list of the owning processor, for commands that report on the whole workflow. */
    const std::vector<std::unique_ptr<Command>>* commands = nullptr;

    bool exists(EntityKind kind, const std::string& id) const {
        switch (kind) {
            case EntityKind::GeoLayer: return geoLayers.exists(id);
            case EntityKind::Table: return tables.exists(id);
            case EntityKind::DataStore: return dataStores.exists(id);
        }
        return false;
    }

    void clearEntities() {
        geoLayers.clear();
        tables.clear();
        dataStores.clear();
    }
};

} // namespace geoflow::application
