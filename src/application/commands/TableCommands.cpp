/**
 * @file TableCommands.cpp
 * @brief Implementation of the Table and DataStore commands.
 */

#include "application/commands/TableCommands.hpp"

#include <functional>

#include "application/commands/CommandUtil.hpp"

namespace geoflow::application::commands {

using domain::DataStore;
using domain::DataTable;
using domain::Severity;

namespace {

constexpr const char* kTableCollision = "IfTableIDExists";

void CheckDelimiter(const std::string& raw, const std::function<void(const std::string&, const std::string&)>& fail) {
    if (!raw.empty() && !ParseDelimiter(raw)) {
        fail("Delimiter \"" + raw + "\" must be a single character.", "Specify one character, or \\t for tab.");
    }
}

} // namespace

// --- ReadTableFromDelimitedFile ---

ReadTableFromDelimitedFile::ReadTableFromDelimitedFile()
    : Command("ReadTableFromDelimitedFile", {
          {"InputFile", ParameterType::String, true, {}, "Delimited file; the first row is the header."},
          {"Delimiter", ParameterType::String, false, {}, "Column delimiter (default comma)."},
          {"TableID", ParameterType::String, false, {}, "ID of the new table (default %f)."},
          {kTableCollision, ParameterType::Choice, false, CollisionChoices(), "Action when the ID exists (default Replace)."}
      }) {}

void ReadTableFromDelimitedFile::checkParameters(const domain::PropertyStore&) {
    CheckDelimiter(stringParameter("Delimiter"),
                   [this](const std::string& m, const std::string& r) { logInitFailure(m, r); });
}

void ReadTableFromDelimitedFile::runCommand(WorkflowContext& context) {
    const std::string inputFile = resolvePathParameter(context, "InputFile");
    const std::string id = applyFormatter(resolveParameter(context, "TableID", "%f"), inputFile);
    const char delimiter = ParseDelimiter(stringParameter("Delimiter", ",")).value_or(',');
    const domain::CollisionPolicy policy = collisionPolicy(kTableCollision);

    require(context, checks::FileExists{inputFile}, FailPolicy::Fail);
    if (isBlocked()) return;
    if (!checkOutputId(context, EntityKind::Table, id, policy)) return;

    std::unique_ptr<DataTable> table =
        RequireService(context.services.tableCodec, "table codec").readTable(inputFile, delimiter);
    table->id = id;
    table->sourcePath = inputFile;
    registerOutput(context.tables, EntityKind::Table, id, std::move(table), policy);
}

// --- WriteTableToDelimitedFile ---

WriteTableToDelimitedFile::WriteTableToDelimitedFile()
    : Command("WriteTableToDelimitedFile", {
          {"TableID", ParameterType::String, true, {}, "Table to write."},
          {"OutputFile", ParameterType::String, true, {}, "File to write."},
          {"Delimiter", ParameterType::String, false, {}, "Column delimiter (default comma)."},
          {"WriteHeaderRow", ParameterType::Bool, false, {}, "Write the column names first (default True)."}
      }) {}

void WriteTableToDelimitedFile::checkParameters(const domain::PropertyStore&) {
    CheckDelimiter(stringParameter("Delimiter"),
                   [this](const std::string& m, const std::string& r) { logInitFailure(m, r); });
}

void WriteTableToDelimitedFile::runCommand(WorkflowContext& context) {
    const std::string id = resolveParameter(context, "TableID");
    const std::string outputFile = resolvePathParameter(context, "OutputFile");
    const char delimiter = ParseDelimiter(stringParameter("Delimiter", ",")).value_or(',');
    const bool writeHeader = boolParameter("WriteHeaderRow", true);

    require(context, checks::IdExists{EntityKind::Table, id}, FailPolicy::Fail);
    require(context, checks::ParentFolderExists{outputFile}, FailPolicy::Fail);
    if (isBlocked()) return;

    RequireService(context.services.tableCodec, "table codec")
        .writeTable(*context.tables.get(id), outputFile, delimiter, writeHeader);
}

// --- OpenDataStore ---

OpenDataStore::OpenDataStore()
    : Command("OpenDataStore", {
          {"DataStoreID", ParameterType::String, true, {}, "ID of the datastore."},
          {"Folder", ParameterType::String, true, {}, "Folder holding the datastore's <table>.csv files."},
          {"Delimiter", ParameterType::String, false, {}, "Column delimiter of the table files (default comma)."},
          {"IfDataStoreIDExists", ParameterType::Choice, false, CollisionChoices(), "Action when the ID exists (default Replace)."}
      }) {}

void OpenDataStore::checkParameters(const domain::PropertyStore&) {
    CheckDelimiter(stringParameter("Delimiter"),
                   [this](const std::string& m, const std::string& r) { logInitFailure(m, r); });
}

void OpenDataStore::runCommand(WorkflowContext& context) {
    const std::string id = resolveParameter(context, "DataStoreID");
    const std::string folder = resolvePathParameter(context, "Folder");
    const domain::CollisionPolicy policy = collisionPolicy("IfDataStoreIDExists");

    require(context, checks::FolderExists{folder}, FailPolicy::Fail);
    if (isBlocked()) return;
    if (!checkOutputId(context, EntityKind::DataStore, id, policy)) return;

    auto store = std::make_unique<DataStore>();
    store->id = id;
    store->folder = folder;
    store->delimiter = std::string(1, ParseDelimiter(stringParameter("Delimiter", ",")).value_or(','));
    registerOutput(context.dataStores, EntityKind::DataStore, id, std::move(store), policy);
}

// --- ReadTableFromDataStore ---

ReadTableFromDataStore::ReadTableFromDataStore()
    : Command("ReadTableFromDataStore", {
          {"DataStoreID", ParameterType::String, true, {}, "Open datastore to read from."},
          {"DataStoreTable", ParameterType::String, true, {}, "Table name within the datastore."},
          {"TableID", ParameterType::String, false, {}, "ID of the new table (default DataStoreTable)."},
          {kTableCollision, ParameterType::Choice, false, CollisionChoices(), "Action when the ID exists (default Replace)."}
      }) {}

void ReadTableFromDataStore::runCommand(WorkflowContext& context) {
    const std::string storeId = resolveParameter(context, "DataStoreID");
    const std::string tableName = resolveParameter(context, "DataStoreTable");
    const std::string id = resolveParameter(context, "TableID", tableName);
    const domain::CollisionPolicy policy = collisionPolicy(kTableCollision);

    require(context, checks::IdExists{EntityKind::DataStore, storeId}, FailPolicy::Fail);
    if (isBlocked()) return;
    const DataStore* store = context.dataStores.get(storeId);
    const std::filesystem::path tablePath = store->tablePath(tableName);
    require(context, checks::FileExists{tablePath.generic_string()}, FailPolicy::Fail);
    if (isBlocked()) return;
    if (!checkOutputId(context, EntityKind::Table, id, policy)) return;

    std::unique_ptr<DataTable> table = RequireService(context.services.tableCodec, "table codec")
        .readTable(tablePath, store->delimiter.empty() ? ',' : store->delimiter.front());
    table->id = id;
    table->sourcePath = tablePath;
    registerOutput(context.tables, EntityKind::Table, id, std::move(table), policy);
}

// --- CloseDataStore ---

CloseDataStore::CloseDataStore()
    : Command("CloseDataStore", {
          {"DataStoreID", ParameterType::String, true, {}, "Datastore to close."}
      }) {}

void CloseDataStore::runCommand(WorkflowContext& context) {
    const std::string id = resolveParameter(context, "DataStoreID");
    if (!context.dataStores.exists(id)) {
        logRun(Severity::Warning, "The DataStoreID (" + id + ") is not open; nothing to close.",
               "Check the DataStoreID parameter.");
        return;
    }
    context.dataStores.remove(id);
}

} // namespace geoflow::application::commands
