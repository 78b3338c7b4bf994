/**
 * @file BuiltInCommands.cpp
 * @brief Registration of the built-in command set.
 */

#include "application/CommandFactory.hpp"
#include "application/commands/CommentCommands.hpp"
#include "application/commands/FileCommands.hpp"
#include "application/commands/GeoLayerCommands.hpp"
#include "application/commands/TableCommands.hpp"
#include "application/commands/WorkflowCommands.hpp"

namespace geoflow::application {

namespace {

template <typename T>
void Add(CommandFactory& factory, const std::string& name) {
    factory.registerCommand(name, [] { return std::make_unique<T>(); });
}

} // namespace

void RegisterBuiltInCommands(CommandFactory& factory) {
    using namespace commands;

    Add<Blank>(factory, "Blank");
    Add<Message>(factory, "Message");
    Add<StartLog>(factory, "StartLog");
    Add<SetProperty>(factory, "SetProperty");
    Add<WritePropertiesToFile>(factory, "WritePropertiesToFile");
    Add<RunProgram>(factory, "RunProgram");
    Add<WriteCommandSummaryToFile>(factory, "WriteCommandSummaryToFile");

    Add<CreateFolder>(factory, "CreateFolder");
    Add<CopyFile>(factory, "CopyFile");
    Add<RemoveFile>(factory, "RemoveFile");
    Add<ListFiles>(factory, "ListFiles");
    Add<UnzipFile>(factory, "UnzipFile");
    Add<WebGet>(factory, "WebGet");

    Add<ReadGeoLayerFromGeoJSON>(factory, "ReadGeoLayerFromGeoJSON");
    Add<WriteGeoLayerToGeoJSON>(factory, "WriteGeoLayerToGeoJSON");
    Add<CopyGeoLayer>(factory, "CopyGeoLayer");
    Add<FreeGeoLayers>(factory, "FreeGeoLayers");
    Add<MergeGeoLayers>(factory, "MergeGeoLayers");
    Add<ClipGeoLayer>(factory, "ClipGeoLayer");
    Add<SimplifyGeoLayerGeometry>(factory, "SimplifyGeoLayerGeometry");
    Add<SetGeoLayerCRS>(factory, "SetGeoLayerCRS");
    Add<SetGeoLayerProperty>(factory, "SetGeoLayerProperty");
    Add<AddGeoLayerAttribute>(factory, "AddGeoLayerAttribute");
    Add<RemoveGeoLayerAttributes>(factory, "RemoveGeoLayerAttributes");
    Add<RenameGeoLayerAttribute>(factory, "RenameGeoLayerAttribute");

    Add<ReadTableFromDelimitedFile>(factory, "ReadTableFromDelimitedFile");
    Add<WriteTableToDelimitedFile>(factory, "WriteTableToDelimitedFile");
    Add<OpenDataStore>(factory, "OpenDataStore");
    Add<ReadTableFromDataStore>(factory, "ReadTableFromDataStore");
    Add<CloseDataStore>(factory, "CloseDataStore");
}

} // namespace geoflow::application
