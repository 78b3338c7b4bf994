/**
 * @file GeoLayerCommands.hpp
 * @brief Commands that create, transform and write entries of the GeoLayer registry.
 *
 * Every command producing a layer takes IfGeoLayerIDExists (Replace,
 * ReplaceAndWarn, Warn, Fail) for its output ID. Input layer IDs are checked
 * with the IdExists precondition and always fail when missing.
 */

#pragma once

#include "application/Command.hpp"

namespace geoflow::application::commands {

/** ReadGeoLayerFromGeoJSON(InputFile, GeoLayerID, Name, Description, IfGeoLayerIDExists). */
class ReadGeoLayerFromGeoJSON : public Command {
public:
    ReadGeoLayerFromGeoJSON();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** WriteGeoLayerToGeoJSON(GeoLayerID, OutputFile, OutputCRS, OutputPrecision). */
class WriteGeoLayerToGeoJSON : public Command {
public:
    WriteGeoLayerToGeoJSON();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** CopyGeoLayer(GeoLayerID, CopiedGeoLayerID, IfGeoLayerIDExists). */
class CopyGeoLayer : public Command {
public:
    CopyGeoLayer();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** FreeGeoLayers(GeoLayerIDs). */
class FreeGeoLayers : public Command {
public:
    FreeGeoLayers();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** MergeGeoLayers(GeoLayerIDs, OutputGeoLayerID, IfGeoLayerIDExists). */
class MergeGeoLayers : public Command {
public:
    MergeGeoLayers();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** ClipGeoLayer(InputGeoLayerID, ClippingGeoLayerID, OutputGeoLayerID, Name, Description, IfGeoLayerIDExists). */
class ClipGeoLayer : public Command {
public:
    ClipGeoLayer();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** SimplifyGeoLayerGeometry(GeoLayerID, Tolerance, SimplifiedGeoLayerID, IfGeoLayerIDExists). */
class SimplifyGeoLayerGeometry : public Command {
public:
    SimplifyGeoLayerGeometry();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** SetGeoLayerCRS(GeoLayerID, CRS). */
class SetGeoLayerCRS : public Command {
public:
    SetGeoLayerCRS();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** SetGeoLayerProperty(GeoLayerID, PropertyName, PropertyType, PropertyValue). */
class SetGeoLayerProperty : public Command {
public:
    SetGeoLayerProperty();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** AddGeoLayerAttribute(GeoLayerID, AttributeName, InitialValue). */
class AddGeoLayerAttribute : public Command {
public:
    AddGeoLayerAttribute();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** RemoveGeoLayerAttributes(GeoLayerID, AttributeNames). */
class RemoveGeoLayerAttributes : public Command {
public:
    RemoveGeoLayerAttributes();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** RenameGeoLayerAttribute(GeoLayerID, ExistingAttributeName, NewAttributeName). */
class RenameGeoLayerAttribute : public Command {
public:
    RenameGeoLayerAttribute();

protected:
    void runCommand(WorkflowContext& context) override;
};

} // namespace geoflow::application::commands
