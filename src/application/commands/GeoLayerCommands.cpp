/**
 * @file GeoLayerCommands.cpp
 * @brief Implementation of the GeoLayer commands.
 */

#include "application/commands/GeoLayerCommands.hpp"

#include <algorithm>
#include <cctype>

#include "application/commands/CommandUtil.hpp"

namespace geoflow::application::commands {

using domain::GeoLayer;
using domain::GeometryKind;
using domain::Severity;

namespace {

constexpr const char* kCollisionParameter = "IfGeoLayerIDExists";

bool SameCrs(const std::string& a, const std::string& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

/** Runs "reproject" and returns the engine's layer; throws when it returns none. */
std::unique_ptr<GeoLayer> Reproject(WorkflowContext& context, const GeoLayer& layer, const std::string& crs) {
    domain::AlgorithmInputs inputs;
    inputs.layers.push_back(&layer);
    inputs.parameters["crs"] = crs;
    domain::AlgorithmOutputs outputs =
        RequireService(context.services.geometryEngine, "geometry engine").runAlgorithm("reproject", inputs);
    if (!outputs.layer) {
        throw std::runtime_error("Geometry engine returned no layer for reproject.");
    }
    outputs.layer->crs = crs;
    return std::move(outputs.layer);
}

} // namespace

// --- ReadGeoLayerFromGeoJSON ---

ReadGeoLayerFromGeoJSON::ReadGeoLayerFromGeoJSON()
    : Command("ReadGeoLayerFromGeoJSON", {
          {"InputFile", ParameterType::String, true, {}, "GeoJSON file to read."},
          {"GeoLayerID", ParameterType::String, false, {}, "ID of the new layer (default %f)."},
          {"Name", ParameterType::String, false, {}, "Layer name (default the ID)."},
          {"Description", ParameterType::String, false, {}, "Layer description."},
          {kCollisionParameter, ParameterType::Choice, false, CollisionChoices(), "Action when the ID exists (default Replace)."}
      }) {}

void ReadGeoLayerFromGeoJSON::runCommand(WorkflowContext& context) {
    const std::string inputFile = resolvePathParameter(context, "InputFile");
    const std::string id = applyFormatter(resolveParameter(context, "GeoLayerID", "%f"), inputFile);
    const domain::CollisionPolicy policy = collisionPolicy(kCollisionParameter);

    require(context, checks::FileExists{inputFile}, FailPolicy::Fail);
    if (isBlocked()) return;
    if (!checkOutputId(context, EntityKind::GeoLayer, id, policy)) return;

    std::unique_ptr<GeoLayer> layer = RequireService(context.services.layerCodec, "layer codec").readLayer(inputFile);
    layer->id = id;
    layer->name = resolveParameter(context, "Name", id);
    layer->description = resolveParameter(context, "Description");
    layer->sourcePath = inputFile;
    registerOutput(context.geoLayers, EntityKind::GeoLayer, id, std::move(layer), policy);
}

// --- WriteGeoLayerToGeoJSON ---

WriteGeoLayerToGeoJSON::WriteGeoLayerToGeoJSON()
    : Command("WriteGeoLayerToGeoJSON", {
          {"GeoLayerID", ParameterType::String, true, {}, "Layer to write."},
          {"OutputFile", ParameterType::String, true, {}, "GeoJSON file to write."},
          {"OutputCRS", ParameterType::String, false, {}, "Reproject to this CRS before writing."},
          {"OutputPrecision", ParameterType::Int, false, {}, "Coordinate decimals, 0 to 15 (default 5)."}
      }) {}

void WriteGeoLayerToGeoJSON::runCommand(WorkflowContext& context) {
    const std::string id = resolveParameter(context, "GeoLayerID");
    const std::string outputFile = resolvePathParameter(context, "OutputFile");
    const std::string outputCrs = resolveParameter(context, "OutputCRS");
    const std::int64_t precision = intParameter("OutputPrecision", 5);

    require(context, checks::IdExists{EntityKind::GeoLayer, id}, FailPolicy::Fail);
    require(context, checks::ParentFolderExists{outputFile}, FailPolicy::Fail);
    require(context, checks::IntInRange{"OutputPrecision", precision, 0, 15}, FailPolicy::Fail);
    if (!outputCrs.empty()) {
        require(context, checks::CrsCodeValid{outputCrs}, FailPolicy::Fail);
    }
    if (isBlocked()) return;

    const GeoLayer* layer = context.geoLayers.get(id);
    domain::LayerCodec& codec = RequireService(context.services.layerCodec, "layer codec");
    if (!outputCrs.empty() && !SameCrs(outputCrs, layer->crs)) {
        std::unique_ptr<GeoLayer> reprojected = Reproject(context, *layer, outputCrs);
        codec.writeLayer(*reprojected, outputFile, static_cast<int>(precision));
    } else {
        codec.writeLayer(*layer, outputFile, static_cast<int>(precision));
    }
}

// --- CopyGeoLayer ---

CopyGeoLayer::CopyGeoLayer()
    : Command("CopyGeoLayer", {
          {"GeoLayerID", ParameterType::String, true, {}, "Layer to copy."},
          {"CopiedGeoLayerID", ParameterType::String, false, {}, "ID of the copy (default <GeoLayerID>_copy)."},
          {kCollisionParameter, ParameterType::Choice, false, CollisionChoices(), "Action when the ID exists (default Replace)."}
      }) {}

void CopyGeoLayer::runCommand(WorkflowContext& context) {
    const std::string id = resolveParameter(context, "GeoLayerID");
    const std::string copyId = resolveParameter(context, "CopiedGeoLayerID", id + "_copy");
    const domain::CollisionPolicy policy = collisionPolicy(kCollisionParameter);

    require(context, checks::IdExists{EntityKind::GeoLayer, id}, FailPolicy::Fail);
    if (isBlocked()) return;
    if (!checkOutputId(context, EntityKind::GeoLayer, copyId, policy)) return;

    auto copy = std::make_unique<GeoLayer>(*context.geoLayers.get(id));
    copy->id = copyId;
    copy->sourcePath.clear();
    registerOutput(context.geoLayers, EntityKind::GeoLayer, copyId, std::move(copy), policy);
}

// --- FreeGeoLayers ---

FreeGeoLayers::FreeGeoLayers()
    : Command("FreeGeoLayers", {
          {"GeoLayerIDs", ParameterType::List, true, {}, "Layers to remove from the registry."}
      }) {}

void FreeGeoLayers::runCommand(WorkflowContext& context) {
    for (const auto& id : listParameter("GeoLayerIDs")) {
        if (!context.geoLayers.exists(id)) {
            logRun(Severity::Warning, "The GeoLayerID (" + id + ") does not exist; nothing to free.",
                   "Check the GeoLayerIDs parameter.");
        }
        context.geoLayers.remove(id);
    }
}

// --- MergeGeoLayers ---

MergeGeoLayers::MergeGeoLayers()
    : Command("MergeGeoLayers", {
          {"GeoLayerIDs", ParameterType::List, true, {}, "Layers to merge, in order."},
          {"OutputGeoLayerID", ParameterType::String, true, {}, "ID of the merged layer."},
          {kCollisionParameter, ParameterType::Choice, false, CollisionChoices(), "Action when the ID exists (default Replace)."}
      }) {}

void MergeGeoLayers::runCommand(WorkflowContext& context) {
    const std::vector<std::string> ids = listParameter("GeoLayerIDs");
    const std::string outputId = resolveParameter(context, "OutputGeoLayerID");
    const domain::CollisionPolicy policy = collisionPolicy(kCollisionParameter);

    for (const auto& id : ids) {
        require(context, checks::IdExists{EntityKind::GeoLayer, id}, FailPolicy::Fail);
    }
    if (isBlocked()) return;
    require(context, checks::LayersShareCrs{ids}, FailPolicy::Fail);
    if (isBlocked()) return;
    if (!checkOutputId(context, EntityKind::GeoLayer, outputId, policy)) return;

    auto merged = std::make_unique<GeoLayer>();
    merged->id = outputId;
    merged->name = outputId;
    for (const auto& id : ids) {
        const GeoLayer* layer = context.geoLayers.get(id);
        if (merged->crs.empty()) {
            merged->crs = layer->crs;
        }
        for (const auto& feature : layer->features) {
            merged->features.push_back(feature);
        }
    }
    merged->geometry = domain::DetectGeometryKind(merged->features);
    registerOutput(context.geoLayers, EntityKind::GeoLayer, outputId, std::move(merged), policy);
}

// --- ClipGeoLayer ---

ClipGeoLayer::ClipGeoLayer()
    : Command("ClipGeoLayer", {
          {"InputGeoLayerID", ParameterType::String, true, {}, "Layer to clip."},
          {"ClippingGeoLayerID", ParameterType::String, true, {}, "Polygon layer used as the clip boundary."},
          {"OutputGeoLayerID", ParameterType::String, false, {}, "ID of the result (default <Input>_clippedBy_<Clipping>)."},
          {"Name", ParameterType::String, false, {}, "Name of the result."},
          {"Description", ParameterType::String, false, {}, "Description of the result."},
          {kCollisionParameter, ParameterType::Choice, false, CollisionChoices(), "Action when the ID exists (default Replace)."}
      }) {}

void ClipGeoLayer::runCommand(WorkflowContext& context) {
    const std::string inputId = resolveParameter(context, "InputGeoLayerID");
    const std::string clipId = resolveParameter(context, "ClippingGeoLayerID");
    const std::string outputId = resolveParameter(context, "OutputGeoLayerID", inputId + "_clippedBy_" + clipId);
    const domain::CollisionPolicy policy = collisionPolicy(kCollisionParameter);

    require(context, checks::IdExists{EntityKind::GeoLayer, inputId}, FailPolicy::Fail);
    require(context, checks::IdExists{EntityKind::GeoLayer, clipId}, FailPolicy::Fail);
    if (isBlocked()) return;
    require(context, checks::LayersShareCrs{{inputId, clipId}}, FailPolicy::Fail);
    require(context, checks::LayerGeometryIn{clipId, {GeometryKind::Polygon, GeometryKind::MultiPolygon}},
            FailPolicy::Fail);
    if (isBlocked()) return;
    if (!checkOutputId(context, EntityKind::GeoLayer, outputId, policy)) return;

    const GeoLayer* input = context.geoLayers.get(inputId);
    domain::AlgorithmInputs inputs;
    inputs.layers = {input, context.geoLayers.get(clipId)};
    domain::AlgorithmOutputs outputs =
        RequireService(context.services.geometryEngine, "geometry engine").runAlgorithm("clip", inputs);
    if (!outputs.layer) {
        throw std::runtime_error("Geometry engine returned no layer for clip.");
    }

    std::unique_ptr<GeoLayer> clipped = std::move(outputs.layer);
    clipped->id = outputId;
    clipped->name = resolveParameter(context, "Name", outputId);
    clipped->description = resolveParameter(context, "Description");
    if (clipped->crs.empty()) {
        clipped->crs = input->crs;
    }
    registerOutput(context.geoLayers, EntityKind::GeoLayer, outputId, std::move(clipped), policy);
}

// --- SimplifyGeoLayerGeometry ---

SimplifyGeoLayerGeometry::SimplifyGeoLayerGeometry()
    : Command("SimplifyGeoLayerGeometry", {
          {"GeoLayerID", ParameterType::String, true, {}, "Layer to simplify."},
          {"Tolerance", ParameterType::String, true, {}, "Distance tolerance in layer units."},
          {"SimplifiedGeoLayerID", ParameterType::String, false, {}, "ID of the result (default <GeoLayerID>_simple)."},
          {kCollisionParameter, ParameterType::Choice, false, CollisionChoices(), "Action when the ID exists (default Replace)."}
      }) {}

void SimplifyGeoLayerGeometry::runCommand(WorkflowContext& context) {
    const std::string id = resolveParameter(context, "GeoLayerID");
    const std::string tolerance = resolveParameter(context, "Tolerance");
    const std::string outputId = resolveParameter(context, "SimplifiedGeoLayerID", id + "_simple");
    const domain::CollisionPolicy policy = collisionPolicy(kCollisionParameter);

    require(context, checks::IdExists{EntityKind::GeoLayer, id}, FailPolicy::Fail);
    const auto parsed = ParseTypedValue("float", tolerance);
    if (!parsed || std::get<double>(*parsed) <= 0.0) {
        blockRun(Severity::Failure, "Tolerance \"" + tolerance + "\" is not a positive number.",
                 "Specify a positive tolerance.");
    }
    if (isBlocked()) return;
    if (!checkOutputId(context, EntityKind::GeoLayer, outputId, policy)) return;

    const GeoLayer* layer = context.geoLayers.get(id);
    domain::AlgorithmInputs inputs;
    inputs.layers.push_back(layer);
    inputs.parameters["tolerance"] = tolerance;
    domain::AlgorithmOutputs outputs =
        RequireService(context.services.geometryEngine, "geometry engine").runAlgorithm("simplify", inputs);
    if (!outputs.layer) {
        throw std::runtime_error("Geometry engine returned no layer for simplify.");
    }

    std::unique_ptr<GeoLayer> simplified = std::move(outputs.layer);
    simplified->id = outputId;
    simplified->name = outputId;
    if (simplified->crs.empty()) {
        simplified->crs = layer->crs;
    }
    registerOutput(context.geoLayers, EntityKind::GeoLayer, outputId, std::move(simplified), policy);
}

// --- SetGeoLayerCRS ---

SetGeoLayerCRS::SetGeoLayerCRS()
    : Command("SetGeoLayerCRS", {
          {"GeoLayerID", ParameterType::String, true, {}, "Layer to change."},
          {"CRS", ParameterType::String, true, {}, "New coordinate reference system, e.g. EPSG:4326."}
      }) {}

void SetGeoLayerCRS::runCommand(WorkflowContext& context) {
    const std::string id = resolveParameter(context, "GeoLayerID");
    const std::string crs = resolveParameter(context, "CRS");

    require(context, checks::IdExists{EntityKind::GeoLayer, id}, FailPolicy::Fail);
    require(context, checks::CrsCodeValid{crs}, FailPolicy::Fail);
    if (isBlocked()) return;

    GeoLayer* layer = context.geoLayers.get(id);
    if (layer->crs.empty() || SameCrs(layer->crs, crs)) {
        layer->crs = crs;
        return;
    }
    std::unique_ptr<GeoLayer> reprojected = Reproject(context, *layer, crs);
    layer->features = std::move(reprojected->features);
    layer->geometry = domain::DetectGeometryKind(layer->features);
    layer->crs = crs;
}

// --- SetGeoLayerProperty ---

SetGeoLayerProperty::SetGeoLayerProperty()
    : Command("SetGeoLayerProperty", {
          {"GeoLayerID", ParameterType::String, true, {}, "Layer to annotate."},
          {"PropertyName", ParameterType::String, true, {}, "Property name."},
          {"PropertyType", ParameterType::Choice, false, PropertyTypeChoices(), "Type of the value (default str)."},
          {"PropertyValue", ParameterType::String, true, {}, "Property value."}
      }) {}

void SetGeoLayerProperty::runCommand(WorkflowContext& context) {
    const std::string id = resolveParameter(context, "GeoLayerID");
    const std::string name = resolveParameter(context, "PropertyName");
    const std::string type = stringParameter("PropertyType", "str");
    const std::string text = resolveParameter(context, "PropertyValue");

    require(context, checks::IdExists{EntityKind::GeoLayer, id}, FailPolicy::Fail);
    const auto value = ParseTypedValue(type, text);
    if (!value) {
        blockRun(Severity::Failure, "PropertyValue \"" + text + "\" is not a valid " + type + " value.",
                 "Specify a value that matches PropertyType.");
    }
    if (isBlocked()) return;

    context.geoLayers.get(id)->properties[name] = *value;
}

// --- AddGeoLayerAttribute ---

AddGeoLayerAttribute::AddGeoLayerAttribute()
    : Command("AddGeoLayerAttribute", {
          {"GeoLayerID", ParameterType::String, true, {}, "Layer to change."},
          {"AttributeName", ParameterType::String, true, {}, "Attribute to add to every feature."},
          {"InitialValue", ParameterType::String, false, {}, "Value of the new attribute (default null)."}
      }) {}

void AddGeoLayerAttribute::runCommand(WorkflowContext& context) {
    const std::string id = resolveParameter(context, "GeoLayerID");
    const std::string attribute = resolveParameter(context, "AttributeName");
    const bool hasInitial = hasParameter("InitialValue");
    const std::string initial = resolveParameter(context, "InitialValue");

    require(context, checks::IdExists{EntityKind::GeoLayer, id}, FailPolicy::Fail);
    if (isBlocked()) return;

    GeoLayer* layer = context.geoLayers.get(id);
    if (AttributeNames(*layer).count(attribute)) {
        blockRun(Severity::Warning, "The attribute (" + attribute + ") already exists in GeoLayer " + id + ".",
                 "Specify a new attribute name.");
        return;
    }
    for (auto& feature : layer->features) {
        if (!feature.contains("properties") || !feature["properties"].is_object()) {
            feature["properties"] = nlohmann::json::object();
        }
        feature["properties"][attribute] = hasInitial ? nlohmann::json(initial) : nlohmann::json(nullptr);
    }
}

// --- RemoveGeoLayerAttributes ---

RemoveGeoLayerAttributes::RemoveGeoLayerAttributes()
    : Command("RemoveGeoLayerAttributes", {
          {"GeoLayerID", ParameterType::String, true, {}, "Layer to change."},
          {"AttributeNames", ParameterType::List, true, {}, "Attributes to remove."}
      }) {}

void RemoveGeoLayerAttributes::runCommand(WorkflowContext& context) {
    const std::string id = resolveParameter(context, "GeoLayerID");
    const std::vector<std::string> attributes = listParameter("AttributeNames");

    require(context, checks::IdExists{EntityKind::GeoLayer, id}, FailPolicy::Fail);
    if (isBlocked()) return;

    GeoLayer* layer = context.geoLayers.get(id);
    const std::set<std::string> existing = AttributeNames(*layer);
    for (const auto& attribute : attributes) {
        if (!existing.count(attribute)) {
            logRun(Severity::Warning, "The attribute (" + attribute + ") does not exist in GeoLayer " + id + ".",
                   "Check the AttributeNames parameter.");
        }
    }
    for (auto& feature : layer->features) {
        if (!feature.contains("properties") || !feature["properties"].is_object()) continue;
        for (const auto& attribute : attributes) {
            feature["properties"].erase(attribute);
        }
    }
}

// --- RenameGeoLayerAttribute ---

RenameGeoLayerAttribute::RenameGeoLayerAttribute()
    : Command("RenameGeoLayerAttribute", {
          {"GeoLayerID", ParameterType::String, true, {}, "Layer to change."},
          {"ExistingAttributeName", ParameterType::String, true, {}, "Attribute to rename."},
          {"NewAttributeName", ParameterType::String, true, {}, "New attribute name."}
      }) {}

void RenameGeoLayerAttribute::runCommand(WorkflowContext& context) {
    const std::string id = resolveParameter(context, "GeoLayerID");
    const std::string from = resolveParameter(context, "ExistingAttributeName");
    const std::string to = resolveParameter(context, "NewAttributeName");

    require(context, checks::IdExists{EntityKind::GeoLayer, id}, FailPolicy::Fail);
    if (isBlocked()) return;

    GeoLayer* layer = context.geoLayers.get(id);
    const std::set<std::string> existing = AttributeNames(*layer);
    if (!existing.count(from)) {
        blockRun(Severity::Failure, "The attribute (" + from + ") does not exist in GeoLayer " + id + ".",
                 "Specify an existing attribute.");
    }
    if (existing.count(to)) {
        blockRun(Severity::Failure, "The attribute (" + to + ") already exists in GeoLayer " + id + ".",
                 "Specify a new attribute name.");
    }
    if (isBlocked()) return;

    for (auto& feature : layer->features) {
        if (!feature.contains("properties") || !feature["properties"].is_object()) continue;
        nlohmann::json& properties = feature["properties"];
        if (properties.contains(from)) {
            properties[to] = properties[from];
            properties.erase(from);
        }
    }
}

} // namespace geoflow::application::commands
