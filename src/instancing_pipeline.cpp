#include "instancing_pipeline.h"
#include "logging.h"
#include "core/gltf/asset_validator.h"
#include "core/instancing/instance_extractor.h"
#include "core/scene/node_pruner.h"
#include "core/tile/batch_table.h"
#include "core/tile/tile_format.h"
#include "core/tile_error.h"
#include <optional>
#include <fmt/format.h>

namespace I3dmPack {

using namespace Core;

InstancingPipeline::InstancingPipeline(const InstancingSettings& settings)
    : settings(settings) {}

ConversionResult InstancingPipeline::convert(const uint8_t* data, size_t length) const {
    return convert(Gltf::loadGlb(data, length));
}

ConversionResult InstancingPipeline::convert(const Gltf::ModelPtr& model) const {
    Gltf::AssetValidator::validate(*model);

    std::optional<Tile::BatchTable> batchTable;
    if (settings.writeBatchTable) {
        batchTable = Tile::BatchTableBuilder::build(model);
    }
    const Tile::FeatureTableBuffer* batchTableBuffer = batchTable ? &batchTable->table : nullptr;

    ConversionResult result;
    std::vector<int> instancedNodes = Gltf::findInstancedNodes(*model);

    if (instancedNodes.empty()) {
        nlohmann::ordered_json globals;
        globals["BATCH_LENGTH"] = batchTable ? batchTable->featuresLength : 0;
        auto featureTable = Tile::FeatureTable::pack({}, globals);
        result.format = "b3dm";
        result.tilesLength = 1;
        result.bytes = Tile::writeB3dm(featureTable, batchTableBuffer, Gltf::writeGlb(*model));
        LOG_I("no instanced node, wrote b3dm of %zu bytes", result.bytes.size());
        return result;
    }

    std::vector<std::vector<uint8_t>> tiles;
    tiles.reserve(instancedNodes.size());
    for (int nodeId : instancedNodes) {
        tiles.push_back(createI3DM(model, nodeId, batchTableBuffer));
    }

    result.tilesLength = tiles.size();
    if (tiles.size() == 1) {
        result.format = "i3dm";
        result.bytes = std::move(tiles.front());
    } else {
        result.format = "cmpt";
        result.bytes = Tile::writeCmpt(tiles);
        LOG_I("wrote cmpt of %zu i3dm tiles, %zu bytes", tiles.size(), result.bytes.size());
    }
    return result;
}

std::vector<uint8_t> InstancingPipeline::createI3DM(const Gltf::ModelPtr& model, int nodeId,
                                                    const Tile::FeatureTableBuffer* batchTable) const {
    Instancing::InstanceExtractor extractor(model);
    Instancing::ExtractedInstances instances = extractor.extract(nodeId);
    if (instances.instancesLength == 0) {
        throw UnsupportedAsset(fmt::format("instanced node {} has no instances", nodeId));
    }

    // i3dm requires POSITION; glTF instances without TRANSLATION sit at the origin
    if (instances.properties.empty() || instances.properties.front().name != "POSITION") {
        Tile::Property positions;
        positions.name = "POSITION";
        positions.values = Gltf::TypedView::fromValues(std::vector<float>(instances.instancesLength * 3, 0.0f));
        instances.properties.insert(instances.properties.begin(), std::move(positions));
    }

    nlohmann::ordered_json globals;
    globals["INSTANCES_LENGTH"] = instances.instancesLength;
    auto featureTable = Tile::FeatureTable::pack(instances.properties, globals);

    // Extracted views alias the source model, so the scene edits go to a copy
    tinygltf::Model pruned = *model;
    if (settings.pruneSourceNodes) {
        Scene::NodePruner::pruneScene(pruned, nodeId);
    }
    if (settings.stripInstancingExtension) {
        for (int instancedId : Gltf::findInstancedNodes(pruned)) {
            Gltf::stripInstancing(pruned, instancedId);
        }
    }

    std::vector<uint8_t> tile = Tile::writeI3dm(featureTable, batchTable, Gltf::writeGlb(pruned));
    LOG_I("node %d: %zu instances, feature table %zu bytes, i3dm %zu bytes",
          nodeId, instances.instancesLength, featureTable.size(), tile.size());
    return tile;
}

}
