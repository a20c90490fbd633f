#pragma once

#include "core/gltf/gltf_model.h"
#include "core/tile/feature_table.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace I3dmPack {

struct InstancingSettings {
    bool writeBatchTable = true;            // Emit EXT_feature_metadata as a batch table
    bool pruneSourceNodes = true;           // Keep only the instanced node and its ancestors in each glb
    bool stripInstancingExtension = true;   // Remove EXT_mesh_gpu_instancing from every node of the embedded glb
};

struct ConversionResult {
    std::string format;             // "i3dm", "b3dm" or "cmpt"
    size_t tilesLength = 0;         // inner tiles (1 unless cmpt)
    std::vector<uint8_t> bytes;
};

/**
 * Converts a glb carrying EXT_mesh_gpu_instancing into 3D Tiles content.
 *
 * Each instanced node becomes one i3dm whose feature table holds the
 * instance attributes and whose glb only keeps that node's branch of the
 * scene; several instanced nodes are wrapped in a cmpt. A glb without
 * instanced nodes is wrapped in a b3dm as is.
 */
class InstancingPipeline {
public:
    explicit InstancingPipeline(const InstancingSettings& settings);

    /**
     * @throws Core::MalformedAsset, Core::UnsupportedAsset,
     *         Core::MalformedAccessor, Core::PackingError
     */
    ConversionResult convert(const uint8_t* data, size_t length) const;
    ConversionResult convert(const Core::Gltf::ModelPtr& model) const;

private:
    std::vector<uint8_t> createI3DM(const Core::Gltf::ModelPtr& model, int nodeId,
                                    const Core::Tile::FeatureTableBuffer* batchTable) const;

    InstancingSettings settings;
};

}
