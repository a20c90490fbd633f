#pragma once

#include "feature_table.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace I3dmPack::Core::Tile {

// Constants
const uint32_t B3DM_MAGIC = 0x6D643362;
const uint32_t I3DM_MAGIC = 0x6D643369;
const uint32_t CMPT_MAGIC = 0x74706D63;
const uint32_t TILE_VERSION = 1;

struct B3dmHeader {
    uint32_t magic;
    uint32_t version;
    uint32_t byteLength;
    uint32_t featureTableJSONByteLength;
    uint32_t featureTableBinaryByteLength;
    uint32_t batchTableJSONByteLength;
    uint32_t batchTableBinaryByteLength;
};

struct I3dmHeader {
    uint32_t magic;
    uint32_t version;
    uint32_t byteLength;
    uint32_t featureTableJSONByteLength;
    uint32_t featureTableBinaryByteLength;
    uint32_t batchTableJSONByteLength;
    uint32_t batchTableBinaryByteLength;
    uint32_t gltfFormat; // 0: uri, 1: embedded
};

struct CmptHeader {
    uint32_t magic;
    uint32_t version;
    uint32_t byteLength;
    uint32_t tilesLength;
};

static_assert(sizeof(B3dmHeader) == 28, "b3dm header is 28 bytes");
static_assert(sizeof(I3dmHeader) == 32, "i3dm header is 32 bytes");
static_assert(sizeof(CmptHeader) == 16, "cmpt header is 16 bytes");

/**
 * Sections of an i3dm tile, copied out of the tile bytes.
 */
struct I3dmParts {
    I3dmHeader header{};
    nlohmann::ordered_json featureTableJson;
    std::vector<uint8_t> featureTableBinary;
    nlohmann::ordered_json batchTableJson;
    std::vector<uint8_t> batchTableBinary;
    std::string glb;    // zero padding included
};

/**
 * Instanced 3D model with an embedded glb (gltfFormat 1). The glb is zero
 * padded to 8 bytes.
 *
 * @param batchTable optional, nullptr for none
 */
std::vector<uint8_t> writeI3dm(const FeatureTableBuffer& featureTable,
                               const FeatureTableBuffer* batchTable,
                               const std::string& glb);

/**
 * Batched 3D model. The glb is zero padded to 8 bytes.
 */
std::vector<uint8_t> writeB3dm(const FeatureTableBuffer& featureTable,
                               const FeatureTableBuffer* batchTable,
                               const std::string& glb);

/**
 * Composite of inner tiles, each padded to 8 bytes.
 */
std::vector<uint8_t> writeCmpt(const std::vector<std::vector<uint8_t>>& tiles);

/**
 * Split an i3dm back into its sections.
 *
 * @throws MalformedAsset on a wrong magic or inconsistent lengths
 */
I3dmParts parseI3dm(const uint8_t* data, size_t length);

/**
 * Inner tiles of a composite tile.
 *
 * @throws MalformedAsset on a wrong magic or inconsistent lengths
 */
std::vector<std::vector<uint8_t>> splitCmpt(const uint8_t* data, size_t length);

}
