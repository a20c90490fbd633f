#pragma once

#include "../gltf/accessor_decoder.h"
#include "../gltf/gltf_model.h"
#include "../gltf/typed_view.h"
#include "../tile/property.h"
#include <cstddef>
#include <vector>

namespace I3dmPack::Core::Instancing {

/**
 * Accessor ids referenced by a node's EXT_mesh_gpu_instancing attributes,
 * -1 when the attribute is absent.
 */
struct InstancingAttributes {
    int translation = -1;   // TRANSLATION
    int rotation = -1;      // ROTATION
    int scale = -1;         // SCALE
    int featureId = -1;     // _FEATURE_ID_0

    bool empty() const {
        return translation < 0 && rotation < 0 && scale < 0 && featureId < 0;
    }
};

struct InstanceNormals {
    Gltf::TypedView normalUps;     // FLOAT32 VEC3 per instance
    Gltf::TypedView normalRights;  // FLOAT32 VEC3 per instance
};

struct ExtractedInstances {
    size_t instancesLength = 0;
    // POSITION, NORMAL_UP, NORMAL_RIGHT, SCALE_NON_UNIFORM, BATCH_ID, each
    // only when the source attribute exists
    std::vector<Tile::Property> properties;
};

/**
 * Turns EXT_mesh_gpu_instancing attributes into i3dm feature table
 * properties. Decoded attributes alias the model's buffer; derived ones
 * (normals, widened ids) own fresh buffers.
 */
class InstanceExtractor {
public:
    explicit InstanceExtractor(Gltf::ModelPtr model);

    /**
     * Read the attribute accessor ids of a node.
     *
     * @throws MalformedAccessor when an attribute is not an accessor index
     */
    static InstancingAttributes readAttributes(const tinygltf::Node& node);

    /**
     * Extract all instancing attributes of a node. All or nothing: any
     * failing attribute aborts the node.
     *
     * @throws MalformedAccessor, UnsupportedAsset (from the decoder)
     */
    ExtractedInstances extract(const tinygltf::Node& node) const;
    ExtractedInstances extract(int nodeId) const;

    /**
     * Up (column 1) and right (column 0) vectors of each quaternion's
     * rotation matrix, normalized. BYTE and SHORT quaternions are treated
     * as normalized integers.
     *
     * @throws MalformedAccessor when a column has no length
     */
    static InstanceNormals computeNormals(const Gltf::TypedView& quaternions);

    /**
     * Feature ids as an unsigned integer view. UINT8/16/32 are returned as
     * is, anything else is copied into UINT32 (modulo 2^32, floats
     * truncated, non-finite values to 0).
     */
    static Gltf::TypedView widenFeatureIds(const Gltf::TypedView& ids);

private:
    Gltf::ModelPtr model_;
};

}
