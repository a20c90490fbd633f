#pragma once

#include "feature_table.h"
#include "../gltf/gltf_model.h"
#include <cstddef>
#include <optional>

namespace I3dmPack::Core::Tile {

struct BatchTable {
    size_t featuresLength = 0;
    FeatureTableBuffer table;
};

/**
 * Builds a 3D Tiles batch table from the EXT_feature_metadata feature table
 * of a glTF.
 *
 * Numeric scalars and numeric arrays of 2, 3 or 4 components stored in a
 * bufferView become binary columns ({byteOffset, componentType, type});
 * strings, booleans, enums and other fixed numeric arrays become JSON
 * arrays with one entry per feature. Properties the feature table does not
 * store fall back to the class default, or are skipped.
 */
class BatchTableBuilder {
public:
    /**
     * @return nothing when the asset has no feature table with a class
     * @throws MalformedAsset when the feature table references a missing
     *         class, MalformedAccessor when stored values are out of range
     */
    static std::optional<BatchTable> build(const Gltf::ModelPtr& model);
};

}
