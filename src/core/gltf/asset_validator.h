#pragma once

#include "gltf_model.h"

namespace I3dmPack::Core::Gltf {

/**
 * Capability checks run before any extraction. An asset failing them is
 * well formed but outside what the converter handles.
 */
class AssetValidator {
public:
    /**
     * @throws UnsupportedAsset on several buffers, no usable scene, several
     *         EXT_feature_metadata feature tables or an external schemaUri
     */
    static void validate(const tinygltf::Model& model);

    /**
     * Scene used for pruning: the declared default scene, or scene 0 when
     * the asset declares none and has exactly one scene. -1 otherwise.
     */
    static int resolveScene(const tinygltf::Model& model);
};

}
