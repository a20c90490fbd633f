#include "asset_validator.h"
#include "../tile_error.h"
#include <fmt/format.h>

namespace I3dmPack::Core::Gltf {

int AssetValidator::resolveScene(const tinygltf::Model& model) {
    int sceneCount = static_cast<int>(model.scenes.size());
    if (model.defaultScene >= 0) {
        return model.defaultScene < sceneCount ? model.defaultScene : -1;
    }
    return sceneCount == 1 ? 0 : -1;
}

void AssetValidator::validate(const tinygltf::Model& model) {
    if (model.buffers.size() > 1) {
        throw UnsupportedAsset(fmt::format("asset has {} buffers, only a single buffer is supported",
                                           model.buffers.size()));
    }
    if (model.scenes.empty()) {
        throw UnsupportedAsset("asset has no scene");
    }
    if (resolveScene(model) < 0) {
        throw UnsupportedAsset(fmt::format("default scene {} cannot be resolved among {} scenes",
                                           model.defaultScene, model.scenes.size()));
    }

    const tinygltf::Value* metadata = findExtension(model.extensions, EXT_FEATURE_METADATA);
    if (metadata == nullptr) {
        return;
    }
    if (metadata->Has("schemaUri")) {
        throw UnsupportedAsset("EXT_feature_metadata with schemaUri is not supported");
    }
    if (metadata->Has("featureTables")) {
        const tinygltf::Value& featureTables = metadata->Get("featureTables");
        if (featureTables.IsObject() && featureTables.Keys().size() > 1) {
            throw UnsupportedAsset(fmt::format("asset has {} feature tables, only one is supported",
                                               featureTables.Keys().size()));
        }
    }
}

}
