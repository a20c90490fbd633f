#define TINYGLTF_IMPLEMENTATION
#include "gltf_model.h"
#include "../tile_error.h"
#include "../../logging.h"
#include <algorithm>
#include <cstring>
#include <limits>
#include <sstream>
#include <fmt/format.h>

namespace I3dmPack::Core::Gltf {

namespace {

// Images only travel through the converter, keep their encoded bytes as is.
bool passThroughImage(tinygltf::Image* /*image*/, const int /*imageIndex*/,
                      std::string* /*err*/, std::string* /*warn*/,
                      int /*reqWidth*/, int /*reqHeight*/,
                      const unsigned char* /*bytes*/, int /*size*/,
                      void* /*userData*/) {
    return true;
}

void eraseName(std::vector<std::string>& names, const std::string& name) {
    names.erase(std::remove(names.begin(), names.end(), name), names.end());
}

}

ModelPtr loadGlb(const uint8_t* data, size_t length) {
    if (data == nullptr || length == 0) {
        throw MalformedAsset("empty glb payload");
    }

    // Tiles pad their glb with zeros; hand tinygltf the declared length only
    if (length >= 12) {
        uint32_t declared = 0;
        std::memcpy(&declared, data + 8, sizeof(declared));
        if (declared >= 12 && declared < length) {
            length = declared;
        }
    }
    if (length > std::numeric_limits<unsigned int>::max()) {
        throw UnsupportedAsset(fmt::format("glb of {} bytes is too large", length));
    }

    tinygltf::TinyGLTF loader;
    loader.SetImageLoader(passThroughImage, nullptr);

    auto model = std::make_shared<tinygltf::Model>();
    std::string err;
    std::string warn;
    bool ok = loader.LoadBinaryFromMemory(model.get(), &err, &warn, data,
                                          static_cast<unsigned int>(length));
    if (!warn.empty()) {
        LOG_W("glb load warning: %s", warn.c_str());
    }
    if (!ok) {
        throw MalformedAsset(fmt::format("failed to parse glb: {}", err));
    }
    return model;
}

std::string writeGlb(const tinygltf::Model& model) {
    tinygltf::TinyGLTF writer;
    std::stringstream ss;
    tinygltf::Model copy = model;
    if (!writer.WriteGltfSceneToStream(&copy, ss, false, true)) {
        throw MalformedAsset("failed to serialize glb");
    }
    return ss.str();
}

const tinygltf::Value* findExtension(const tinygltf::ExtensionMap& extensions,
                                     const std::string& name) {
    auto it = extensions.find(name);
    if (it == extensions.end() || !it->second.IsObject()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<int> findInstancedNodes(const tinygltf::Model& model) {
    std::vector<int> ids;
    for (size_t i = 0; i < model.nodes.size(); ++i) {
        if (findExtension(model.nodes[i].extensions, EXT_MESH_GPU_INSTANCING)) {
            ids.push_back(static_cast<int>(i));
        }
    }
    return ids;
}

void stripInstancing(tinygltf::Model& model, int nodeId) {
    if (nodeId < 0 || nodeId >= static_cast<int>(model.nodes.size())) {
        return;
    }
    model.nodes[nodeId].extensions.erase(EXT_MESH_GPU_INSTANCING);

    if (findInstancedNodes(model).empty()) {
        eraseName(model.extensionsUsed, EXT_MESH_GPU_INSTANCING);
        eraseName(model.extensionsRequired, EXT_MESH_GPU_INSTANCING);
    }
}

}
