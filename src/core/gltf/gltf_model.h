#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// tinygltf is built with TINYGLTF_NO_INCLUDE_JSON; nlohmann must come first.
#include <nlohmann/json.hpp>
#include <tiny_gltf.h>

namespace I3dmPack::Core::Gltf {

using ModelPtr = std::shared_ptr<const tinygltf::Model>;

inline constexpr const char* EXT_MESH_GPU_INSTANCING = "EXT_mesh_gpu_instancing";
inline constexpr const char* EXT_FEATURE_METADATA = "EXT_feature_metadata";

/**
 * Parse a binary glTF held in memory.
 * Embedded images are kept as raw buffer views, never decoded.
 *
 * @throws MalformedAsset when tinygltf rejects the bytes
 */
ModelPtr loadGlb(const uint8_t* data, size_t length);

/**
 * Serialize a model as binary glTF.
 *
 * @throws MalformedAsset when tinygltf fails to write the model
 */
std::string writeGlb(const tinygltf::Model& model);

/**
 * Look up an extension object by name, nullptr when absent or not an object.
 */
const tinygltf::Value* findExtension(const tinygltf::ExtensionMap& extensions,
                                     const std::string& name);

/**
 * Ids of nodes carrying EXT_mesh_gpu_instancing, ascending.
 */
std::vector<int> findInstancedNodes(const tinygltf::Model& model);

/**
 * Drop EXT_mesh_gpu_instancing from a node, and from extensionsUsed /
 * extensionsRequired once no node uses it anymore.
 */
void stripInstancing(tinygltf::Model& model, int nodeId);

}
