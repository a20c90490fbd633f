#pragma once

#include "core/gltf/component_type.h"
#include "core/gltf/gltf_model.h"
#include "core/gltf/typed_view.h"
#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace I3dmPack::Test {

/**
 * Compare two vectors with tolerance
 */
inline bool vec3Near(const glm::dvec3& a, const glm::dvec3& b, double tolerance = 1e-6) {
    return std::abs(a.x - b.x) < tolerance &&
           std::abs(a.y - b.y) < tolerance &&
           std::abs(a.z - b.z) < tolerance;
}

/**
 * Element index of a FLOAT32 VEC3 view as a vector
 */
inline glm::dvec3 vec3At(const Core::Gltf::TypedView& view, size_t index) {
    return glm::dvec3(view.get<float>(index * 3),
                      view.get<float>(index * 3 + 1),
                      view.get<float>(index * 3 + 2));
}

/**
 * Check if basis vectors are orthonormal
 */
inline bool isOrthonormal(const glm::dvec3& x, const glm::dvec3& y, double tolerance = 1e-6) {
    if (std::abs(glm::dot(x, y)) > tolerance) return false;
    if (std::abs(glm::length(x) - 1.0) > tolerance) return false;
    if (std::abs(glm::length(y) - 1.0) > tolerance) return false;
    return true;
}

/**
 * Read a T stored at byteOffset in raw bytes
 */
template <class T>
T readAt(const uint8_t* bytes, size_t byteOffset) {
    T value;
    std::memcpy(&value, bytes + byteOffset, sizeof(T));
    return value;
}

/**
 * Builds small single-buffer glTF models in memory.
 */
class ModelBuilder {
public:
    ModelBuilder() {
        model.asset.version = "2.0";
        model.buffers.emplace_back();
        model.scenes.emplace_back();
        model.defaultScene = 0;
    }

    int addBufferView(const std::vector<uint8_t>& bytes) {
        auto& data = model.buffers[0].data;
        while (data.size() % 8 != 0) {
            data.push_back(0);
        }
        tinygltf::BufferView bufferView;
        bufferView.buffer = 0;
        bufferView.byteOffset = data.size();
        bufferView.byteLength = bytes.size();
        data.insert(data.end(), bytes.begin(), bytes.end());
        model.bufferViews.push_back(bufferView);
        return static_cast<int>(model.bufferViews.size()) - 1;
    }

    template <class T>
    int addBufferView(const std::vector<T>& values) {
        std::vector<uint8_t> bytes(values.size() * sizeof(T));
        if (!values.empty()) {
            std::memcpy(bytes.data(), values.data(), bytes.size());
        }
        return addBufferView(bytes);
    }

    /**
     * Add an accessor over values; type is a TINYGLTF_TYPE_* code
     */
    template <class T>
    int addAccessor(const std::vector<T>& values, int type) {
        auto elementType = Core::Gltf::elementTypeFromGltf(type);
        size_t components = elementType ? Core::Gltf::elementComponentCount(*elementType) : 1;

        tinygltf::Accessor accessor;
        accessor.bufferView = addBufferView(values);
        accessor.byteOffset = 0;
        accessor.componentType = Core::Gltf::componentTypeToGltf(Core::Gltf::ComponentTypeOf<T>::value);
        accessor.type = type;
        accessor.count = values.size() / components;
        model.accessors.push_back(accessor);
        return static_cast<int>(model.accessors.size()) - 1;
    }

    int addNode(const std::vector<int>& children = {}) {
        tinygltf::Node node;
        node.children = children;
        model.nodes.push_back(node);
        return static_cast<int>(model.nodes.size()) - 1;
    }

    void addRoot(int nodeId) {
        model.scenes[0].nodes.push_back(nodeId);
    }

    void setInstancing(int nodeId, const std::map<std::string, int>& attributes) {
        tinygltf::Value::Object attributeObject;
        for (const auto& [semantic, accessorId] : attributes) {
            attributeObject[semantic] = tinygltf::Value(accessorId);
        }
        tinygltf::Value::Object extension;
        extension["attributes"] = tinygltf::Value(attributeObject);
        model.nodes[nodeId].extensions[Core::Gltf::EXT_MESH_GPU_INSTANCING] = tinygltf::Value(extension);

        auto& used = model.extensionsUsed;
        if (std::find(used.begin(), used.end(), Core::Gltf::EXT_MESH_GPU_INSTANCING) == used.end()) {
            used.push_back(Core::Gltf::EXT_MESH_GPU_INSTANCING);
        }
    }

    Core::Gltf::ModelPtr build() const {
        return std::make_shared<const tinygltf::Model>(model);
    }

    tinygltf::Model model;
};

}
