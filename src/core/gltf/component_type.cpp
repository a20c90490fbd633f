#include "component_type.h"
#include <algorithm>
#include "gltf_model.h"

namespace I3dmPack::Core::Gltf {

std::optional<ComponentType> componentTypeFromGltf(int code) {
    for (const auto& info : COMPONENT_TYPES) {
        if (info.gltfCode == code) return info.type;
    }
    return std::nullopt;
}

std::optional<ComponentType> componentTypeFromTag(const std::string& tag) {
    for (const auto& info : COMPONENT_TYPES) {
        if (tag == info.tag) return info.type;
    }
    return std::nullopt;
}

std::optional<ComponentType> componentTypeFromMetadataName(const std::string& name) {
    for (const auto& info : COMPONENT_TYPES) {
        if (name == info.metadataName) return info.type;
    }
    return std::nullopt;
}

double normalizeComponent(double value, ComponentType type) {
    const auto& info = componentTypeInfo(type);
    if (!info.isInteger) {
        return value;
    }
    if (info.isSigned) {
        return std::max(value / info.maxValue, -1.0);
    }
    return value / info.maxValue;
}

uint32_t elementComponentCount(ElementType type) {
    switch (type) {
        case ElementType::SCALAR: return 1;
        case ElementType::VEC2: return 2;
        case ElementType::VEC3: return 3;
        case ElementType::VEC4: return 4;
        case ElementType::MAT2: return 4;
        case ElementType::MAT3: return 9;
        case ElementType::MAT4: return 16;
    }
    return 0;
}

const char* elementTypeName(ElementType type) {
    switch (type) {
        case ElementType::SCALAR: return "SCALAR";
        case ElementType::VEC2: return "VEC2";
        case ElementType::VEC3: return "VEC3";
        case ElementType::VEC4: return "VEC4";
        case ElementType::MAT2: return "MAT2";
        case ElementType::MAT3: return "MAT3";
        case ElementType::MAT4: return "MAT4";
    }
    return "";
}

std::optional<ElementType> elementTypeFromName(const std::string& name) {
    if (name == "SCALAR") return ElementType::SCALAR;
    if (name == "VEC2") return ElementType::VEC2;
    if (name == "VEC3") return ElementType::VEC3;
    if (name == "VEC4") return ElementType::VEC4;
    if (name == "MAT2") return ElementType::MAT2;
    if (name == "MAT3") return ElementType::MAT3;
    if (name == "MAT4") return ElementType::MAT4;
    return std::nullopt;
}

std::optional<ElementType> elementTypeFromGltf(int code) {
    switch (code) {
        case TINYGLTF_TYPE_SCALAR: return ElementType::SCALAR;
        case TINYGLTF_TYPE_VEC2: return ElementType::VEC2;
        case TINYGLTF_TYPE_VEC3: return ElementType::VEC3;
        case TINYGLTF_TYPE_VEC4: return ElementType::VEC4;
        case TINYGLTF_TYPE_MAT2: return ElementType::MAT2;
        case TINYGLTF_TYPE_MAT3: return ElementType::MAT3;
        case TINYGLTF_TYPE_MAT4: return ElementType::MAT4;
        default: return std::nullopt;
    }
}

}
