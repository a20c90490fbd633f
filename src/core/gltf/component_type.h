#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace I3dmPack::Core::Gltf {

enum class ComponentType {
    INT8,
    UINT8,
    INT16,
    UINT16,
    INT32,
    UINT32,
    FLOAT32,
    FLOAT64
};

enum class ElementType {
    SCALAR,
    VEC2,
    VEC3,
    VEC4,
    MAT2,
    MAT3,
    MAT4
};

struct ComponentTypeInfo {
    ComponentType type;
    uint32_t byteWidth;
    const char* tag;            // Feature/batch table wire tag
    const char* metadataName;   // EXT_feature_metadata type name
    int gltfCode;               // glTF accessor componentType
    bool isInteger;
    bool isSigned;
    double maxValue;            // Normalization divisor for integer kinds
};

constexpr size_t COMPONENT_TYPE_COUNT = 8;

inline constexpr std::array<ComponentTypeInfo, COMPONENT_TYPE_COUNT> COMPONENT_TYPES = {{
    {ComponentType::INT8,    1, "BYTE",           "INT8",    5120, true,  true,  127.0},
    {ComponentType::UINT8,   1, "UNSIGNED_BYTE",  "UINT8",   5121, true,  false, 255.0},
    {ComponentType::INT16,   2, "SHORT",          "INT16",   5122, true,  true,  32767.0},
    {ComponentType::UINT16,  2, "UNSIGNED_SHORT", "UINT16",  5123, true,  false, 65535.0},
    {ComponentType::INT32,   4, "INT",            "INT32",   5124, true,  true,  2147483647.0},
    {ComponentType::UINT32,  4, "UNSIGNED_INT",   "UINT32",  5125, true,  false, 4294967295.0},
    {ComponentType::FLOAT32, 4, "FLOAT",          "FLOAT32", 5126, false, true,  1.0},
    {ComponentType::FLOAT64, 8, "DOUBLE",         "FLOAT64", 5130, false, true,  1.0},
}};

namespace detail {
constexpr bool registryIsComplete() {
    for (size_t i = 0; i < COMPONENT_TYPES.size(); ++i) {
        if (static_cast<size_t>(COMPONENT_TYPES[i].type) != i) return false;
        if (COMPONENT_TYPES[i].byteWidth == 0) return false;
    }
    return static_cast<size_t>(ComponentType::FLOAT64) + 1 == COMPONENT_TYPE_COUNT;
}
}

static_assert(detail::registryIsComplete(),
              "COMPONENT_TYPES must list every ComponentType in declaration order");

constexpr const ComponentTypeInfo& componentTypeInfo(ComponentType type) {
    return COMPONENT_TYPES[static_cast<size_t>(type)];
}

constexpr uint32_t componentByteWidth(ComponentType type) {
    return componentTypeInfo(type).byteWidth;
}

constexpr const char* componentTypeTag(ComponentType type) {
    return componentTypeInfo(type).tag;
}

constexpr int componentTypeToGltf(ComponentType type) {
    return componentTypeInfo(type).gltfCode;
}

constexpr bool isNormalizable(ComponentType type) {
    return componentTypeInfo(type).isInteger;
}

std::optional<ComponentType> componentTypeFromGltf(int code);
std::optional<ComponentType> componentTypeFromTag(const std::string& tag);
std::optional<ComponentType> componentTypeFromMetadataName(const std::string& name);

/**
 * Map a normalized integer to [-1, 1] (signed) or [0, 1] (unsigned).
 * Float kinds are returned unchanged.
 */
double normalizeComponent(double value, ComponentType type);

uint32_t elementComponentCount(ElementType type);
const char* elementTypeName(ElementType type);
std::optional<ElementType> elementTypeFromName(const std::string& name);

/**
 * Map a tinygltf TINYGLTF_TYPE_* code to an element type.
 */
std::optional<ElementType> elementTypeFromGltf(int code);

/**
 * Compile-time mapping from a C++ arithmetic type to its component type.
 */
template <class T> struct ComponentTypeOf;
template <> struct ComponentTypeOf<int8_t>   { static constexpr ComponentType value = ComponentType::INT8; };
template <> struct ComponentTypeOf<uint8_t>  { static constexpr ComponentType value = ComponentType::UINT8; };
template <> struct ComponentTypeOf<int16_t>  { static constexpr ComponentType value = ComponentType::INT16; };
template <> struct ComponentTypeOf<uint16_t> { static constexpr ComponentType value = ComponentType::UINT16; };
template <> struct ComponentTypeOf<int32_t>  { static constexpr ComponentType value = ComponentType::INT32; };
template <> struct ComponentTypeOf<uint32_t> { static constexpr ComponentType value = ComponentType::UINT32; };
template <> struct ComponentTypeOf<float>    { static constexpr ComponentType value = ComponentType::FLOAT32; };
template <> struct ComponentTypeOf<double>   { static constexpr ComponentType value = ComponentType::FLOAT64; };

}
