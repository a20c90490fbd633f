#include "batch_table.h"
#include "../gltf/accessor_decoder.h"
#include "../tile_error.h"
#include "../../logging.h"
#include <string>
#include <vector>
#include <fmt/format.h>

namespace I3dmPack::Core::Tile {

using Gltf::BufferSlice;
using Gltf::ComponentType;
using Gltf::TypedView;
using nlohmann::ordered_json;

namespace {

std::string getString(const tinygltf::Value& object, const char* key, const std::string& fallback = "") {
    if (!object.Has(key) || !object.Get(key).IsString()) {
        return fallback;
    }
    return object.Get(key).Get<std::string>();
}

int getInt(const tinygltf::Value& object, const char* key, int fallback) {
    if (!object.Has(key) || !object.Get(key).IsNumber()) {
        return fallback;
    }
    return object.Get(key).GetNumberAsInt();
}

const tinygltf::Value& getObject(const tinygltf::Value& object, const char* key) {
    static const tinygltf::Value empty{tinygltf::Value::Object()};
    if (!object.Has(key) || !object.Get(key).IsObject()) {
        return empty;
    }
    return object.Get(key);
}

ordered_json toJson(const tinygltf::Value& value) {
    if (value.IsBool()) return value.Get<bool>();
    if (value.IsInt()) return value.Get<int>();
    if (value.IsNumber()) return value.GetNumberAsDouble();
    if (value.IsString()) return value.Get<std::string>();
    if (value.IsArray()) {
        ordered_json array = ordered_json::array();
        for (size_t i = 0; i < value.ArrayLen(); ++i) {
            array.push_back(toJson(value.Get(static_cast<int>(i))));
        }
        return array;
    }
    if (value.IsObject()) {
        ordered_json object = ordered_json::object();
        for (const auto& key : value.Keys()) {
            object[key] = toJson(value.Get(key));
        }
        return object;
    }
    return nullptr;
}

ordered_json componentToJson(const TypedView& view, size_t index) {
    switch (view.componentType()) {
        case ComponentType::INT8: return view.get<int8_t>(index);
        case ComponentType::UINT8: return view.get<uint8_t>(index);
        case ComponentType::INT16: return view.get<int16_t>(index);
        case ComponentType::UINT16: return view.get<uint16_t>(index);
        case ComponentType::INT32: return view.get<int32_t>(index);
        case ComponentType::UINT32: return view.get<uint32_t>(index);
        case ComponentType::FLOAT32: return view.get<float>(index);
        case ComponentType::FLOAT64: return view.get<double>(index);
    }
    return nullptr;
}

// elements x components values of type at the start of slice
TypedView readColumn(const BufferSlice& slice, ComponentType type, size_t elements, size_t components,
                     const std::string& propertyId) {
    size_t elementSize = components * Gltf::componentByteWidth(type);
    if (elementSize == 0 || elements > slice.byteLength / elementSize) {
        throw MalformedAccessor(fmt::format("property '{}' needs {} x {} bytes, bufferView has {}",
                                            propertyId, elements, elementSize, slice.byteLength));
    }
    return TypedView(slice.owner, slice.byteOffset, elements * components, type);
}

ordered_json readStrings(const Gltf::ModelPtr& model, const tinygltf::Value& tableProperty,
                         size_t count, const std::string& propertyId) {
    std::string offsetTypeName = getString(tableProperty, "offsetType", "UINT32");
    auto offsetType = Gltf::componentTypeFromMetadataName(offsetTypeName);
    if (!offsetType || !Gltf::componentTypeInfo(*offsetType).isInteger) {
        throw UnsupportedAsset(fmt::format("property '{}' uses offsetType {}", propertyId, offsetTypeName));
    }
    int offsetBufferView = getInt(tableProperty, "stringOffsetBufferView", -1);
    BufferSlice bytes = Gltf::AccessorDecoder::bufferViewSlice(model, getInt(tableProperty, "bufferView", -1));
    TypedView offsets = readColumn(Gltf::AccessorDecoder::bufferViewSlice(model, offsetBufferView),
                                   *offsetType, count + 1, 1, propertyId);

    const char* base = reinterpret_cast<const char*>(bytes.owner->data() + bytes.byteOffset);
    ordered_json values = ordered_json::array();
    for (size_t i = 0; i < count; ++i) {
        double begin = offsets.getAsDouble(i);
        double end = offsets.getAsDouble(i + 1);
        if (begin < 0.0 || end < begin || end > static_cast<double>(bytes.byteLength)) {
            throw MalformedAccessor(fmt::format("property '{}' string {} spans [{}, {})",
                                                propertyId, i, begin, end));
        }
        values.push_back(std::string(base + static_cast<size_t>(begin), base + static_cast<size_t>(end)));
    }
    return values;
}

ordered_json readBooleans(const BufferSlice& bytes, size_t count, const std::string& propertyId) {
    if ((count + 7) / 8 > bytes.byteLength) {
        throw MalformedAccessor(fmt::format("property '{}' needs {} bytes of booleans, bufferView has {}",
                                            propertyId, (count + 7) / 8, bytes.byteLength));
    }
    const uint8_t* bits = bytes.owner->data() + bytes.byteOffset;
    ordered_json values = ordered_json::array();
    for (size_t i = 0; i < count; ++i) {
        values.push_back(((bits[i / 8] >> (i % 8)) & 1) == 1);
    }
    return values;
}

ordered_json readEnums(const BufferSlice& bytes, const tinygltf::Value& schema,
                       const tinygltf::Value& classProperty, size_t count, const std::string& propertyId) {
    std::string enumType = getString(classProperty, "enumType");
    const tinygltf::Value& enumDef = getObject(getObject(schema, "enums"), enumType.c_str());
    std::string valueTypeName = getString(enumDef, "valueType", "UINT16");
    auto valueType = Gltf::componentTypeFromMetadataName(valueTypeName);
    if (!valueType || !Gltf::componentTypeInfo(*valueType).isInteger) {
        throw UnsupportedAsset(fmt::format("enum {} uses valueType {}", enumType, valueTypeName));
    }

    std::vector<std::pair<double, std::string>> names;
    if (enumDef.Has("values") && enumDef.Get("values").IsArray()) {
        const tinygltf::Value& list = enumDef.Get("values");
        for (size_t i = 0; i < list.ArrayLen(); ++i) {
            const tinygltf::Value& item = list.Get(static_cast<int>(i));
            if (item.IsObject() && item.Has("value") && item.Get("value").IsNumber()) {
                names.emplace_back(item.Get("value").GetNumberAsDouble(), getString(item, "name"));
            }
        }
    }

    TypedView view = readColumn(bytes, *valueType, count, 1, propertyId);
    ordered_json values = ordered_json::array();
    for (size_t i = 0; i < count; ++i) {
        double value = view.getAsDouble(i);
        ordered_json name = nullptr;
        for (const auto& entry : names) {
            if (entry.first == value) {
                name = entry.second;
                break;
            }
        }
        values.push_back(name);
    }
    return values;
}

ordered_json readNumericArrays(const TypedView& view, size_t count, size_t componentCount) {
    ordered_json values = ordered_json::array();
    for (size_t i = 0; i < count; ++i) {
        ordered_json element = ordered_json::array();
        for (size_t c = 0; c < componentCount; ++c) {
            element.push_back(componentToJson(view, i * componentCount + c));
        }
        values.push_back(std::move(element));
    }
    return values;
}

const char* vectorTypeName(size_t componentCount) {
    switch (componentCount) {
        case 2: return "VEC2";
        case 3: return "VEC3";
        case 4: return "VEC4";
        default: return nullptr;
    }
}

}

std::optional<BatchTable> BatchTableBuilder::build(const Gltf::ModelPtr& model) {
    const tinygltf::Value* extension = Gltf::findExtension(model->extensions, Gltf::EXT_FEATURE_METADATA);
    if (extension == nullptr) {
        return std::nullopt;
    }
    const tinygltf::Value& featureTables = getObject(*extension, "featureTables");
    std::vector<std::string> tableIds = featureTables.Keys();
    if (tableIds.empty()) {
        return std::nullopt;
    }

    const tinygltf::Value& featureTable = featureTables.Get(tableIds.front());
    std::string className = getString(featureTable, "class");
    if (className.empty()) {
        return std::nullopt;
    }

    const tinygltf::Value& schema = getObject(*extension, "schema");
    const tinygltf::Value& classes = getObject(schema, "classes");
    if (!classes.Has(className)) {
        throw MalformedAsset(fmt::format("feature table '{}' references unknown class '{}'",
                                         tableIds.front(), className));
    }
    const tinygltf::Value& classProperties = getObject(classes.Get(className), "properties");
    const tinygltf::Value& tableProperties = getObject(featureTable, "properties");

    int countValue = getInt(featureTable, "count", -1);
    if (countValue < 0) {
        throw MalformedAsset(fmt::format("feature table '{}' has no valid count", tableIds.front()));
    }
    size_t count = static_cast<size_t>(countValue);

    ordered_json jsonProperties = ordered_json::object();
    std::vector<Property> binaryProperties;

    for (const auto& propertyId : classProperties.Keys()) {
        const tinygltf::Value& classProperty = classProperties.Get(propertyId);
        std::string type = getString(classProperty, "type");

        if (!tableProperties.Has(propertyId)) {
            if (classProperty.Has("default")) {
                jsonProperties[propertyId] = ordered_json::array();
                ordered_json value = toJson(classProperty.Get("default"));
                for (size_t i = 0; i < count; ++i) {
                    jsonProperties[propertyId].push_back(value);
                }
            } else {
                LOG_W("batch table: property %s has no values and no default, skipped", propertyId.c_str());
            }
            continue;
        }

        const tinygltf::Value& tableProperty = tableProperties.Get(propertyId);
        int bufferView = getInt(tableProperty, "bufferView", -1);
        if (bufferView < 0) {
            LOG_W("batch table: property %s has no bufferView, skipped", propertyId.c_str());
            continue;
        }
        BufferSlice bytes = Gltf::AccessorDecoder::bufferViewSlice(model, bufferView);

        if (type == "STRING") {
            jsonProperties[propertyId] = readStrings(model, tableProperty, count, propertyId);
            continue;
        }
        if (type == "BOOLEAN") {
            jsonProperties[propertyId] = readBooleans(bytes, count, propertyId);
            continue;
        }
        if (type == "ENUM") {
            jsonProperties[propertyId] = readEnums(bytes, schema, classProperty, count, propertyId);
            continue;
        }

        size_t componentCount = 1;
        std::string componentTypeName = type;
        if (type == "ARRAY") {
            componentTypeName = getString(classProperty, "componentType");
            int fixedCount = getInt(classProperty, "componentCount", -1);
            if (fixedCount <= 0) {
                LOG_W("batch table: variable-length array %s skipped", propertyId.c_str());
                continue;
            }
            componentCount = static_cast<size_t>(fixedCount);
        }

        auto componentType = Gltf::componentTypeFromMetadataName(componentTypeName);
        if (!componentType) {
            LOG_W("batch table: property %s of type %s skipped", propertyId.c_str(), componentTypeName.c_str());
            continue;
        }

        TypedView column = readColumn(bytes, *componentType, count, componentCount, propertyId);
        const char* elementType = type == "ARRAY" ? vectorTypeName(componentCount) : "SCALAR";
        if (elementType == nullptr) {
            jsonProperties[propertyId] = readNumericArrays(column, count, componentCount);
            continue;
        }

        Property property;
        property.name = propertyId;
        property.values = column;
        property.hasComponentType = true;
        property.optional = true;  // count 0 tables carry no bytes
        property.elementType = elementType;
        binaryProperties.push_back(std::move(property));
    }

    LOG_D("batch table: %zu features, %zu json properties, %zu binary properties",
          count, jsonProperties.size(), binaryProperties.size());
    return BatchTable{count, FeatureTable::pack(binaryProperties, jsonProperties)};
}

}
