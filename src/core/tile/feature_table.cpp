#include "feature_table.h"
#include "../tile_error.h"
#include "../../logging.h"
#include <cstring>
#include <limits>
#include <unordered_set>
#include <fmt/format.h>

namespace I3dmPack::Core::Tile {

namespace {

constexpr size_t TABLE_ALIGNMENT = 8;

struct Placement {
    const Property* property;
    size_t byteOffset;
};

}

size_t FeatureTable::padding(size_t byteLength, size_t boundary) {
    size_t remainder = byteLength % boundary;
    return remainder == 0 ? 0 : boundary - remainder;
}

FeatureTableBuffer FeatureTable::pack(const std::vector<Property>& properties) {
    return pack(properties, nlohmann::ordered_json::object());
}

FeatureTableBuffer FeatureTable::pack(const std::vector<Property>& properties,
                                      const nlohmann::ordered_json& globals) {
    if (!globals.is_object()) {
        throw PackingError("global semantics must be a JSON object");
    }

    nlohmann::ordered_json header = globals;
    std::unordered_set<std::string> names;
    for (const auto& item : globals.items()) {
        names.insert(item.key());
    }

    // Binary body layout, offsets relative to the body start
    std::vector<Placement> placements;
    placements.reserve(properties.size());
    size_t byteOffset = 0;
    for (const auto& property : properties) {
        if (!names.insert(property.name).second) {
            throw PackingError(fmt::format("duplicate property name '{}'", property.name));
        }
        if (property.values.empty()) {
            if (property.optional) {
                LOG_D("skip empty optional property %s", property.name.c_str());
                continue;
            }
            throw PackingError(fmt::format("property '{}' has no values", property.name));
        }

        Gltf::ComponentType componentType = property.values.componentType();
        byteOffset += padding(byteOffset, Gltf::componentByteWidth(componentType));

        nlohmann::ordered_json entry;
        entry["byteOffset"] = byteOffset;
        if (property.hasComponentType) {
            entry["componentType"] = Gltf::componentTypeTag(componentType);
        }
        if (!property.elementType.empty()) {
            entry["type"] = property.elementType;
        }
        header[property.name] = std::move(entry);

        placements.push_back({&property, byteOffset});
        byteOffset += property.values.byteLength();
    }

    size_t binaryByteLength = byteOffset;
    size_t binaryPadding = padding(binaryByteLength, TABLE_ALIGNMENT);

    // ASCII only, non-ASCII names are escaped
    std::string jsonString = header.dump(-1, ' ', true);
    size_t jsonPadding = padding(jsonString.size(), TABLE_ALIGNMENT);

    size_t jsonTotal = jsonString.size() + jsonPadding;
    size_t binaryTotal = binaryByteLength + binaryPadding;
    if (jsonTotal > std::numeric_limits<uint32_t>::max() ||
        binaryTotal > std::numeric_limits<uint32_t>::max()) {
        throw PackingError("feature table exceeds 4 GiB");
    }

    // Single allocation; alignment gaps and binary padding stay zero
    std::vector<uint8_t> bytes(jsonTotal + binaryTotal, 0);
    std::memcpy(bytes.data(), jsonString.data(), jsonString.size());
    std::memset(bytes.data() + jsonString.size(), ' ', jsonPadding);

    uint8_t* body = bytes.data() + jsonTotal;
    for (const auto& placement : placements) {
        const Gltf::TypedView& values = placement.property->values;
        std::memcpy(body + placement.byteOffset, values.data(), values.byteLength());
    }

    return FeatureTableBuffer(std::move(bytes),
                              static_cast<uint32_t>(jsonTotal),
                              static_cast<uint32_t>(binaryTotal));
}

nlohmann::ordered_json FeatureTable::parseHeader(const uint8_t* data, size_t jsonByteLength) {
    if (jsonByteLength == 0) {
        return nlohmann::ordered_json::object();
    }
    auto header = nlohmann::ordered_json::parse(data, data + jsonByteLength, nullptr, false);
    if (header.is_discarded() || !header.is_object()) {
        throw MalformedAsset("table header is not a JSON object");
    }
    return header;
}

}
