#pragma once

#include "property.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace I3dmPack::Core::Tile {

/**
 * Packed feature table: [JSON][spaces to 8][binary body][zeros to 8].
 * Both recorded lengths include their padding and are multiples of 8.
 */
class FeatureTableBuffer {
public:
    FeatureTableBuffer(std::vector<uint8_t> bytes, uint32_t jsonByteLength, uint32_t binaryByteLength)
        : bytes_(std::move(bytes)), jsonByteLength_(jsonByteLength), binaryByteLength_(binaryByteLength) {}

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    size_t size() const { return bytes_.size(); }

    uint32_t jsonByteLength() const { return jsonByteLength_; }
    uint32_t binaryByteLength() const { return binaryByteLength_; }

    const uint8_t* binary() const { return bytes_.data() + jsonByteLength_; }

    // Header text including its trailing space padding.
    std::string jsonText() const {
        return std::string(bytes_.begin(), bytes_.begin() + jsonByteLength_);
    }

private:
    std::vector<uint8_t> bytes_;
    uint32_t jsonByteLength_;
    uint32_t binaryByteLength_;
};

class FeatureTable {
public:
    /**
     * Pack properties in order. Each payload starts at a multiple of its
     * component width, counted from the start of the binary body.
     *
     * @throws PackingError on duplicate names or an empty required property
     */
    static FeatureTableBuffer pack(const std::vector<Property>& properties);

    /**
     * Same as pack(properties), with globals (a JSON object such as
     * {"INSTANCES_LENGTH": 3}) written into the header first.
     *
     * @throws PackingError when globals is not an object or one of its keys
     *         is also a property name
     */
    static FeatureTableBuffer pack(const std::vector<Property>& properties,
                                   const nlohmann::ordered_json& globals);

    /**
     * Bytes needed after byteLength to reach the next multiple of boundary.
     */
    static size_t padding(size_t byteLength, size_t boundary);

    /**
     * Parse a header of jsonByteLength bytes (padding included).
     *
     * @throws MalformedAsset when the header is not a JSON object
     */
    static nlohmann::ordered_json parseHeader(const uint8_t* data, size_t jsonByteLength);
};

}
