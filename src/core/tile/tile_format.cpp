#include "tile_format.h"
#include "../tile_error.h"
#include <cstring>
#include <limits>
#include <fmt/format.h>

namespace I3dmPack::Core::Tile {

namespace {

template<class T>
void put_val(std::vector<uint8_t>& buf, const T& val) {
    buf.insert(buf.end(), (const uint8_t*)&val, (const uint8_t*)&val + sizeof(T));
}

void put_bytes(std::vector<uint8_t>& buf, const uint8_t* data, size_t size) {
    buf.insert(buf.end(), data, data + size);
}

void put_padding(std::vector<uint8_t>& buf, size_t size) {
    buf.insert(buf.end(), size, 0);
}

uint32_t checkedLength(size_t length) {
    if (length > std::numeric_limits<uint32_t>::max()) {
        throw PackingError(fmt::format("tile of {} bytes exceeds 4 GiB", length));
    }
    return static_cast<uint32_t>(length);
}

template<class T>
T readHeader(const uint8_t* data, size_t length, uint32_t magic, const char* name) {
    if (data == nullptr || length < sizeof(T)) {
        throw MalformedAsset(fmt::format("{} tile shorter than its header", name));
    }
    T header;
    std::memcpy(&header, data, sizeof(T));
    if (header.magic != magic) {
        throw MalformedAsset(fmt::format("not a {} tile (magic 0x{:08X})", name, header.magic));
    }
    if (header.byteLength > length || header.byteLength < sizeof(T)) {
        throw MalformedAsset(fmt::format("{} byteLength {} does not match {} available bytes",
                                         name, header.byteLength, length));
    }
    return header;
}

}

std::vector<uint8_t> writeI3dm(const FeatureTableBuffer& featureTable,
                               const FeatureTableBuffer* batchTable,
                               const std::string& glb) {
    size_t glbPadding = FeatureTable::padding(glb.size(), 8);
    size_t batchSize = batchTable ? batchTable->size() : 0;

    I3dmHeader header;
    header.magic = I3DM_MAGIC;
    header.version = TILE_VERSION;
    header.byteLength = checkedLength(sizeof(I3dmHeader) + featureTable.size() + batchSize + glb.size() + glbPadding);
    header.featureTableJSONByteLength = featureTable.jsonByteLength();
    header.featureTableBinaryByteLength = featureTable.binaryByteLength();
    header.batchTableJSONByteLength = batchTable ? batchTable->jsonByteLength() : 0;
    header.batchTableBinaryByteLength = batchTable ? batchTable->binaryByteLength() : 0;
    header.gltfFormat = 1;

    std::vector<uint8_t> tile;
    tile.reserve(header.byteLength);
    put_val(tile, header);
    put_bytes(tile, featureTable.bytes().data(), featureTable.size());
    if (batchTable) {
        put_bytes(tile, batchTable->bytes().data(), batchTable->size());
    }
    put_bytes(tile, reinterpret_cast<const uint8_t*>(glb.data()), glb.size());
    put_padding(tile, glbPadding);
    return tile;
}

std::vector<uint8_t> writeB3dm(const FeatureTableBuffer& featureTable,
                               const FeatureTableBuffer* batchTable,
                               const std::string& glb) {
    size_t glbPadding = FeatureTable::padding(glb.size(), 8);
    size_t batchSize = batchTable ? batchTable->size() : 0;

    B3dmHeader header;
    header.magic = B3DM_MAGIC;
    header.version = TILE_VERSION;
    header.byteLength = checkedLength(sizeof(B3dmHeader) + featureTable.size() + batchSize + glb.size() + glbPadding);
    header.featureTableJSONByteLength = featureTable.jsonByteLength();
    header.featureTableBinaryByteLength = featureTable.binaryByteLength();
    header.batchTableJSONByteLength = batchTable ? batchTable->jsonByteLength() : 0;
    header.batchTableBinaryByteLength = batchTable ? batchTable->binaryByteLength() : 0;

    std::vector<uint8_t> tile;
    tile.reserve(header.byteLength);
    put_val(tile, header);
    put_bytes(tile, featureTable.bytes().data(), featureTable.size());
    if (batchTable) {
        put_bytes(tile, batchTable->bytes().data(), batchTable->size());
    }
    put_bytes(tile, reinterpret_cast<const uint8_t*>(glb.data()), glb.size());
    put_padding(tile, glbPadding);
    return tile;
}

std::vector<uint8_t> writeCmpt(const std::vector<std::vector<uint8_t>>& tiles) {
    size_t byteLength = sizeof(CmptHeader);
    for (const auto& inner : tiles) {
        byteLength += inner.size() + FeatureTable::padding(inner.size(), 8);
    }

    CmptHeader header;
    header.magic = CMPT_MAGIC;
    header.version = TILE_VERSION;
    header.byteLength = checkedLength(byteLength);
    header.tilesLength = checkedLength(tiles.size());

    std::vector<uint8_t> tile;
    tile.reserve(byteLength);
    put_val(tile, header);
    for (const auto& inner : tiles) {
        size_t padding = FeatureTable::padding(inner.size(), 8);
        put_bytes(tile, inner.data(), inner.size());
        put_padding(tile, padding);
        // Inner byteLength must cover the padding as well
        if (padding > 0 && inner.size() >= 12) {
            uint32_t innerLength = static_cast<uint32_t>(inner.size() + padding);
            std::memcpy(tile.data() + tile.size() - inner.size() - padding + 8, &innerLength, sizeof(innerLength));
        }
    }
    return tile;
}

I3dmParts parseI3dm(const uint8_t* data, size_t length) {
    I3dmParts parts;
    parts.header = readHeader<I3dmHeader>(data, length, I3DM_MAGIC, "i3dm");
    const I3dmHeader& header = parts.header;

    uint64_t tablesEnd = uint64_t(sizeof(I3dmHeader)) +
                         header.featureTableJSONByteLength + header.featureTableBinaryByteLength +
                         header.batchTableJSONByteLength + header.batchTableBinaryByteLength;
    if (tablesEnd > header.byteLength) {
        throw MalformedAsset(fmt::format("i3dm tables end at {}, past byteLength {}",
                                         tablesEnd, header.byteLength));
    }

    const uint8_t* cursor = data + sizeof(I3dmHeader);
    parts.featureTableJson = FeatureTable::parseHeader(cursor, header.featureTableJSONByteLength);
    cursor += header.featureTableJSONByteLength;
    parts.featureTableBinary.assign(cursor, cursor + header.featureTableBinaryByteLength);
    cursor += header.featureTableBinaryByteLength;
    parts.batchTableJson = FeatureTable::parseHeader(cursor, header.batchTableJSONByteLength);
    cursor += header.batchTableJSONByteLength;
    parts.batchTableBinary.assign(cursor, cursor + header.batchTableBinaryByteLength);
    cursor += header.batchTableBinaryByteLength;
    parts.glb.assign(reinterpret_cast<const char*>(cursor), reinterpret_cast<const char*>(data + header.byteLength));
    return parts;
}

std::vector<std::vector<uint8_t>> splitCmpt(const uint8_t* data, size_t length) {
    CmptHeader header = readHeader<CmptHeader>(data, length, CMPT_MAGIC, "cmpt");

    std::vector<std::vector<uint8_t>> tiles;
    size_t offset = sizeof(CmptHeader);
    for (uint32_t i = 0; i < header.tilesLength; ++i) {
        if (offset + 12 > header.byteLength) {
            throw MalformedAsset(fmt::format("cmpt inner tile {} starts past byteLength", i));
        }
        uint32_t innerLength;
        std::memcpy(&innerLength, data + offset + 8, sizeof(innerLength));
        if (innerLength < 12 || offset + innerLength > header.byteLength) {
            throw MalformedAsset(fmt::format("cmpt inner tile {} has invalid byteLength {}", i, innerLength));
        }
        tiles.emplace_back(data + offset, data + offset + innerLength);
        offset += innerLength;
    }
    return tiles;
}

}
