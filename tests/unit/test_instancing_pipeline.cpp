#include <gtest/gtest.h>
#include "instancing_pipeline.h"
#include "core/tile/tile_format.h"
#include "core/tile_error.h"
#include "../utils/test_helpers.h"

using namespace I3dmPack;
using namespace I3dmPack::Core;
using namespace I3dmPack::Core::Gltf;
using namespace I3dmPack::Test;

class InstancingPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        translation = builder.addAccessor(std::vector<float>{0, 0, 0, 1, 0, 0, 2, 0, 0}, TINYGLTF_TYPE_VEC3);
        rotation = builder.addAccessor(std::vector<float>{0, 0, 0, 1, 0, 0, 0, 1, 0, 0, 0, 1}, TINYGLTF_TYPE_VEC4);
        scale = builder.addAccessor(std::vector<float>{1, 1, 1, 1, 1, 1, 1, 1, 1}, TINYGLTF_TYPE_VEC3);
        featureIds = builder.addAccessor(std::vector<uint8_t>{0, 1, 2}, TINYGLTF_TYPE_SCALAR);

        instanced = builder.addNode();
        int parent = builder.addNode({instanced});
        other = builder.addNode();
        builder.addRoot(parent);
        builder.addRoot(other);
    }
    void TearDown() override {}

    void instanceAll(int nodeId) {
        builder.setInstancing(nodeId, {{"TRANSLATION", translation}, {"ROTATION", rotation},
                                       {"SCALE", scale}, {"_FEATURE_ID_0", featureIds}});
    }

    ModelBuilder builder;
    InstancingSettings settings;
    int translation = -1;
    int rotation = -1;
    int scale = -1;
    int featureIds = -1;
    int instanced = -1;
    int other = -1;
};

TEST_F(InstancingPipelineTest, SingleNodeToI3dm) {
    instanceAll(instanced);
    ConversionResult result = InstancingPipeline(settings).convert(builder.build());

    EXPECT_EQ(result.format, "i3dm");
    EXPECT_EQ(result.tilesLength, 1u);
    EXPECT_EQ(result.bytes.size() % 8, 0u);

    I3dmParts parts = Tile::parseI3dm(result.bytes.data(), result.bytes.size());
    auto header = parts.featureTableJson;
    EXPECT_EQ(header["INSTANCES_LENGTH"], 3);
    EXPECT_EQ(header["POSITION"]["byteOffset"], 0);
    EXPECT_EQ(header["NORMAL_UP"]["byteOffset"], 36);
    EXPECT_EQ(header["NORMAL_RIGHT"]["byteOffset"], 72);
    EXPECT_EQ(header["SCALE_NON_UNIFORM"]["byteOffset"], 108);
    EXPECT_EQ(header["BATCH_ID"]["byteOffset"], 144);
    EXPECT_EQ(header["BATCH_ID"]["componentType"], "UNSIGNED_BYTE");
    EXPECT_EQ(parts.header.featureTableJSONByteLength % 8, 0u);
    EXPECT_EQ(parts.header.featureTableBinaryByteLength, 152u);

    const uint8_t* binary = parts.featureTableBinary.data();
    EXPECT_FLOAT_EQ(readAt<float>(binary, 24), 2.f);
    EXPECT_FLOAT_EQ(readAt<float>(binary, 36 + 4), 1.f);
    EXPECT_FLOAT_EQ(readAt<float>(binary, 72), 1.f);
    EXPECT_EQ(readAt<uint8_t>(binary, 146), 2);
}

TEST_F(InstancingPipelineTest, EmbeddedGlbIsPrunedAndStripped) {
    instanceAll(instanced);
    ConversionResult result = InstancingPipeline(settings).convert(builder.build());
    I3dmParts parts = Tile::parseI3dm(result.bytes.data(), result.bytes.size());

    ModelPtr glb = loadGlb(reinterpret_cast<const uint8_t*>(parts.glb.data()), parts.glb.size());
    ASSERT_EQ(glb->scenes.size(), 1u);
    EXPECT_EQ(glb->scenes[0].nodes.size(), 1u);
    EXPECT_EQ(findExtension(glb->nodes[instanced].extensions, EXT_MESH_GPU_INSTANCING), nullptr);
    for (const auto& name : glb->extensionsUsed) {
        EXPECT_NE(name, EXT_MESH_GPU_INSTANCING);
    }
}

TEST_F(InstancingPipelineTest, KeepNodesAndExtension) {
    instanceAll(instanced);
    settings.pruneSourceNodes = false;
    settings.stripInstancingExtension = false;
    ConversionResult result = InstancingPipeline(settings).convert(builder.build());
    I3dmParts parts = Tile::parseI3dm(result.bytes.data(), result.bytes.size());

    ModelPtr glb = loadGlb(reinterpret_cast<const uint8_t*>(parts.glb.data()), parts.glb.size());
    EXPECT_EQ(glb->scenes[0].nodes.size(), 2u);
    EXPECT_NE(findExtension(glb->nodes[instanced].extensions, EXT_MESH_GPU_INSTANCING), nullptr);
}

TEST_F(InstancingPipelineTest, ConvertFromGlbBytes) {
    instanceAll(instanced);
    std::string source = writeGlb(builder.model);
    ConversionResult result = InstancingPipeline(settings).convert(
        reinterpret_cast<const uint8_t*>(source.data()), source.size());

    EXPECT_EQ(result.format, "i3dm");
    I3dmParts parts = Tile::parseI3dm(result.bytes.data(), result.bytes.size());
    EXPECT_EQ(parts.featureTableJson["INSTANCES_LENGTH"], 3);
    EXPECT_EQ(parts.header.byteLength, result.bytes.size());
}

TEST_F(InstancingPipelineTest, MissingTranslationSynthesizesPositions) {
    builder.setInstancing(instanced, {{"ROTATION", rotation}});
    ConversionResult result = InstancingPipeline(settings).convert(builder.build());
    I3dmParts parts = Tile::parseI3dm(result.bytes.data(), result.bytes.size());

    EXPECT_EQ(parts.featureTableJson["POSITION"]["byteOffset"], 0);
    EXPECT_EQ(parts.featureTableJson["NORMAL_UP"]["byteOffset"], 36);
    for (size_t i = 0; i < 9; ++i) {
        EXPECT_FLOAT_EQ(readAt<float>(parts.featureTableBinary.data(), i * 4), 0.f);
    }
}

TEST_F(InstancingPipelineTest, SeveralNodesToCmpt) {
    instanceAll(instanced);
    instanceAll(other);
    ConversionResult result = InstancingPipeline(settings).convert(builder.build());

    EXPECT_EQ(result.format, "cmpt");
    EXPECT_EQ(result.tilesLength, 2u);
    auto tiles = Tile::splitCmpt(result.bytes.data(), result.bytes.size());
    ASSERT_EQ(tiles.size(), 2u);
    for (const auto& tile : tiles) {
        I3dmParts parts = Tile::parseI3dm(tile.data(), tile.size());
        EXPECT_EQ(parts.featureTableJson["INSTANCES_LENGTH"], 3);
    }
}

TEST_F(InstancingPipelineTest, NoInstancingToB3dm) {
    ConversionResult result = InstancingPipeline(settings).convert(builder.build());

    EXPECT_EQ(result.format, "b3dm");
    ASSERT_GE(result.bytes.size(), 28u);
    EXPECT_EQ(readAt<uint32_t>(result.bytes.data(), 0), Tile::B3DM_MAGIC);
    uint32_t jsonLength = readAt<uint32_t>(result.bytes.data(), 12);
    auto header = Tile::FeatureTable::parseHeader(result.bytes.data() + 28, jsonLength);
    EXPECT_EQ(header["BATCH_LENGTH"], 0);
}

TEST_F(InstancingPipelineTest, EmptyInstancingIsUnsupported) {
    builder.setInstancing(instanced, {});
    EXPECT_THROW(InstancingPipeline(settings).convert(builder.build()), UnsupportedAsset);
}

TEST_F(InstancingPipelineTest, MalformedAttributesPropagate) {
    instanceAll(instanced);
    builder.model.accessors[featureIds].count = 4;
    EXPECT_THROW(InstancingPipeline(settings).convert(builder.build()), MalformedAccessor);
}

TEST_F(InstancingPipelineTest, GarbageBytesAreMalformed) {
    std::vector<uint8_t> garbage(64, 0x42);
    EXPECT_THROW(InstancingPipeline(settings).convert(garbage.data(), garbage.size()), MalformedAsset);
}
