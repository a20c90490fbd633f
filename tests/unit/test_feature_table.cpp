#include <gtest/gtest.h>
#include "core/tile/feature_table.h"
#include "core/tile_error.h"
#include "../utils/test_helpers.h"

using namespace I3dmPack::Core;
using namespace I3dmPack::Core::Gltf;
using namespace I3dmPack::Core::Tile;
using namespace I3dmPack::Test;

class FeatureTableTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    static Property makeProperty(const std::string& name, TypedView values) {
        Property property;
        property.name = name;
        property.values = std::move(values);
        return property;
    }

    static nlohmann::ordered_json header(const FeatureTableBuffer& table) {
        return FeatureTable::parseHeader(table.bytes().data(), table.jsonByteLength());
    }
};

TEST_F(FeatureTableTest, Padding) {
    EXPECT_EQ(FeatureTable::padding(0, 8), 0u);
    EXPECT_EQ(FeatureTable::padding(1, 8), 7u);
    EXPECT_EQ(FeatureTable::padding(8, 8), 0u);
    EXPECT_EQ(FeatureTable::padding(13, 4), 3u);
    EXPECT_EQ(FeatureTable::padding(5, 1), 0u);
}

TEST_F(FeatureTableTest, EmptyTable) {
    FeatureTableBuffer table = FeatureTable::pack({});
    EXPECT_EQ(table.size(), 8u);
    EXPECT_EQ(table.jsonByteLength(), 8u);
    EXPECT_EQ(table.binaryByteLength(), 0u);
    EXPECT_EQ(table.jsonText(), "{}      ");
}

TEST_F(FeatureTableTest, AlignsPerComponentWidth) {
    std::vector<Property> properties{
        makeProperty("A", TypedView::fromValues(std::vector<uint8_t>{1, 2, 3, 4})),
        makeProperty("B", TypedView::fromValues(std::vector<float>{1.5f})),
    };
    FeatureTableBuffer table = FeatureTable::pack(properties);
    auto json = header(table);

    EXPECT_EQ(json["A"]["byteOffset"], 0);
    EXPECT_EQ(json["B"]["byteOffset"], 4);
    EXPECT_EQ(table.binaryByteLength(), 8u);
    EXPECT_EQ(readAt<uint8_t>(table.binary(), 3), 4);
    EXPECT_FLOAT_EQ(readAt<float>(table.binary(), 4), 1.5f);
}

TEST_F(FeatureTableTest, InsertsAlignmentGap) {
    std::vector<Property> properties{
        makeProperty("A", TypedView::fromValues(std::vector<uint8_t>{9, 9, 9})),
        makeProperty("B", TypedView::fromValues(std::vector<double>{2.0})),
        makeProperty("C", TypedView::fromValues(std::vector<uint16_t>{7})),
    };
    FeatureTableBuffer table = FeatureTable::pack(properties);
    auto json = header(table);

    EXPECT_EQ(json["B"]["byteOffset"], 8);
    EXPECT_EQ(json["C"]["byteOffset"], 16);
    for (size_t i = 3; i < 8; ++i) {
        EXPECT_EQ(table.binary()[i], 0);
    }
    EXPECT_DOUBLE_EQ(readAt<double>(table.binary(), 8), 2.0);
    EXPECT_EQ(readAt<uint16_t>(table.binary(), 16), 7);
    EXPECT_EQ(table.binaryByteLength(), 24u);
}

TEST_F(FeatureTableTest, HeaderKeepsInsertionOrder) {
    std::vector<Property> properties{
        makeProperty("ZETA", TypedView::fromValues(std::vector<uint8_t>{1})),
        makeProperty("ALPHA", TypedView::fromValues(std::vector<uint8_t>{2})),
    };
    nlohmann::ordered_json globals;
    globals["INSTANCES_LENGTH"] = 1;
    FeatureTableBuffer table = FeatureTable::pack(properties, globals);

    std::string text = table.jsonText();
    size_t global = text.find("INSTANCES_LENGTH");
    size_t zeta = text.find("ZETA");
    size_t alpha = text.find("ALPHA");
    EXPECT_LT(global, zeta);
    EXPECT_LT(zeta, alpha);
    EXPECT_EQ(header(table)["INSTANCES_LENGTH"], 1);
}

TEST_F(FeatureTableTest, ComponentTypeAndElementTypeEntries) {
    Property ids = makeProperty("BATCH_ID", TypedView::fromValues(std::vector<uint16_t>{0, 1}));
    ids.hasComponentType = true;
    Property color = makeProperty("color", TypedView::fromValues(std::vector<uint8_t>{1, 2, 3, 4, 5, 6}));
    color.hasComponentType = true;
    color.elementType = "VEC3";

    auto json = header(FeatureTable::pack({ids, color}));
    EXPECT_EQ(json["BATCH_ID"]["componentType"], "UNSIGNED_SHORT");
    EXPECT_FALSE(json["BATCH_ID"].contains("type"));
    EXPECT_EQ(json["color"]["componentType"], "UNSIGNED_BYTE");
    EXPECT_EQ(json["color"]["type"], "VEC3");
}

TEST_F(FeatureTableTest, LengthsAreMultiplesOfEight) {
    for (size_t n = 0; n < 12; ++n) {
        std::vector<uint8_t> values(n, 0xAB);
        std::vector<Property> properties;
        if (n > 0) {
            properties.push_back(makeProperty(std::string(n, 'p'), TypedView::fromValues(values)));
        }
        FeatureTableBuffer table = FeatureTable::pack(properties);
        EXPECT_EQ(table.size() % 8, 0u);
        EXPECT_EQ(table.jsonByteLength() % 8, 0u);
        EXPECT_EQ(table.binaryByteLength() % 8, 0u);
        EXPECT_EQ(table.size(), table.jsonByteLength() + table.binaryByteLength());
    }
}

TEST_F(FeatureTableTest, PaddingBytes) {
    FeatureTableBuffer table = FeatureTable::pack({
        makeProperty("X", TypedView::fromValues(std::vector<uint8_t>{1, 2, 3}))});
    std::string text = table.jsonText();
    std::string json = nlohmann::ordered_json::parse(text).dump();
    for (size_t i = json.size(); i < text.size(); ++i) {
        EXPECT_EQ(text[i], ' ');
    }
    for (size_t i = 3; i < table.binaryByteLength(); ++i) {
        EXPECT_EQ(table.binary()[i], 0);
    }
}

TEST_F(FeatureTableTest, DuplicateNameIsPackingError) {
    std::vector<Property> properties{
        makeProperty("A", TypedView::fromValues(std::vector<uint8_t>{1})),
        makeProperty("A", TypedView::fromValues(std::vector<uint8_t>{2})),
    };
    EXPECT_THROW(FeatureTable::pack(properties), PackingError);
}

TEST_F(FeatureTableTest, GlobalCollisionIsPackingError) {
    nlohmann::ordered_json globals;
    globals["A"] = 1;
    EXPECT_THROW(FeatureTable::pack({makeProperty("A", TypedView::fromValues(std::vector<uint8_t>{1}))}, globals),
                 PackingError);
    EXPECT_THROW(FeatureTable::pack({}, nlohmann::ordered_json::array()), PackingError);
}

TEST_F(FeatureTableTest, EmptyProperties) {
    Property required = makeProperty("A", TypedView());
    EXPECT_THROW(FeatureTable::pack({required}), PackingError);

    Property optional = makeProperty("B", TypedView());
    optional.optional = true;
    FeatureTableBuffer table = FeatureTable::pack({optional});
    EXPECT_FALSE(header(table).contains("B"));
    EXPECT_EQ(table.binaryByteLength(), 0u);
}

TEST_F(FeatureTableTest, NonAsciiNamesAreEscaped) {
    FeatureTableBuffer table = FeatureTable::pack({
        makeProperty("h\xC3\xB6he", TypedView::fromValues(std::vector<uint8_t>{1}))});
    for (uint8_t c : table.jsonText()) {
        EXPECT_LT(c, 0x80);
    }
    EXPECT_TRUE(header(table).contains("h\xC3\xB6he"));
}

TEST_F(FeatureTableTest, ParseHeaderRejectsNonObjects) {
    std::string text = "[1,2]   ";
    EXPECT_THROW(FeatureTable::parseHeader(reinterpret_cast<const uint8_t*>(text.data()), text.size()),
                 MalformedAsset);
    std::string broken = "{\"a\":   ";
    EXPECT_THROW(FeatureTable::parseHeader(reinterpret_cast<const uint8_t*>(broken.data()), broken.size()),
                 MalformedAsset);
}
