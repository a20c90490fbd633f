#include "instance_extractor.h"
#include "../tile_error.h"
#include "../../logging.h"
#include <cmath>
#include <optional>
#include <string>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <fmt/format.h>

namespace I3dmPack::Core::Instancing {

using Gltf::ComponentType;
using Gltf::DecodedAccessor;
using Gltf::ElementType;
using Gltf::TypedView;

namespace {

int readAttribute(const tinygltf::Value& attributes, const char* semantic) {
    if (!attributes.Has(semantic)) {
        return -1;
    }
    const tinygltf::Value& value = attributes.Get(semantic);
    if (!value.IsNumber()) {
        throw MalformedAccessor(fmt::format("instancing attribute {} is not an accessor index", semantic));
    }
    return value.GetNumberAsInt();
}

Tile::Property makeProperty(const char* name, TypedView values, bool hasComponentType = false) {
    Tile::Property property;
    property.name = name;
    property.values = std::move(values);
    property.hasComponentType = hasComponentType;
    return property;
}

void checkShape(const DecodedAccessor& accessor, ElementType expected, const char* semantic,
                std::optional<size_t>& instancesLength) {
    if (accessor.elementType != expected) {
        throw MalformedAccessor(fmt::format("{} must be {}, got {}", semantic,
                                            Gltf::elementTypeName(expected),
                                            Gltf::elementTypeName(accessor.elementType)));
    }
    if (instancesLength && *instancesLength != accessor.count) {
        throw MalformedAccessor(fmt::format("{} has {} elements, expected {}", semantic,
                                            accessor.count, *instancesLength));
    }
    instancesLength = accessor.count;
}

glm::dvec3 unitColumn(const glm::dmat3& rotation, int column, size_t instance) {
    glm::dvec3 v = rotation[column];
    double length = glm::length(v);
    if (!(length > 0.0) || !std::isfinite(length)) {
        throw MalformedAccessor(fmt::format("rotation {} is degenerate", instance));
    }
    return v / length;
}

}

InstanceExtractor::InstanceExtractor(Gltf::ModelPtr model) : model_(std::move(model)) {}

InstancingAttributes InstanceExtractor::readAttributes(const tinygltf::Node& node) {
    InstancingAttributes result;
    const tinygltf::Value* extension = Gltf::findExtension(node.extensions, Gltf::EXT_MESH_GPU_INSTANCING);
    if (extension == nullptr || !extension->Has("attributes")) {
        return result;
    }
    const tinygltf::Value& attributes = extension->Get("attributes");
    if (!attributes.IsObject()) {
        return result;
    }
    result.translation = readAttribute(attributes, "TRANSLATION");
    result.rotation = readAttribute(attributes, "ROTATION");
    result.scale = readAttribute(attributes, "SCALE");
    result.featureId = readAttribute(attributes, "_FEATURE_ID_0");
    return result;
}

ExtractedInstances InstanceExtractor::extract(int nodeId) const {
    if (nodeId < 0 || nodeId >= static_cast<int>(model_->nodes.size())) {
        throw MalformedAccessor(fmt::format("node {} does not exist", nodeId));
    }
    return extract(model_->nodes[nodeId]);
}

ExtractedInstances InstanceExtractor::extract(const tinygltf::Node& node) const {
    InstancingAttributes attributes = readAttributes(node);
    ExtractedInstances result;
    std::optional<size_t> instancesLength;

    if (attributes.translation >= 0) {
        auto positions = Gltf::AccessorDecoder::decodeAccessor(model_, attributes.translation);
        checkShape(positions, ElementType::VEC3, "TRANSLATION", instancesLength);
        LOG_D("POSITION: %zu instances (%s)", positions.count,
              Gltf::componentTypeTag(positions.view.componentType()));
        result.properties.push_back(makeProperty("POSITION", positions.view));
    }
    if (attributes.rotation >= 0) {
        auto rotations = Gltf::AccessorDecoder::decodeAccessor(model_, attributes.rotation);
        checkShape(rotations, ElementType::VEC4, "ROTATION", instancesLength);
        InstanceNormals normals = computeNormals(rotations.view);
        LOG_D("NORMAL_UP/NORMAL_RIGHT: %zu instances from %s quaternions", rotations.count,
              Gltf::componentTypeTag(rotations.view.componentType()));
        result.properties.push_back(makeProperty("NORMAL_UP", normals.normalUps));
        result.properties.push_back(makeProperty("NORMAL_RIGHT", normals.normalRights));
    }
    if (attributes.scale >= 0) {
        auto scales = Gltf::AccessorDecoder::decodeAccessor(model_, attributes.scale);
        checkShape(scales, ElementType::VEC3, "SCALE", instancesLength);
        LOG_D("SCALE_NON_UNIFORM: %zu instances", scales.count);
        result.properties.push_back(makeProperty("SCALE_NON_UNIFORM", scales.view));
    }
    if (attributes.featureId >= 0) {
        auto featureIds = Gltf::AccessorDecoder::decodeAccessor(model_, attributes.featureId);
        checkShape(featureIds, ElementType::SCALAR, "_FEATURE_ID_0", instancesLength);
        TypedView batchIds = widenFeatureIds(featureIds.view);
        LOG_D("BATCH_ID: %zu instances (%s)", featureIds.count,
              Gltf::componentTypeTag(batchIds.componentType()));
        result.properties.push_back(makeProperty("BATCH_ID", batchIds, true));
    }

    result.instancesLength = instancesLength.value_or(0);
    return result;
}

InstanceNormals InstanceExtractor::computeNormals(const TypedView& quaternions) {
    size_t length = quaternions.size() / 4;
    ComponentType type = quaternions.componentType();
    bool normalized = type == ComponentType::INT8 || type == ComponentType::INT16;

    std::vector<float> normalUps(length * 3);
    std::vector<float> normalRights(length * 3);

    for (size_t i = 0; i < length; ++i) {
        double x = quaternions.getAsDouble(i * 4);
        double y = quaternions.getAsDouble(i * 4 + 1);
        double z = quaternions.getAsDouble(i * 4 + 2);
        double w = quaternions.getAsDouble(i * 4 + 3);
        if (normalized) {
            x = Gltf::normalizeComponent(x, type);
            y = Gltf::normalizeComponent(y, type);
            z = Gltf::normalizeComponent(z, type);
            w = Gltf::normalizeComponent(w, type);
        }

        glm::dmat3 rotation = glm::mat3_cast(glm::dquat(w, x, y, z));
        glm::dvec3 up = unitColumn(rotation, 1, i);
        glm::dvec3 right = unitColumn(rotation, 0, i);

        for (int c = 0; c < 3; ++c) {
            normalUps[i * 3 + c] = static_cast<float>(up[c]);
            normalRights[i * 3 + c] = static_cast<float>(right[c]);
        }
    }

    return InstanceNormals{TypedView::fromValues(normalUps), TypedView::fromValues(normalRights)};
}

TypedView InstanceExtractor::widenFeatureIds(const TypedView& ids) {
    ComponentType type = ids.componentType();
    if (type == ComponentType::UINT8 || type == ComponentType::UINT16 || type == ComponentType::UINT32) {
        return ids;
    }

    std::vector<uint32_t> widened(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        double value = ids.getAsDouble(i);
        if (!std::isfinite(value)) {
            widened[i] = 0;
            continue;
        }
        double wrapped = std::fmod(std::trunc(value), 4294967296.0);
        if (wrapped < 0.0) {
            wrapped += 4294967296.0;
        }
        widened[i] = static_cast<uint32_t>(wrapped);
    }
    return TypedView::fromValues(widened);
}

}
