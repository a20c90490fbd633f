#include "accessor_decoder.h"
#include "../tile_error.h"
#include <fmt/format.h>

namespace I3dmPack::Core::Gltf {

TypedView AccessorDecoder::decode(const BufferSlice& buffer, const AccessorDesc& accessor) {
    auto componentType = componentTypeFromGltf(accessor.componentType);
    if (!componentType) {
        throw MalformedAccessor(fmt::format("unrecognized componentType {}", accessor.componentType));
    }
    auto elementType = elementTypeFromGltf(accessor.type);
    if (!elementType) {
        throw MalformedAccessor(fmt::format("unrecognized accessor type {}", accessor.type));
    }

    size_t ownerSize = buffer.owner ? buffer.owner->size() : 0;
    if (buffer.byteOffset > ownerSize || buffer.byteLength > ownerSize - buffer.byteOffset) {
        throw MalformedAccessor(fmt::format("buffer slice [{}, +{}) exceeds buffer of {} bytes",
                                            buffer.byteOffset, buffer.byteLength, ownerSize));
    }

    size_t elementSize = elementComponentCount(*elementType) * componentByteWidth(*componentType);
    if (accessor.byteOffset > buffer.byteLength ||
        accessor.count > (buffer.byteLength - accessor.byteOffset) / elementSize) {
        throw MalformedAccessor(fmt::format("accessor span at {} of {} x {} bytes exceeds buffer of {} bytes",
                                            accessor.byteOffset, accessor.count, elementSize,
                                            buffer.byteLength));
    }
    size_t length = accessor.count * elementComponentCount(*elementType);

    return TypedView(buffer.owner, buffer.byteOffset + accessor.byteOffset, length, *componentType);
}

BufferSlice AccessorDecoder::bufferViewSlice(const ModelPtr& model, int bufferViewId) {
    if (bufferViewId < 0 || bufferViewId >= static_cast<int>(model->bufferViews.size())) {
        throw MalformedAccessor(fmt::format("bufferView {} does not exist", bufferViewId));
    }
    const tinygltf::BufferView& bufferView = model->bufferViews[bufferViewId];
    if (bufferView.buffer != 0) {
        throw UnsupportedAsset(fmt::format("bufferView {} references buffer {}, only buffer 0 is supported",
                                           bufferViewId, bufferView.buffer));
    }
    if (model->buffers.empty()) {
        throw MalformedAccessor("model has no buffer");
    }

    // Alias the model: the slice keeps the whole model alive.
    SharedBuffer bytes(model, &model->buffers[0].data);
    if (bufferView.byteOffset > bytes->size() ||
        bufferView.byteLength > bytes->size() - bufferView.byteOffset) {
        throw MalformedAccessor(fmt::format("bufferView {} [{}, +{}) exceeds buffer of {} bytes",
                                            bufferViewId, bufferView.byteOffset,
                                            bufferView.byteLength, bytes->size()));
    }
    return BufferSlice{bytes, bufferView.byteOffset, bufferView.byteLength};
}

DecodedAccessor AccessorDecoder::decodeAccessor(const ModelPtr& model, int accessorId) {
    if (accessorId < 0 || accessorId >= static_cast<int>(model->accessors.size())) {
        throw MalformedAccessor(fmt::format("accessor {} does not exist", accessorId));
    }
    const tinygltf::Accessor& accessor = model->accessors[accessorId];
    if (accessor.sparse.isSparse) {
        throw UnsupportedAsset(fmt::format("accessor {} is sparse", accessorId));
    }
    if (accessor.bufferView < 0) {
        throw UnsupportedAsset(fmt::format("accessor {} has no bufferView", accessorId));
    }

    BufferSlice slice = bufferViewSlice(model, accessor.bufferView);

    AccessorDesc desc;
    desc.byteOffset = accessor.byteOffset;
    desc.componentType = accessor.componentType;
    desc.type = accessor.type;
    desc.count = accessor.count;
    TypedView view = decode(slice, desc);

    ElementType elementType = *elementTypeFromGltf(accessor.type);
    size_t elementSize = elementComponentCount(elementType) * componentByteWidth(view.componentType());
    size_t stride = model->bufferViews[accessor.bufferView].byteStride;
    if (stride != 0 && stride != elementSize) {
        throw UnsupportedAsset(fmt::format("accessor {} is interleaved (byteStride {} != {})",
                                           accessorId, stride, elementSize));
    }

    return DecodedAccessor{view, elementType, accessor.count};
}

}
