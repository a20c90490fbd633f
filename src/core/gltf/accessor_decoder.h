#pragma once

#include "component_type.h"
#include "gltf_model.h"
#include "typed_view.h"
#include <cstddef>

namespace I3dmPack::Core::Gltf {

/**
 * The parts of a glTF accessor needed to read it from a bufferView slice.
 * Type fields keep their raw glTF codes so unknown values can be reported.
 */
struct AccessorDesc {
    size_t byteOffset = 0;
    int componentType = 0;  // glTF componentType, e.g. 5126
    int type = 0;           // TINYGLTF_TYPE_* code
    size_t count = 0;
};

struct DecodedAccessor {
    TypedView view;
    ElementType elementType = ElementType::SCALAR;
    size_t count = 0;       // number of elements
};

/**
 * Zero-copy decoding of glTF accessors.
 */
class AccessorDecoder {
public:
    /**
     * Decode an accessor out of a buffer slice.
     *
     * The view aliases the slice's bytes starting at
     * slice.byteOffset + accessor.byteOffset and holds
     * accessor.count * components(type) components.
     *
     * @throws MalformedAccessor on unknown component/element type or when
     *         the accessor span does not fit in the slice
     */
    static TypedView decode(const BufferSlice& buffer, const AccessorDesc& accessor);

    /**
     * Resolve accessorId through its bufferView into buffer 0 of model and
     * decode it. The returned view shares ownership of model.
     *
     * @throws MalformedAccessor on dangling ids or out-of-range spans
     * @throws UnsupportedAsset on sparse, bufferView-less or interleaved
     *         accessors and on buffers other than buffer 0
     */
    static DecodedAccessor decodeAccessor(const ModelPtr& model, int accessorId);

    /**
     * Slice of buffer 0 covered by bufferViewId, sharing ownership of model.
     */
    static BufferSlice bufferViewSlice(const ModelPtr& model, int bufferViewId);
};

}
