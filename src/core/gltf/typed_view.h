#pragma once

#include "component_type.h"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <utility>
#include <vector>

namespace I3dmPack::Core::Gltf {

using ByteBuffer = std::vector<uint8_t>;
using SharedBuffer = std::shared_ptr<const ByteBuffer>;

/**
 * Window into a shared byte buffer, e.g. one glTF bufferView.
 */
struct BufferSlice {
    SharedBuffer owner;
    size_t byteOffset = 0;
    size_t byteLength = 0;

    static BufferSlice whole(SharedBuffer buffer) {
        size_t length = buffer ? buffer->size() : 0;
        return BufferSlice{std::move(buffer), 0, length};
    }
};

/**
 * Read-only typed view over little-endian bytes owned elsewhere.
 *
 * The view keeps a reference on its backing buffer, so it stays valid as
 * long as it exists. Reads go through memcpy and do not require the data
 * to be aligned.
 */
class TypedView {
public:
    TypedView() = default;
    TypedView(SharedBuffer owner, size_t byteOffset, size_t length, ComponentType type);

    /**
     * Build a view over a fresh buffer holding a copy of values.
     */
    template <class T>
    static TypedView fromValues(const std::vector<T>& values) {
        auto bytes = std::make_shared<ByteBuffer>(values.size() * sizeof(T));
        if (!values.empty()) {
            std::memcpy(bytes->data(), values.data(), bytes->size());
        }
        return TypedView(std::move(bytes), 0, values.size(), ComponentTypeOf<T>::value);
    }

    ComponentType componentType() const { return type_; }

    // Number of components (not elements) in the view.
    size_t size() const { return length_; }
    bool empty() const { return length_ == 0; }

    size_t byteOffset() const { return byteOffset_; }
    size_t byteLength() const { return length_ * componentByteWidth(type_); }

    const uint8_t* data() const;
    const SharedBuffer& owner() const { return owner_; }

    template <class T>
    T get(size_t index) const {
        T value;
        std::memcpy(&value, data() + index * sizeof(T), sizeof(T));
        return value;
    }

    /**
     * Read component index converted to double, whatever the storage type.
     */
    double getAsDouble(size_t index) const;

private:
    SharedBuffer owner_;
    size_t byteOffset_ = 0;
    size_t length_ = 0;
    ComponentType type_ = ComponentType::UINT8;
};

}
