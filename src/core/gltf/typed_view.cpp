#include "typed_view.h"

namespace I3dmPack::Core::Gltf {

TypedView::TypedView(SharedBuffer owner, size_t byteOffset, size_t length, ComponentType type)
    : owner_(std::move(owner)), byteOffset_(byteOffset), length_(length), type_(type) {}

const uint8_t* TypedView::data() const {
    if (!owner_) {
        return nullptr;
    }
    return owner_->data() + byteOffset_;
}

double TypedView::getAsDouble(size_t index) const {
    switch (type_) {
        case ComponentType::INT8: return get<int8_t>(index);
        case ComponentType::UINT8: return get<uint8_t>(index);
        case ComponentType::INT16: return get<int16_t>(index);
        case ComponentType::UINT16: return get<uint16_t>(index);
        case ComponentType::INT32: return get<int32_t>(index);
        case ComponentType::UINT32: return get<uint32_t>(index);
        case ComponentType::FLOAT32: return get<float>(index);
        case ComponentType::FLOAT64: return get<double>(index);
    }
    return 0.0;
}

}
