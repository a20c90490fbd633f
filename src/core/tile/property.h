#pragma once

#include "../gltf/typed_view.h"
#include <string>

namespace I3dmPack::Core::Tile {

/**
 * One named binary column of a feature or batch table.
 */
struct Property {
    std::string name;
    Gltf::TypedView values;
    bool hasComponentType = false;  // write "componentType" next to "byteOffset"
    bool optional = false;          // an empty optional property is left out
    std::string elementType;        // written as "type" when set (batch tables)
};

}
