#pragma once

#include <stdexcept>
#include <string>

namespace I3dmPack::Core {

/**
 * Base of every error raised while converting tile content.
 * Callers that process many tiles catch this and skip the offending one.
 */
class TileError : public std::runtime_error {
public:
    explicit TileError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Accessor bytes cannot be read: span outside the buffer, unknown component
 * or element type, or an attribute shape that does not fit its semantic.
 */
class MalformedAccessor : public TileError {
public:
    explicit MalformedAccessor(const std::string& message) : TileError(message) {}
};

/**
 * Feature/batch table properties cannot be packed (duplicate name, empty
 * required property).
 */
class PackingError : public TileError {
public:
    explicit PackingError(const std::string& message) : TileError(message) {}
};

/**
 * Asset is well formed but uses something this converter does not handle
 * (several buffers, several feature tables, no scene, sparse accessors...).
 */
class UnsupportedAsset : public TileError {
public:
    explicit UnsupportedAsset(const std::string& message) : TileError(message) {}
};

/**
 * Input bytes are not a valid GLB or tile.
 */
class MalformedAsset : public TileError {
public:
    explicit MalformedAsset(const std::string& message) : TileError(message) {}
};

}
