#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace ember::io {

/// Decoded 8-bit image, always expanded to RGBA
struct ImageData {
    std::vector<uint8_t> pixels;  ///< RGBA pixel data
    int width = 0;
    int height = 0;
    int channels = 0;             ///< Original channels before forced RGBA

    bool valid() const { return !pixels.empty() && width > 0 && height > 0; }
};

/// Decode a PNG/JPG/BMP/TGA file into RGBA
/// @param path File path, resolved against the current directory and "textures/"
/// @param error Optional out-parameter receiving the failure reason
/// @return ImageData with RGBA pixels, or empty ImageData on failure
ImageData loadImage(const std::string& path, std::string* error = nullptr);

/// Decode an encoded image held in memory
ImageData loadImageFromMemory(const uint8_t* data, size_t size, std::string* error = nullptr);

/// Build a width x height image filled with one RGBA color
ImageData solidImage(int width, int height, uint8_t r, uint8_t g, uint8_t b, uint8_t a);

/// Check if a file exists
bool fileExists(const std::string& path);

/// Resolve a path by checking multiple search locations
/// @return The resolved path if found, or empty string if not found
std::string resolvePath(const std::string& path, const std::vector<std::string>& searchPaths = {});

} // namespace ember::io
