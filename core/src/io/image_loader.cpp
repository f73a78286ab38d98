// Ember I/O - Image Loader Implementation

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <ember/io/image_loader.h>
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

namespace ember::io {

namespace {

void setError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

} // namespace

ImageData loadImage(const std::string& path, std::string* error) {
    ImageData result;

    std::string resolvedPath = resolvePath(path, {"textures", "assets/textures"});
    if (resolvedPath.empty()) {
        std::cerr << "[ImageLoader] Image not found: " << path << std::endl;
        setError(error, "image not found: " + path);
        return result;
    }

    // Force RGBA output
    int width, height, channels;
    unsigned char* data = stbi_load(resolvedPath.c_str(), &width, &height, &channels, 4);

    if (!data) {
        std::cerr << "[ImageLoader] Failed to load image: " << resolvedPath
                  << " - " << stbi_failure_reason() << std::endl;
        setError(error, std::string("failed to decode ") + path + ": " + stbi_failure_reason());
        return result;
    }

    result.width = width;
    result.height = height;
    result.channels = channels;
    result.pixels.assign(data, data + (width * height * 4));

    stbi_image_free(data);
    return result;
}

ImageData loadImageFromMemory(const uint8_t* data, size_t size, std::string* error) {
    ImageData result;

    if (!data || size == 0) {
        std::cerr << "[ImageLoader] Invalid memory buffer for image loading" << std::endl;
        setError(error, "empty image buffer");
        return result;
    }

    int width, height, channels;
    unsigned char* pixels = stbi_load_from_memory(data, static_cast<int>(size), &width, &height, &channels, 4);

    if (!pixels) {
        std::cerr << "[ImageLoader] Failed to decode image from memory - "
                  << stbi_failure_reason() << std::endl;
        setError(error, std::string("failed to decode image: ") + stbi_failure_reason());
        return result;
    }

    result.width = width;
    result.height = height;
    result.channels = channels;
    result.pixels.assign(pixels, pixels + (width * height * 4));

    stbi_image_free(pixels);
    return result;
}

ImageData solidImage(int width, int height, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    ImageData result;
    if (width <= 0 || height <= 0) {
        return result;
    }
    result.width = width;
    result.height = height;
    result.channels = 4;
    result.pixels.resize(static_cast<size_t>(width) * height * 4);
    for (size_t i = 0; i < result.pixels.size(); i += 4) {
        result.pixels[i + 0] = r;
        result.pixels[i + 1] = g;
        result.pixels[i + 2] = b;
        result.pixels[i + 3] = a;
    }
    return result;
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string resolvePath(const std::string& path, const std::vector<std::string>& searchPaths) {
    if (path.empty()) {
        return "";
    }

    fs::path p = path;
    if (p.is_absolute()) {
        return fileExists(path) ? path : "";
    }

    // Current directory first
    if (fileExists(path)) {
        return fs::absolute(p).string();
    }

    for (const auto& searchDir : searchPaths) {
        fs::path candidate = fs::path(searchDir) / path;
        if (fileExists(candidate.string())) {
            return fs::absolute(candidate).string();
        }
    }

    return "";
}

} // namespace ember::io
