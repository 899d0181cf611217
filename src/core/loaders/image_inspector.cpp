// STB_IMAGE_IMPLEMENTATION must be defined in exactly ONE .cpp file.
// It is defined here so that stb_image.h compiles its implementation once.
#define STB_IMAGE_IMPLEMENTATION
#include "image_inspector.h"

#include <climits>
#include <cstdio>

#include <stb_image.h>

#include "../utils/log.h"

namespace hm {

namespace {

const char* failureReason() {
    const char* reason = stbi_failure_reason();
    return reason ? reason : "unknown format";
}

std::string detectFormat(const uint8_t* data, size_t size) {
    if (size >= 8 && data[0] == 0x89 && data[1] == 'P' && data[2] == 'N' && data[3] == 'G') {
        return "PNG";
    }
    if (size >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return "JPEG";
    }
    if (size >= 2 && data[0] == 'B' && data[1] == 'M') {
        return "BMP";
    }
    if (size >= 6 && data[0] == 'G' && data[1] == 'I' && data[2] == 'F') {
        return "GIF";
    }
    return "image";
}

} // namespace

std::optional<ImageInfo> ImageInspector::inspect(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return std::nullopt;
    }
    if (size > static_cast<size_t>(INT_MAX)) {
        log::error("ImageInspector", "Image buffer too large to probe");
        return std::nullopt;
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    if (!stbi_info_from_memory(reinterpret_cast<const stbi_uc*>(data), static_cast<int>(size),
                               &width, &height, &channels)) {
        log::debugf("ImageInspector", "Unrecognized image data: %s", failureReason());
        return std::nullopt;
    }

    ImageInfo info;
    info.format = detectFormat(data, size);
    info.width = width;
    info.height = height;
    info.channels = channels;
    return info;
}

std::optional<ImageInfo> ImageInspector::inspect(const ByteBuffer& data) {
    return inspect(data.data(), data.size());
}

PhotoCheck ImageInspector::validatePhoto(const std::optional<ByteBuffer>& photo, usize maxBytes) {
    if (!photo || photo->empty()) {
        return {true, "No image"};
    }

    char buffer[128];
    if (photo->size() > maxBytes) {
        std::snprintf(buffer, sizeof(buffer), "Image too large (%.1fMB > %.0fMB)",
                      static_cast<double>(photo->size()) / (1024.0 * 1024.0),
                      static_cast<double>(maxBytes) / (1024.0 * 1024.0));
        return {false, buffer};
    }

    auto info = inspect(*photo);
    if (!info) {
        return {false, std::string("Invalid image file: ") + failureReason()};
    }

    std::snprintf(buffer, sizeof(buffer), "Valid %s image, %dx%d", info->format.c_str(),
                  info->width, info->height);
    return {true, buffer};
}

} // namespace hm
