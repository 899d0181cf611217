#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "../types.h"

namespace hm {

// Header information of an encoded image
struct ImageInfo {
    std::string format; // "PNG", "JPEG", "BMP", "GIF" or "image"
    int width = 0;
    int height = 0;
    int channels = 0;
};

struct PhotoCheck {
    bool valid = false;
    std::string message;
};

// Probes encoded tool photos with stb_image. Only the header is parsed;
// pixels are never decoded.
class ImageInspector {
  public:
    static constexpr usize DEFAULT_MAX_PHOTO_BYTES = 10 * 1024 * 1024;

    // Returns nullopt when stb_image does not recognize the data
    static std::optional<ImageInfo> inspect(const uint8_t* data, size_t size);
    static std::optional<ImageInfo> inspect(const ByteBuffer& data);

    // An absent or empty photo is valid ("No image")
    static PhotoCheck validatePhoto(const std::optional<ByteBuffer>& photo,
                                    usize maxBytes = DEFAULT_MAX_PHOTO_BYTES);
};

} // namespace hm
