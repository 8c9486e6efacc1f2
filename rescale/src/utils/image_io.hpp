#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace image_io {

enum class ImageFormat { Unknown, Png, Jpeg, Webp, Bmp, Tga, Gif, Other };

struct ImagePixels {
    int width = 0;
    int height = 0;
    int channels = 0;  // 3 (RGB) or 4 (RGBA)
    std::vector<uint8_t> pixels;
};

/// Sniff the container from its magic bytes.
ImageFormat detect_format(const uint8_t* data, size_t size);
/// "png", "jpg", "jpeg", "webp", "bmp", "tga" (case-insensitive).
ImageFormat format_from_name(const std::string& name);
/// Format named by the path extension, Unknown if none matches.
ImageFormat format_from_path(const std::string& path);
std::string format_name(ImageFormat format);
bool can_encode(ImageFormat format);

/// Sources with alpha decode to RGBA, the rest to RGB.
bool decode_image(const uint8_t* data, size_t size, ImagePixels& out);
bool resize_image(const ImagePixels& src, int width, int height, ImagePixels& out);
bool encode_image(const ImagePixels& img, ImageFormat format, std::vector<uint8_t>& out);

} // namespace image_io
