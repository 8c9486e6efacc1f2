#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <limits>
#include <utility>
#include <webp/decode.h>
#include <webp/encode.h>
#include <webp/types.h>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_FAILURE_USERMSG
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include "stb_image_resize2.h"

#include "utils/image_io.hpp"
#include "utils/logger.hpp"

namespace {
constexpr int kQuality = 90;

void write_callback(void* user, void* data, int size) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(user);
    const auto* src = static_cast<const uint8_t*>(data);
    buffer->insert(buffer->end(), src, src + size);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// RAII wrapper for STB image data
struct STBImageRAII {
    stbi_uc* pixels = nullptr;

    STBImageRAII() = default;

    ~STBImageRAII() {
        if (pixels) {
            stbi_image_free(pixels);
            pixels = nullptr;
        }
    }

    // Non-copyable
    STBImageRAII(const STBImageRAII&) = delete;
    STBImageRAII& operator=(const STBImageRAII&) = delete;

    stbi_uc* get() { return pixels; }
    void reset(stbi_uc* p) {
        if (pixels) {
            stbi_image_free(pixels);
        }
        pixels = p;
    }
};

// RAII wrapper for pixels returned by the WebP decoder
struct WebPDecodedRAII {
    uint8_t* pixels = nullptr;

    WebPDecodedRAII() = default;

    ~WebPDecodedRAII() {
        if (pixels) {
            WebPFree(pixels);
        }
    }

    WebPDecodedRAII(const WebPDecodedRAII&) = delete;
    WebPDecodedRAII& operator=(const WebPDecodedRAII&) = delete;

    uint8_t* get() { return pixels; }
};

// RAII wrapper for WebPMemoryWriter
struct WebPMemoryWriterRAII {
    WebPMemoryWriter writer;

    WebPMemoryWriterRAII() {
        WebPMemoryWriterInit(&writer);
    }

    ~WebPMemoryWriterRAII() {
        WebPMemoryWriterClear(&writer);
    }

    WebPMemoryWriterRAII(const WebPMemoryWriterRAII&) = delete;
    WebPMemoryWriterRAII& operator=(const WebPMemoryWriterRAII&) = delete;

    WebPMemoryWriter* get() { return &writer; }
};

// RAII wrapper for WebPPicture
struct WebPPictureRAII {
    WebPPicture pic;
    bool initialized = false;

    WebPPictureRAII() {
        initialized = WebPPictureInit(&pic) != 0;
    }

    ~WebPPictureRAII() {
        if (initialized) {
            WebPPictureFree(&pic);
        }
    }

    // Non-copyable, non-movable (WebPPicture contains pointers)
    WebPPictureRAII(const WebPPictureRAII&) = delete;
    WebPPictureRAII& operator=(const WebPPictureRAII&) = delete;
    WebPPictureRAII(WebPPictureRAII&&) = delete;
    WebPPictureRAII& operator=(WebPPictureRAII&&) = delete;

    WebPPicture* get() { return initialized ? &pic : nullptr; }
    bool is_initialized() const { return initialized; }
};

bool decode_webp(const uint8_t* data, size_t size, image_io::ImagePixels& out) {
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data, size, &features) != VP8_STATUS_OK) {
        return false;
    }

    int width = 0;
    int height = 0;
    const int channels = features.has_alpha ? 4 : 3;
    WebPDecodedRAII decoded;
    decoded.pixels = features.has_alpha
        ? WebPDecodeRGBA(data, size, &width, &height)
        : WebPDecodeRGB(data, size, &width, &height);
    if (!decoded.get()) {
        return false;
    }

    out.width = width;
    out.height = height;
    out.channels = channels;
    out.pixels.assign(decoded.get(),
        decoded.get() + static_cast<size_t>(width) * height * channels);
    return true;
}

bool encode_webp(const image_io::ImagePixels& img, std::vector<uint8_t>& out) {
    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        return false;
    }
    config.quality = kQuality;

    WebPPictureRAII pic_raii;
    if (!pic_raii.is_initialized()) {
        return false;
    }

    WebPPicture* pic = pic_raii.get();
    pic->width = img.width;
    pic->height = img.height;

    WebPMemoryWriterRAII writer_raii;
    pic->writer = WebPMemoryWrite;
    pic->custom_ptr = writer_raii.get();

    const int stride = img.width * img.channels;
    const int imported = img.channels == 4
        ? WebPPictureImportRGBA(pic, img.pixels.data(), stride)
        : WebPPictureImportRGB(pic, img.pixels.data(), stride);
    if (!imported) {
        return false;
    }

    const bool ok = WebPEncode(&config, pic) != 0;
    if (ok) {
        WebPMemoryWriter* writer = writer_raii.get();
        out.assign(writer->mem, writer->mem + writer->size);
    }
    return ok;
}
} // namespace

namespace image_io {

ImageFormat detect_format(const uint8_t* data, size_t size) {
    if (!data || size < 4) {
        return ImageFormat::Unknown;
    }
    static const uint8_t kPng[] = {0x89, 'P', 'N', 'G'};
    if (std::memcmp(data, kPng, sizeof(kPng)) == 0) {
        return ImageFormat::Png;
    }
    if (data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return ImageFormat::Jpeg;
    }
    if (size >= 12 && std::memcmp(data, "RIFF", 4) == 0 && std::memcmp(data + 8, "WEBP", 4) == 0) {
        return ImageFormat::Webp;
    }
    if (data[0] == 'B' && data[1] == 'M') {
        return ImageFormat::Bmp;
    }
    if (std::memcmp(data, "GIF8", 4) == 0) {
        return ImageFormat::Gif;
    }
    // TGA has no magic; anything stb accepts otherwise is reported as Other
    return ImageFormat::Other;
}

ImageFormat format_from_name(const std::string& name) {
    const std::string fmt = lowercase(name);
    if (fmt == "png") {
        return ImageFormat::Png;
    }
    if (fmt == "jpg" || fmt == "jpeg") {
        return ImageFormat::Jpeg;
    }
    if (fmt == "webp") {
        return ImageFormat::Webp;
    }
    if (fmt == "bmp") {
        return ImageFormat::Bmp;
    }
    if (fmt == "tga") {
        return ImageFormat::Tga;
    }
    if (fmt == "gif") {
        return ImageFormat::Gif;
    }
    return ImageFormat::Unknown;
}

ImageFormat format_from_path(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext.empty()) {
        return ImageFormat::Unknown;
    }
    return format_from_name(ext.substr(1));
}

std::string format_name(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png: return "png";
        case ImageFormat::Jpeg: return "jpg";
        case ImageFormat::Webp: return "webp";
        case ImageFormat::Bmp: return "bmp";
        case ImageFormat::Tga: return "tga";
        case ImageFormat::Gif: return "gif";
        case ImageFormat::Other: return "other";
        case ImageFormat::Unknown: break;
    }
    return "unknown";
}

bool can_encode(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png:
        case ImageFormat::Jpeg:
        case ImageFormat::Webp:
        case ImageFormat::Bmp:
        case ImageFormat::Tga:
            return true;
        default:
            return false;
    }
}

bool decode_image(const uint8_t* data, size_t size, ImagePixels& out) {
    if (!data || size == 0) {
        return false;
    }
    // stb takes the length as int
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        logger::warn("Input of " + std::to_string(size) + " bytes is too large to decode");
        return false;
    }

    if (detect_format(data, size) == ImageFormat::Webp) {
        return decode_webp(data, size, out);
    }

    int width, height, channels;
    if (!stbi_info_from_memory(data, static_cast<int>(size), &width, &height, &channels)) {
        logger::warn(std::string("stb_image: ") + stbi_failure_reason());
        return false;
    }
    const int desired = (channels == 2 || channels == 4) ? 4 : 3;

    STBImageRAII pixels_raii;
    pixels_raii.reset(stbi_load_from_memory(
        data,
        static_cast<int>(size),
        &width,
        &height,
        &channels,
        desired
    ));

    if (!pixels_raii.get()) {
        logger::warn(std::string("stb_image: ") + stbi_failure_reason());
        return false;
    }

    out.width = width;
    out.height = height;
    out.channels = desired;
    out.pixels.assign(pixels_raii.get(),
        pixels_raii.get() + static_cast<size_t>(width) * height * desired);
    return true;
}

bool resize_image(const ImagePixels& src, int width, int height, ImagePixels& out) {
    if (src.width <= 0 || src.height <= 0 || width <= 0 || height <= 0) {
        return false;
    }
    if (src.channels != 3 && src.channels != 4) {
        return false;
    }

    out.width = width;
    out.height = height;
    out.channels = src.channels;
    out.pixels.assign(static_cast<size_t>(width) * height * src.channels, 0);

    const stbir_pixel_layout layout = src.channels == 4 ? STBIR_RGBA : STBIR_RGB;
    return stbir_resize_uint8_srgb(src.pixels.data(), src.width, src.height, 0,
        out.pixels.data(), width, height, 0, layout) != nullptr;
}

bool encode_image(const ImagePixels& img, ImageFormat format, std::vector<uint8_t>& out) {
    out.clear();
    if (img.width <= 0 || img.height <= 0 || img.pixels.empty()) {
        return false;
    }

    const int stride = img.width * img.channels;
    switch (format) {
        case ImageFormat::Webp:
            return encode_webp(img, out);
        case ImageFormat::Png:
            return stbi_write_png_to_func(write_callback, &out, img.width, img.height,
                img.channels, img.pixels.data(), stride) != 0;
        case ImageFormat::Jpeg:
            return stbi_write_jpg_to_func(write_callback, &out, img.width, img.height,
                img.channels, img.pixels.data(), kQuality) != 0;
        case ImageFormat::Bmp:
            return stbi_write_bmp_to_func(write_callback, &out, img.width, img.height,
                img.channels, img.pixels.data()) != 0;
        case ImageFormat::Tga:
            return stbi_write_tga_to_func(write_callback, &out, img.width, img.height,
                img.channels, img.pixels.data()) != 0;
        default:
            return false;
    }
}

} // namespace image_io
