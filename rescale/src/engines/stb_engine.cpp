#include "stb_engine.hpp"

#include <string>
#include <utility>

bool StbEngine::init(const Options& opts) {
    verbose_ = opts.debug;
    return true;
}

bool StbEngine::process_single(const uint8_t* input_data, size_t input_size,
    int width, int height, image_io::ImageFormat output_format,
    std::vector<uint8_t>& output_data) {
    output_data.clear();

    image_io::ImagePixels source;
    if (!image_io::decode_image(input_data, input_size, source)) {
        logger::error("StbEngine: failed to decode input image");
        return false;
    }
    if (verbose_) {
        logger::info("StbEngine: decoded " + std::to_string(source.width) + "x" +
                     std::to_string(source.height) + " (" + std::to_string(source.channels) +
                     " channels)");
    }

    image_io::ImagePixels resized;
    if (!image_io::resize_image(source, width, height, resized)) {
        logger::error("StbEngine: resample to " + std::to_string(width) + "x" +
                      std::to_string(height) + " failed");
        return false;
    }
    // Source pixels are no longer needed; release before encoding
    source = image_io::ImagePixels();

    if (!image_io::encode_image(resized, output_format, output_data)) {
        logger::error("StbEngine: failed to encode output as " +
                      image_io::format_name(output_format));
        output_data.clear();
        return false;
    }

    return true;
}

void StbEngine::cleanup() {}
