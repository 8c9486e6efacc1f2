#include "utils/image_io.hpp"
#include "utils/logger.hpp"

#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

int main() {
    using namespace image_io;

    std::ostringstream log_sink;
    logger::set_sink(&log_sink);

    ImagePixels img;
    img.width = 4;
    img.height = 3;
    img.channels = 4;
    img.pixels.assign(static_cast<size_t>(4 * 3 * 4), 0x80);

    std::vector<uint8_t> png;
    if (!encode_image(img, ImageFormat::Png, png) ||
        detect_format(png.data(), png.size()) != ImageFormat::Png) {
        std::cerr << "PNG encode failed\n";
        return 1;
    }

    ImagePixels decoded;
    if (!decode_image(png.data(), png.size(), decoded) ||
        decoded.width != 4 || decoded.height != 3 || decoded.channels != 4) {
        std::cerr << "RGBA PNG did not decode with its alpha channel\n";
        return 1;
    }

    // Lengths past INT_MAX are refused before stb sees them
    if (sizeof(size_t) > sizeof(int)) {
        const size_t oversized = static_cast<size_t>(std::numeric_limits<int>::max()) + 1;
        ImagePixels untouched;
        if (decode_image(png.data(), oversized, untouched) || untouched.width != 0) {
            std::cerr << "Oversized input length was accepted\n";
            return 1;
        }
        if (log_sink.str().find("too large to decode") == std::string::npos) {
            std::cerr << "Oversized input was not reported\n";
            return 1;
        }
    }

    if (format_from_path("out/photo.JPEG") != ImageFormat::Jpeg ||
        format_from_path("out/photo") != ImageFormat::Unknown ||
        can_encode(ImageFormat::Gif)) {
        std::cerr << "Format naming mismatch\n";
        return 1;
    }

    logger::set_sink(nullptr);
    std::cout << "image_io_test passed\n";
    return 0;
}
