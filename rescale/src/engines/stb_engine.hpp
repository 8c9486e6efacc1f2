#pragma once

#include "base_engine.hpp"
#include "../utils/image_io.hpp"
#include "../utils/logger.hpp"

/// CPU engine: stb_image / libwebp decode, stb_image_resize2 resample,
/// libwebp / stb_image_write encode.
class StbEngine : public BaseEngine {
public:
    StbEngine() = default;
    bool init(const Options& opts) override;
    bool process_single(const uint8_t* input_data, size_t input_size,
        int width, int height, image_io::ImageFormat output_format,
        std::vector<uint8_t>& output_data) override;
    void cleanup() override;
    std::string name() const override { return "stb"; }

private:
    bool verbose_ = false;
};
