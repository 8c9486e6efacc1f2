#pragma once

#include "../options.hpp"
#include "../utils/image_io.hpp"
#include <cstdint>
#include <string>
#include <vector>

class BaseEngine {
public:
    virtual ~BaseEngine() = default;
    virtual bool init(const Options& opts) = 0;

    /// Decode an encoded image, resample it to width x height and encode it
    /// as output_format. Returns false (or leaves output_data empty) when no
    /// image could be produced.
    virtual bool process_single(const uint8_t* input_data, size_t input_size,
        int width, int height, image_io::ImageFormat output_format,
        std::vector<uint8_t>& output_data) = 0;

    virtual void cleanup() = 0;

    virtual std::string name() const = 0;
};
