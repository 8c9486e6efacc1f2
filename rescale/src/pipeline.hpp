#pragma once

#include "engines/base_engine.hpp"
#include "options.hpp"
#include "utils/image_io.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace pipeline {

/// Encoded source bytes plus the metadata the pipeline needs. The pixels
/// are only decoded by the engine inside resize_image.
struct SourceImage {
    std::string path;
    std::vector<uint8_t> data;
    size_t original_size = 0;  // On-disk size, 0 when unknown
    image_io::ImageFormat format = image_io::ImageFormat::Unknown;
};

/// Read path and record its size once. Throws rescale::DecodeError when the
/// file cannot be read or is empty.
SourceImage open_source(const std::string& path);

/// --format, then the output extension, then the source format, then PNG.
image_io::ImageFormat choose_output_format(const Options& opts,
                                           image_io::ImageFormat source_format);

/**
 * Resize source to the WxH named by resolution.
 *
 * The resolution string is validated again here even if the caller already
 * did it. Progress is drawn on progress_out: 0% before the engine runs, the
 * size-based estimate and 100% after it returns.
 *
 * Every failure comes out as rescale::ResizeError whose cause() is the kind
 * of the original error.
 */
std::vector<uint8_t> resize_image(BaseEngine& engine,
                                  const SourceImage& source,
                                  const std::string& resolution,
                                  const Options& opts,
                                  std::ostream& progress_out);

} // namespace pipeline
