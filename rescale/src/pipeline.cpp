#include "pipeline.hpp"

#include "errors.hpp"
#include "utils/file_io.hpp"
#include "utils/logger.hpp"
#include "utils/progress.hpp"
#include "utils/resolution.hpp"

#include <exception>
#include <filesystem>
#include <system_error>

namespace pipeline {

SourceImage open_source(const std::string& path) {
    SourceImage source;
    source.path = path;
    source.data = file_io::read_entire_file(path);
    if (source.data.empty()) {
        throw rescale::DecodeError("Failed to read input file: " + path);
    }

    std::error_code ec;
    const auto on_disk = std::filesystem::file_size(path, ec);
    source.original_size = ec ? 0 : static_cast<size_t>(on_disk);
    source.format = image_io::detect_format(source.data.data(), source.data.size());
    return source;
}

image_io::ImageFormat choose_output_format(const Options& opts,
                                           image_io::ImageFormat source_format) {
    if (!opts.output_format.empty()) {
        const auto requested = image_io::format_from_name(opts.output_format);
        if (!image_io::can_encode(requested)) {
            throw rescale::ConfigurationError("Unsupported output format " + opts.output_format);
        }
        return requested;
    }
    const auto from_path = image_io::format_from_path(opts.output_path);
    if (image_io::can_encode(from_path)) {
        return from_path;
    }
    if (image_io::can_encode(source_format)) {
        return source_format;
    }
    return image_io::ImageFormat::Png;
}

std::vector<uint8_t> resize_image(BaseEngine& engine,
                                  const SourceImage& source,
                                  const std::string& resolution,
                                  const Options& opts,
                                  std::ostream& progress_out) {
    try {
        const auto target = resolution::parse_resolution(resolution);
        const auto format = choose_output_format(opts, source.format);

        const std::string label = "Resizing image " +
            std::filesystem::path(source.path).filename().string() + " to " +
            resolution::to_string(target) + "...";
        progress::ProgressBar bar(label, progress_out);
        bar.update(0.0);
        bar.render();

        if (opts.debug) {
            logger::info("Source " + source.path + ": " + std::to_string(source.original_size) +
                         " bytes, output format " + image_io::format_name(format) +
                         ", engine " + engine.name());
        }

        std::vector<uint8_t> output;
        const bool ok = engine.process_single(source.data.data(), source.data.size(),
            target.width, target.height, format, output);
        if (!ok || output.empty()) {
            throw rescale::TransformProducedEmptyResultError(
                "Failed to resize image. Engine produced no data");
        }

        progress::report_completion(bar, source.original_size, output.size());
        return output;
    } catch (const rescale::Error& e) {
        throw rescale::ResizeError(e.kind(), "Failed to resize image: " + e.message());
    } catch (const std::exception& e) {
        throw rescale::ResizeError(rescale::ErrorKind::Internal,
            std::string("Failed to resize image: ") + e.what());
    }
}

} // namespace pipeline
