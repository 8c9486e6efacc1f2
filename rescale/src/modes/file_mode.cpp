#include "file_mode.hpp"

#include "../errors.hpp"
#include "../pipeline.hpp"
#include "../utils/file_io.hpp"
#include "../utils/logger.hpp"

#include <exception>
#include <string>
#include <vector>

int run_file_mode(BaseEngine* engine, const Options& opts, std::ostream& progress_out) {
    logger::info("Running file mode");
    if (!engine) {
        logger::error("Engine missing");
        return 1;
    }

    if (opts.batch) {
        logger::warn("--batch is not implemented, processing a single file");
    }

    try {
        const auto source = pipeline::open_source(opts.image_path);
        std::vector<uint8_t> output =
            pipeline::resize_image(*engine, source, opts.resolution, opts, progress_out);
        file_io::persist(output, opts.output_path);
    } catch (const rescale::Error& e) {
        logger::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        logger::error(std::string(rescale::kErrorPrefix) + "Failed to process image: " + e.what());
        return 1;
    }

    if (opts.debug) {
        logger::info("Image resized and written to " + opts.output_path);
    }
    return 0;
}
