#include "options.hpp"

#include "errors.hpp"
#include "utils/image_io.hpp"
#include "utils/resolution.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cxxopts.hpp>
#include <filesystem>
#include <iostream>
#include <string>

namespace {
const char* const kVideoExtensions[] = {
    "mp4", "mov", "mkv", "avi", "webm", "m4v", "wmv", "flv",
};

bool env_debug_enabled() {
    const char* value = std::getenv("DEBUG");
    return value && std::string(value) == "true";
}

std::string preset_list() {
    std::string joined;
    for (const auto& preset : resolution::resolution_presets()) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += preset;
    }
    return joined;
}
} // namespace

MediaKind media_kind_for_path(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext.size() < 2) {
        return MediaKind::Image;
    }
    ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* video : kVideoExtensions) {
        if (ext == video) {
            return MediaKind::Video;
        }
    }
    return MediaKind::Image;
}

bool parse_options(int argc, char** argv, Options& opts) {
    try {
        cxxopts::Options parser("rescale", "Resize an image to a preset resolution");
        parser.add_options()
            ("image", "Input image path", cxxopts::value<std::string>()->default_value(""))
            ("resolution", "Target resolution (WxH, one of the presets)",
                cxxopts::value<std::string>()->default_value(""))
            ("output", "Output path", cxxopts::value<std::string>()->default_value(""))
            ("format", "Output format (webp|png|jpg|bmp|tga), defaults to the output extension",
                cxxopts::value<std::string>()->default_value(""))
            ("debug", "Verbose logging",
                cxxopts::value<bool>()->default_value("false")->implicit_value("true"))
            ("batch", "Batch processing (not implemented, ignored)",
                cxxopts::value<bool>()->default_value("false")->implicit_value("true"))
            ("help", "Print help");

        auto result = parser.parse(argc, argv);
        if (result.count("help")) {
            std::cout << parser.help() << "\nResolutions: " << preset_list() << "\n";
            return false;
        }

        opts.image_path = result["image"].as<std::string>();
        opts.resolution = result["resolution"].as<std::string>();
        opts.output_path = result["output"].as<std::string>();
        opts.output_format = result["format"].as<std::string>();
        opts.debug = result["debug"].as<bool>() || env_debug_enabled();
        opts.batch = result["batch"].as<bool>();
    } catch (const cxxopts::exceptions::exception& ex) {
        throw rescale::ConfigurationError(std::string("Invalid arguments: ") + ex.what());
    }

    validate_options(opts);
    return true;
}

void validate_options(const Options& opts) {
    if (opts.image_path.empty()) {
        throw rescale::ConfigurationError(
            "Image is required. Use --image <image> to specify the image to resize.");
    }
    if (opts.resolution.empty()) {
        throw rescale::ConfigurationError(
            "Resolution is required. Use --resolution <WxH> to specify the target resolution.");
    }
    if (opts.output_path.empty()) {
        throw rescale::ConfigurationError(
            "Output is required. Use --output <output> to specify the output file.");
    }

    if (!resolution::is_resolution_preset(opts.resolution)) {
        throw rescale::ConfigurationError("Invalid arguments: unsupported resolution " +
            opts.resolution + " (expected one of " + preset_list() + ")");
    }
    resolution::parse_resolution(opts.resolution);

    if (!opts.output_format.empty() &&
        !image_io::can_encode(image_io::format_from_name(opts.output_format))) {
        throw rescale::ConfigurationError("Invalid arguments: unsupported output format " +
            opts.output_format);
    }

    if (media_kind_for_path(opts.image_path) == MediaKind::Video) {
        throw rescale::ConfigurationError("Video input is not supported: " + opts.image_path);
    }
}

std::string describe_options(const Options& opts) {
    return "image=" + opts.image_path +
           " resolution=" + opts.resolution +
           " output=" + opts.output_path +
           " format=" + (opts.output_format.empty() ? std::string("auto") : opts.output_format) +
           " debug=" + (opts.debug ? "true" : "false") +
           " batch=" + (opts.batch ? "true" : "false");
}
