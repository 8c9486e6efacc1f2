#pragma once

#include <string>

struct Options {
    std::string image_path;
    std::string resolution;
    std::string output_path;
    std::string output_format;  // Empty: follow the output extension, then the source
    bool debug = false;
    bool batch = false;  // Accepted for compatibility, no effect
};

/// Returns false when --help was printed. Throws rescale::ConfigurationError
/// (or rescale::ResolutionFormatError) on invalid arguments.
bool parse_options(int argc, char** argv, Options& opts);

/// Checks required fields, the preset allow-list, the resolution shape, the
/// format name and rejects video inputs.
void validate_options(const Options& opts);

enum class MediaKind { Image, Video };
MediaKind media_kind_for_path(const std::string& path);

std::string describe_options(const Options& opts);
