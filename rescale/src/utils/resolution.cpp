#include "utils/resolution.hpp"

#include "errors.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

namespace resolution {
namespace {
bool parse_int(const std::string& token, int& value) {
    const char* first = token.data();
    const char* last = token.data() + token.size();
    // from_chars rejects '+' and whitespace, accepts a leading '-'
    auto [ptr, ec] = std::from_chars(first, last, value, 10);
    return ec == std::errc() && ptr == last;
}
} // namespace

Resolution parse_resolution(const std::string& value) {
    using rescale::ResolutionFault;
    using rescale::ResolutionFormatError;

    if (value.empty()) {
        throw ResolutionFormatError(ResolutionFault::Empty, "Resolution is required");
    }

    const auto separators = std::count(value.begin(), value.end(), kSeparator);
    if (separators == 0) {
        throw ResolutionFormatError(ResolutionFault::Separator,
            "Resolution does not contain an " + std::string(1, kSeparator) + ": " + value);
    }
    if (separators > 1) {
        throw ResolutionFormatError(ResolutionFault::Separator,
            "Resolution contains more than one " + std::string(1, kSeparator) + ": " + value);
    }

    const auto pos = value.find(kSeparator);
    const std::string width_token = value.substr(0, pos);
    const std::string height_token = value.substr(pos + 1);
    if (width_token.empty() || height_token.empty()) {
        throw ResolutionFormatError(ResolutionFault::TwoValues,
            "Resolution does not contain two values: " + value);
    }

    Resolution parsed;
    if (!parse_int(width_token, parsed.width) || !parse_int(height_token, parsed.height)) {
        throw ResolutionFormatError(ResolutionFault::NotANumber,
            "Resolution does not contain integer values: " + value);
    }

    if (parsed.width <= 0 || parsed.height <= 0) {
        throw ResolutionFormatError(ResolutionFault::NonPositive,
            "Resolution is 0 or less: " + value);
    }

    return parsed;
}

const std::vector<std::string>& resolution_presets() {
    static const std::vector<std::string> presets = {
        // SD
        "320x240", "640x480", "800x600",
        // HD
        "1024x768", "1280x720", "1280x800", "1366x768",
        // Full HD
        "1600x900", "1920x1080",
        // 2K class
        "2048x1080", "2560x1080", "2560x1440", "3440x1440", "3840x1600",
        // 4K
        "3840x2160", "4096x2160", "5120x2160", "5120x2880",
        // 6K
        "6016x3384", "6144x3160",
        // 8K
        "7680x4320", "8192x4320",
    };
    return presets;
}

bool is_resolution_preset(const std::string& value) {
    const auto& presets = resolution_presets();
    return std::find(presets.begin(), presets.end(), value) != presets.end();
}

std::string to_string(const Resolution& value) {
    return std::to_string(value.width) + kSeparator + std::to_string(value.height);
}

} // namespace resolution
