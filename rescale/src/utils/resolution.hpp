#pragma once

#include <string>
#include <vector>

namespace resolution {

struct Resolution {
    int width = 0;
    int height = 0;
};

inline bool operator==(const Resolution& a, const Resolution& b) {
    return a.width == b.width && a.height == b.height;
}

inline bool operator!=(const Resolution& a, const Resolution& b) {
    return !(a == b);
}

constexpr char kSeparator = 'x';

/// Parse a "WxH" string. Throws rescale::ResolutionFormatError naming the
/// first rule the value breaks (empty, separator, two values, number, > 0).
Resolution parse_resolution(const std::string& value);

/// Supported targets, smallest first.
const std::vector<std::string>& resolution_presets();

bool is_resolution_preset(const std::string& value);

std::string to_string(const Resolution& value);

} // namespace resolution
