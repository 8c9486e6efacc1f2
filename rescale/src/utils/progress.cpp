#include "utils/progress.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace progress {

ProgressBar::ProgressBar(std::string label, std::ostream& out, int total, int width)
    : label_(std::move(label)),
      out_(out),
      total_(std::max(1, total)),
      width_(std::max(1, width)) {}

void ProgressBar::update(double ratio) {
    if (std::isnan(ratio)) {
        ratio = 0.0;
    }
    ratio_ = std::clamp(ratio, 0.0, 1.0);
    ++updates_;
}

int ProgressBar::current() const {
    return static_cast<int>(std::floor(ratio_ * total_));
}

void ProgressBar::render() {
    if (finished_) {
        return;
    }
    const int filled = static_cast<int>(std::round(ratio_ * width_));
    std::string bar(static_cast<size_t>(filled), '=');
    bar.append(static_cast<size_t>(width_ - filled), '-');

    out_ << '\r' << label_ << " [" << bar << "] " << current() << '/' << total_;
    if (complete()) {
        out_ << '\n';
        finished_ = true;
    }
    out_.flush();
}

double estimate_ratio(size_t original_size, size_t output_size) {
    const size_t denominator = original_size > 0 ? original_size : output_size;
    if (denominator == 0) {
        return 1.0;
    }
    return std::min(1.0, static_cast<double>(output_size) / static_cast<double>(denominator));
}

void report_completion(ProgressBar& bar, size_t original_size, size_t output_size) {
    bar.update(estimate_ratio(original_size, output_size));
    bar.render();
    bar.update(1.0);
    bar.render();
}

} // namespace progress
