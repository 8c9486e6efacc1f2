#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace progress {

constexpr int kDefaultTotal = 100;
constexpr int kDefaultWidth = 20;

/**
 * Single-line terminal progress bar.
 *
 * Renders "<label> [====------] current/total" and redraws in place with a
 * carriage return. The bar ends its line once it reaches the total. Stream
 * errors are left in the stream state and never thrown, so a broken
 * terminal cannot fail the operation being reported.
 */
class ProgressBar {
public:
    ProgressBar(std::string label, std::ostream& out,
                int total = kDefaultTotal, int width = kDefaultWidth);

    /// Set the current ratio, clamped into [0, 1].
    void update(double ratio);
    void render();

    double ratio() const { return ratio_; }
    int current() const;
    int total() const { return total_; }
    bool complete() const { return ratio_ >= 1.0; }
    int updates() const { return updates_; }

private:
    std::string label_;
    std::ostream& out_;
    int total_;
    int width_;
    double ratio_ = 0.0;
    int updates_ = 0;
    bool finished_ = false;
};

/// Output size over the source size, falling back to the output size when
/// the source size is unknown. 0/0 counts as done.
double estimate_ratio(size_t original_size, size_t output_size);

/// Draw the estimated ratio, then draw 1.0.
void report_completion(ProgressBar& bar, size_t original_size, size_t output_size);

} // namespace progress
