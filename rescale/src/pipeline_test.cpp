#include "engine_factory.hpp"
#include "errors.hpp"
#include "modes/file_mode.hpp"
#include "pipeline.hpp"
#include "utils/file_io.hpp"
#include "utils/image_io.hpp"
#include "utils/logger.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Records calls and returns a canned result.
class FakeEngine : public BaseEngine {
public:
    enum class Behavior { Empty, Fail, Throw };

    explicit FakeEngine(Behavior behavior) : behavior_(behavior) {}

    bool init(const Options&) override { return true; }

    bool process_single(const uint8_t*, size_t, int, int, image_io::ImageFormat,
        std::vector<uint8_t>& output_data) override {
        ++calls;
        output_data.clear();
        if (behavior_ == Behavior::Throw) {
            throw std::runtime_error("codec exploded");
        }
        return behavior_ == Behavior::Empty;
    }

    void cleanup() override {}
    std::string name() const override { return "fake"; }

    int calls = 0;

private:
    Behavior behavior_;
};

std::vector<uint8_t> make_png(int width, int height) {
    image_io::ImagePixels img;
    img.width = width;
    img.height = height;
    img.channels = 3;
    img.pixels.resize(static_cast<size_t>(width) * height * 3);
    for (size_t i = 0; i < img.pixels.size(); ++i) {
        img.pixels[i] = static_cast<uint8_t>((i * 37) & 0xFF);
    }
    std::vector<uint8_t> png;
    if (!image_io::encode_image(img, image_io::ImageFormat::Png, png)) {
        return {};
    }
    return png;
}

Options make_options(const fs::path& image, const std::string& res, const fs::path& output) {
    Options opts;
    opts.image_path = image.string();
    opts.resolution = res;
    opts.output_path = output.string();
    return opts;
}

bool expect_resize_error(BaseEngine& engine, const pipeline::SourceImage& source,
                         const std::string& res, const Options& opts,
                         rescale::ErrorKind cause) {
    std::ostringstream progress_out;
    try {
        pipeline::resize_image(engine, source, res, opts, progress_out);
    } catch (const rescale::ResizeError& e) {
        if (e.cause() != cause) {
            std::cerr << "Unexpected cause for " << res << ": " << e.what() << "\n";
            return false;
        }
        if (std::string(e.what()).find("[RESCALE] Failed to resize image: ") != 0) {
            std::cerr << "Unexpected error shape: " << e.what() << "\n";
            return false;
        }
        return true;
    }
    std::cerr << "resize_image succeeded, expected failure for " << res << "\n";
    return false;
}

} // namespace

int main() {
    std::ostringstream log_sink;
    logger::set_sink(&log_sink);

    const fs::path root = fs::temp_directory_path() / "rescale_pipeline_test";
    fs::remove_all(root);
    fs::create_directories(root);

    const fs::path input = root / "source.png";
    const auto png = make_png(10, 10);
    if (png.empty()) {
        std::cerr << "Could not build test PNG\n";
        return 1;
    }
    file_io::persist(png, input.string());

    const auto source = pipeline::open_source(input.string());
    if (source.original_size != png.size() || source.format != image_io::ImageFormat::Png) {
        std::cerr << "Source metadata mismatch\n";
        return 1;
    }

    // End to end: 10x10 PNG -> 640x480, persisted
    const fs::path output = root / "out" / "resized.png";
    Options opts = make_options(input, "640x480", output);
    auto engine = make_engine(opts);
    if (!engine) {
        std::cerr << "Engine init failed\n";
        return 1;
    }

    std::ostringstream progress_out;
    const auto resized = pipeline::resize_image(*engine, source, opts.resolution, opts, progress_out);
    image_io::ImagePixels decoded;
    if (!image_io::decode_image(resized.data(), resized.size(), decoded) ||
        decoded.width != 640 || decoded.height != 480) {
        std::cerr << "Output is not a 640x480 image\n";
        return 1;
    }
    if (progress_out.str().find("Resizing image source.png to 640x480...") == std::string::npos ||
        progress_out.str().find("100/100\n") == std::string::npos) {
        std::cerr << "Progress did not reach 100%: " << progress_out.str() << "\n";
        return 1;
    }

    file_io::persist(resized, opts.output_path);
    if (!fs::exists(output) || fs::file_size(output) == 0) {
        std::cerr << "Output file missing or empty\n";
        return 1;
    }

    // Invalid resolution fails before the engine runs and nothing is written
    const fs::path never = root / "never.png";
    Options zero = make_options(input, "0x100", never);
    FakeEngine counting(FakeEngine::Behavior::Empty);
    if (!expect_resize_error(counting, source, zero.resolution, zero,
                             rescale::ErrorKind::ResolutionFormat)) {
        return 1;
    }
    if (counting.calls != 0) {
        std::cerr << "Engine ran for an invalid resolution\n";
        return 1;
    }
    if (run_file_mode(&counting, zero, progress_out) != 1 || fs::exists(never)) {
        std::cerr << "File mode wrote output for an invalid resolution\n";
        return 1;
    }
    if (counting.calls != 0) {
        std::cerr << "Engine ran in file mode for an invalid resolution\n";
        return 1;
    }

    // Engine results that carry no data
    FakeEngine empty(FakeEngine::Behavior::Empty);
    if (!expect_resize_error(empty, source, "640x480", opts, rescale::ErrorKind::TransformEmpty)) {
        return 1;
    }
    FakeEngine failing(FakeEngine::Behavior::Fail);
    if (!expect_resize_error(failing, source, "640x480", opts, rescale::ErrorKind::TransformEmpty)) {
        return 1;
    }
    FakeEngine throwing(FakeEngine::Behavior::Throw);
    if (!expect_resize_error(throwing, source, "640x480", opts, rescale::ErrorKind::Internal)) {
        return 1;
    }

    // Undecodable input through the real engine
    pipeline::SourceImage garbage;
    garbage.path = "garbage.png";
    garbage.data = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05};
    if (!expect_resize_error(*engine, garbage, "640x480", opts, rescale::ErrorKind::TransformEmpty)) {
        return 1;
    }

    bool missing_rejected = false;
    try {
        pipeline::open_source((root / "missing.png").string());
    } catch (const rescale::DecodeError&) {
        missing_rejected = true;
    }
    if (!missing_rejected) {
        std::cerr << "Missing source opened\n";
        return 1;
    }

    // Output format selection
    using image_io::ImageFormat;
    Options fmt = make_options(input, "640x480", root / "a.webp");
    if (pipeline::choose_output_format(fmt, ImageFormat::Png) != ImageFormat::Webp) {
        std::cerr << "Output extension ignored\n";
        return 1;
    }
    fmt.output_format = "jpg";
    if (pipeline::choose_output_format(fmt, ImageFormat::Png) != ImageFormat::Jpeg) {
        std::cerr << "--format ignored\n";
        return 1;
    }
    fmt.output_format.clear();
    fmt.output_path = (root / "noext").string();
    if (pipeline::choose_output_format(fmt, ImageFormat::Bmp) != ImageFormat::Bmp ||
        pipeline::choose_output_format(fmt, ImageFormat::Gif) != ImageFormat::Png) {
        std::cerr << "Source format fallback wrong\n";
        return 1;
    }

    // Whole run through file mode, webp output
    const fs::path webp_out = root / "run.webp";
    Options run = make_options(input, "320x240", webp_out);
    if (run_file_mode(engine.get(), run, progress_out) != 0 || !fs::exists(webp_out)) {
        std::cerr << "File mode failed: " << log_sink.str() << "\n";
        return 1;
    }
    const auto webp = file_io::read_entire_file(webp_out.string());
    image_io::ImagePixels webp_pixels;
    if (image_io::detect_format(webp.data(), webp.size()) != ImageFormat::Webp ||
        !image_io::decode_image(webp.data(), webp.size(), webp_pixels) ||
        webp_pixels.width != 320 || webp_pixels.height != 240) {
        std::cerr << "File mode output is not a 320x240 WebP\n";
        return 1;
    }

    engine->cleanup();
    logger::set_sink(nullptr);
    fs::remove_all(root);
    std::cout << "pipeline_test passed\n";
    return 0;
}
