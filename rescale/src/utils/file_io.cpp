#include "utils/file_io.hpp"

#include "errors.hpp"
#include "utils/logger.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace file_io {

std::vector<uint8_t> read_entire_file(const std::string& path) {
    logger::info("Reading file from: " + path);
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        logger::warn("Cannot open file: " + path);
        return {};
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>());
}

void persist(const std::vector<uint8_t>& buffer, const std::string& output_path) {
    if (buffer.empty()) {
        throw rescale::PersistenceError("Failed to write image: output buffer is empty");
    }
    if (output_path.empty()) {
        throw rescale::PersistenceError("Failed to write image: output path is empty");
    }

    std::filesystem::path output(output_path);
    if (auto dir = output.parent_path(); !dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw rescale::PersistenceError("Failed to write image: cannot create " +
                dir.string() + ": " + ec.message());
        }
    }

    // Old contents stay in place until the new bytes are complete
    const std::string staging = output_path + ".tmp";
    std::ofstream file(staging, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw rescale::PersistenceError("Failed to write image: cannot open " + staging);
    }
    file.write(reinterpret_cast<const char*>(buffer.data()),
        static_cast<std::streamsize>(buffer.size()));
    file.close();
    std::error_code ec;
    if (file.fail()) {
        std::filesystem::remove(staging, ec);
        throw rescale::PersistenceError("Failed to write image: write to " + staging +
            " failed");
    }

    std::filesystem::rename(staging, output, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(staging, ec);
        throw rescale::PersistenceError("Failed to write image: cannot replace " +
            output_path + ": " + reason);
    }

    logger::info("Image written to " + output_path + " (" + std::to_string(buffer.size()) +
                 " bytes)");
}

} // namespace file_io
