#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace file_io {

/// Empty vector when the file cannot be opened.
std::vector<uint8_t> read_entire_file(const std::string& path);

/// Write buffer to path, replacing any existing file and creating missing
/// parent directories. Returns once the bytes are flushed; throws
/// rescale::PersistenceError on an empty buffer or any I/O failure.
void persist(const std::vector<uint8_t>& buffer, const std::string& output_path);

} // namespace file_io
