#pragma once

#include "../options.hpp"
#include "../engines/base_engine.hpp"

#include <ostream>

/// Read --image, resize it, write --output. Returns the process exit code.
int run_file_mode(BaseEngine* engine, const Options& opts, std::ostream& progress_out);
