#pragma once

#include "engines/base_engine.hpp"
#include "engines/stb_engine.hpp"
#include "options.hpp"

#include <memory>

std::unique_ptr<BaseEngine> make_engine(const Options& opts);
