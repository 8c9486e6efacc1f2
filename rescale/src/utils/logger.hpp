#pragma once

#include <ostream>
#include <string>

namespace logger {
enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
};

// Default: Level::Warn
void set_level(Level level);
Level level();

// Default: std::clog. Pass nullptr to restore the default.
void set_sink(std::ostream* sink);

void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);
} // namespace logger
