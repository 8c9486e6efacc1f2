#include "utils/logger.hpp"

#include <atomic>
#include <iostream>

namespace logger {
namespace {
std::atomic<int> g_level{static_cast<int>(Level::Warn)};
std::atomic<std::ostream*> g_sink{nullptr};

std::ostream& sink() {
    std::ostream* out = g_sink.load(std::memory_order_relaxed);
    return out ? *out : std::clog;
}

bool enabled(Level level) {
    return g_level.load(std::memory_order_relaxed) >= static_cast<int>(level);
}
} // namespace

void set_level(Level level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

void set_sink(std::ostream* out) {
    g_sink.store(out, std::memory_order_relaxed);
}

void info(const std::string& message) {
    if (!enabled(Level::Info)) {
        return;
    }
    sink() << "[INFO] " << message << "\n";
}

void warn(const std::string& message) {
    if (!enabled(Level::Warn)) {
        return;
    }
    sink() << "[WARN] " << message << "\n";
}

void error(const std::string& message) {
    sink() << "[ERROR] " << message << "\n";
}
} // namespace logger
