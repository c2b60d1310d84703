#include "veilmarket/core/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace veilmarket::log {

namespace {

std::atomic<Level> g_threshold{Level::Warn};
std::atomic<std::ostream*> g_sink{&std::clog};
std::mutex g_write_mutex;

const char* level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Off:   return "off";
    }
    return "?";
}

} // anonymous namespace

Level threshold() {
    return g_threshold.load(std::memory_order_relaxed);
}

void set_threshold(Level level) {
    g_threshold.store(level, std::memory_order_relaxed);
}

void set_sink(std::ostream& sink) {
    g_sink.store(&sink, std::memory_order_release);
}

void write(Level level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    // Reconciler tasks log from several threads
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::ostream& out = *g_sink.load(std::memory_order_acquire);
    out << "[" << component << "] " << level_tag(level) << ": " << message << std::endl;
}

} // namespace veilmarket::log
