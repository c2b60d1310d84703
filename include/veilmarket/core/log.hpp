#pragma once

#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace veilmarket::log {

// ============================================================================
// Tagged Stream Logging
// ============================================================================

enum class Level : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/// Minimum level that is written (default: Warn)
Level threshold();
void set_threshold(Level level);

/// Redirect output (default: std::clog). Stream must outlive its use
void set_sink(std::ostream& sink);

/// Write "[component] level: message" if level passes the threshold
void write(Level level, std::string_view component, std::string_view message);

inline bool enabled(Level level) {
    return level >= threshold() && level != Level::Off;
}

/// Stream-style builder: log::Line(Level::Info, "Ledger") << "Offer #" << id;
/// Flushes on destruction
class Line {
private:
    Level level_;
    std::string_view component_;
    std::ostringstream buffer_;
    bool active_;

public:
    Line(Level level, std::string_view component)
        : level_(level), component_(component), active_(enabled(level)) {}

    ~Line() {
        if (active_) {
            write(level_, component_, buffer_.str());
        }
    }

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template<typename T>
    Line& operator<<(const T& value) {
        if (active_) {
            buffer_ << value;
        }
        return *this;
    }
};

} // namespace veilmarket::log
