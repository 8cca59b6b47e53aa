#pragma once
#include "types.hpp"
#include <iosfwd>
#include <string>

namespace mockmcp {

/// Leveled diagnostics for the server process. Writes to a side channel
/// (stderr by default) since stdout carries the protocol.
class Logger {
public:
    explicit Logger(std::string name,
                    LogLevel min_level = LogLevel::Warning,
                    std::ostream* sink = nullptr);

    [[nodiscard]] bool enabled(LogLevel level) const { return level >= min_level_; }

    /// Emit "[name] level: message" if `level` passes the threshold.
    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message)   { log(LogLevel::Debug, message); }
    void info(const std::string& message)    { log(LogLevel::Info, message); }
    void warning(const std::string& message) { log(LogLevel::Warning, message); }
    void error(const std::string& message)   { log(LogLevel::Error, message); }

private:
    std::string name_;
    LogLevel min_level_;
    std::ostream* sink_;
};

} // namespace mockmcp
