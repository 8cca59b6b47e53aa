#include "mockmcp/log.hpp"
#include <iostream>

namespace mockmcp {

Logger::Logger(std::string name, LogLevel min_level, std::ostream* sink)
    : name_(std::move(name)), min_level_(min_level), sink_(sink ? sink : &std::cerr) {
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;
    *sink_ << '[' << name_ << "] " << log_level_to_string(level) << ": " << message << std::endl;
}

} // namespace mockmcp
