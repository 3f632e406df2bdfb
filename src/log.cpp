/**
 * log.cpp
 *
 * Implementation of the leveled logger.
 */

#include "log.hpp"
#include <algorithm>

Logger::Logger(std::ostream& out, LogLevel threshold)
    : out(&out), threshold(threshold) {
    counts.fill(0);
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
    counts[static_cast<size_t>(level)]++;
    if (level < threshold) return;

    *out << "[" << level_name(level) << "] " << source << ": " << message << "\n";
}

void Logger::noisy(const std::string& source, const std::string& message) {
    log(LogLevel::Noisy, source, message);
}

void Logger::debug(const std::string& source, const std::string& message) {
    log(LogLevel::Debug, source, message);
}

void Logger::info(const std::string& source, const std::string& message) {
    log(LogLevel::Info, source, message);
}

void Logger::warning(const std::string& source, const std::string& message) {
    log(LogLevel::Warning, source, message);
}

void Logger::error(const std::string& source, const std::string& message) {
    log(LogLevel::Error, source, message);
}

void Logger::set_threshold(LogLevel level) {
    threshold = level;
}

LogLevel Logger::get_threshold() const {
    return threshold;
}

void Logger::set_output(std::ostream& stream) {
    out = &stream;
}

uint64_t Logger::count(LogLevel level) const {
    return counts[static_cast<size_t>(level)];
}

void Logger::reset_counts() {
    counts.fill(0);
}

std::string Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Noisy: return "NOISY";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

std::optional<LogLevel> Logger::parse_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), ::tolower);

    if (n == "noisy") return LogLevel::Noisy;
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warning" || n == "warn") return LogLevel::Warning;
    if (n == "error") return LogLevel::Error;
    return std::nullopt;
}
