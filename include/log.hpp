/**
 * log.hpp
 *
 * Leveled logger shared by all device models.
 * Messages below the threshold are dropped but still counted.
 */

#ifndef LOG_HPP
#define LOG_HPP

#include "common.hpp"

enum class LogLevel {
    Noisy,
    Debug,
    Info,
    Warning,
    Error
};

class Logger {
public:
    explicit Logger(std::ostream& out = std::cerr, LogLevel threshold = LogLevel::Warning);

    void log(LogLevel level, const std::string& source, const std::string& message);

    void noisy(const std::string& source, const std::string& message);
    void debug(const std::string& source, const std::string& message);
    void info(const std::string& source, const std::string& message);
    void warning(const std::string& source, const std::string& message);
    void error(const std::string& source, const std::string& message);

    // Threshold and sink
    void set_threshold(LogLevel level);
    LogLevel get_threshold() const;
    void set_output(std::ostream& out);

    // Counters (every call, regardless of threshold)
    uint64_t count(LogLevel level) const;
    void reset_counts();

    static std::string level_name(LogLevel level);
    static std::optional<LogLevel> parse_level(const std::string& name);

private:
    std::ostream* out;
    LogLevel threshold;
    std::array<uint64_t, 5> counts;
};

#endif // LOG_HPP
