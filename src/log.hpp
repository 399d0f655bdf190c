/*
 * log.hpp - Process-wide diagnostic log
 *
 * Standard output belongs to the descriptor protocol (and, with --fifo=-, to
 * the pcap stream), so diagnostics go to stderr or to the file named by
 * --debug-file. Lines below the threshold are discarded.
 *
 * Usage: Log::init() once after flags are parsed, then the EXTCAP_* macros
 * from any thread:
 *
 *     EXTCAP_DEBUG("interface = %s", name.c_str());
 */

#pragma once

#include <optional>
#include <string>

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

class Log {
public:
    // Set threshold and sink. An unset or blank file means stderr.
    // Returns false if the file could not be opened (stderr is used instead).
    static bool init(LogLevel threshold, const std::optional<std::string>& file = std::nullopt);

    static void set_threshold(LogLevel threshold);
    static LogLevel threshold();
    static bool enabled(LogLevel level);

    static const char* level_name(LogLevel level);

    static void write(LogLevel level, const char* file, unsigned int line,
                      const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
};

#define EXTCAP_DEBUG(fmt, ...) \
    Log::write(LogLevel::DEBUG, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)
#define EXTCAP_INFO(fmt, ...) \
    Log::write(LogLevel::INFO, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)
#define EXTCAP_WARN(fmt, ...) \
    Log::write(LogLevel::WARN, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)
#define EXTCAP_ERROR(fmt, ...) \
    Log::write(LogLevel::ERROR, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)
