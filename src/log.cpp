/*
 * log.cpp - Process-wide diagnostic log implementation
 *
 * One mutex guards the sink so lines from the control-pipe pumps and the
 * capture routine never interleave.
 */

#include "log.hpp"
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace {

std::mutex log_mutex;
std::atomic<LogLevel> log_threshold{LogLevel::WARN};
std::ofstream log_file;

const char* base_name(const char* path) {
    const char* base = path;
    for (const char* p = path; *p != '\0'; ++p) {
        if (*p == '/') {
            base = p + 1;
        }
    }
    return base;
}

std::string format_message(const char* fmt, va_list ap) {
    va_list copy;
    va_copy(copy, ap);
    int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);

    if (needed <= 0) {
        return std::string();
    }

    std::vector<char> buf(static_cast<size_t>(needed) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, ap);
    return std::string(buf.data(), static_cast<size_t>(needed));
}

}  // namespace

bool Log::init(LogLevel threshold, const std::optional<std::string>& file) {
    set_threshold(threshold);

    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }

    if (!file || file->find_first_not_of(" \t") == std::string::npos) {
        return true;
    }

    log_file.open(*file, std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << "cannot open debug file '" << *file << "', logging to stderr\n";
        return false;
    }
    return true;
}

void Log::set_threshold(LogLevel threshold) {
    log_threshold.store(threshold);
}

LogLevel Log::threshold() {
    return log_threshold.load();
}

bool Log::enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(log_threshold.load());
}

const char* Log::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

void Log::write(LogLevel level, const char* file, unsigned int line,
                const char* func, const char* fmt, ...) {
    if (!enabled(level)) {
        return;
    }

    va_list ap;
    va_start(ap, fmt);
    std::string message = format_message(fmt, ap);
    va_end(ap);

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << " | " << level_name(level);
    oss << " | " << base_name(file) << ":" << line << " " << func << "()";
    oss << " | " << message << "\n";

    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file << oss.str();
        log_file.flush();
    } else {
        std::cerr << oss.str();
    }
}
