/*
 * BcmpChat - utility helpers
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bcmpchat {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level);

// Accepts debug, info, warn and error (any case).
std::optional<LogLevel> parse_log_level(const std::string& name);

// Mirrors every log line into the given file. An empty path disables it.
void set_log_file(const std::string& path);

void log(LogLevel level, const std::string& message);

inline void log_info(const std::string& message) {
    log(LogLevel::Info, message);
}

inline void log_warn(const std::string& message) {
    log(LogLevel::Warn, message);
}

inline void log_error(const std::string& message) {
    log(LogLevel::Error, message);
}

inline void log_debug(const std::string& message) {
    log(LogLevel::Debug, message);
}

std::vector<uint8_t> random_bytes(std::size_t count);

std::string hex_encode(const std::vector<uint8_t>& data);

// Decodes UTF-8, replacing every invalid sequence with U+FFFD.
std::string utf8_lossy(const uint8_t* data, std::size_t len);

// Cuts s to at most max_bytes without splitting a UTF-8 sequence.
std::string utf8_truncate(const std::string& s, std::size_t max_bytes);

std::optional<std::string> env_var(const char* name);

std::string trim(const std::string& input);

// Decimal TCP port. Throws std::invalid_argument for anything that is not
// all digits and std::out_of_range above 65535.
uint16_t parse_port(const std::string& text);

class FileLogger {
public:
    explicit FileLogger(std::string path);
    ~FileLogger();

    void write(const std::string& line);

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace bcmpchat
