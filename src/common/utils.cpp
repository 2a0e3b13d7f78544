/*
 * BcmpChat - utility helpers implementation
 */

#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

namespace bcmpchat {

namespace {
std::mutex g_log_mutex;
LogLevel g_current_level = LogLevel::Info;
std::unique_ptr<FileLogger> g_log_file;

const char* kReplacementChar = "\xEF\xBF\xBD";

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "LOG";
    }
}

bool is_continuation(uint8_t byte) {
    return (byte & 0xC0) == 0x80;
}

// Length of the valid UTF-8 sequence starting at data[i], or the length of
// the invalid prefix to replace (as a negative number).
int sequence_length(const uint8_t* data, std::size_t len, std::size_t i) {
    uint8_t lead = data[i];
    if (lead < 0x80) {
        return 1;
    }

    int needed = 0;
    uint8_t lower = 0x80;
    uint8_t upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        needed = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        needed = 2;
        if (lead == 0xE0) {
            lower = 0xA0;
        } else if (lead == 0xED) {
            upper = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        needed = 3;
        if (lead == 0xF0) {
            lower = 0x90;
        } else if (lead == 0xF4) {
            upper = 0x8F;
        }
    } else {
        return -1;
    }

    int consumed = 1;
    for (int k = 0; k < needed; ++k) {
        std::size_t pos = i + 1 + static_cast<std::size_t>(k);
        if (pos >= len) {
            return -consumed;
        }
        uint8_t byte = data[pos];
        bool in_range = (k == 0) ? (byte >= lower && byte <= upper) : is_continuation(byte);
        if (!in_range) {
            return -consumed;
        }
        ++consumed;
    }
    return consumed;
}
} // namespace

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_current_level = level;
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lowered = trim(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "debug" || lowered == "trace") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "error") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (path.empty()) {
        g_log_file.reset();
    } else {
        g_log_file = std::make_unique<FileLogger>(path);
    }
}

void log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(level) < static_cast<int>(g_current_level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now {};
    localtime_r(&now_time, &tm_now);

    std::ostringstream oss;
    oss << "[" << level_to_string(level) << " "
        << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S") << "] " << message;
    std::cerr << oss.str() << std::endl;

    if (g_log_file) {
        try {
            g_log_file->write(oss.str());
        } catch (const std::exception& ex) {
            std::cerr << "[WARN] log file disabled: " << ex.what() << std::endl;
            g_log_file.reset();
        }
    }
}

std::vector<uint8_t> random_bytes(std::size_t count) {
    std::vector<uint8_t> buffer(count);
    if (count == 0) {
        return buffer;
    }
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return buffer;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : data) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::string utf8_lossy(const uint8_t* data, std::size_t len) {
    std::string output;
    output.reserve(len);
    std::size_t i = 0;
    while (i < len) {
        int n = sequence_length(data, len, i);
        if (n > 0) {
            output.append(reinterpret_cast<const char*>(data + i), static_cast<std::size_t>(n));
            i += static_cast<std::size_t>(n);
        } else {
            output += kReplacementChar;
            i += static_cast<std::size_t>(-n);
        }
    }
    return output;
}

std::string utf8_truncate(const std::string& s, std::size_t max_bytes) {
    if (s.size() <= max_bytes) {
        return s;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && is_continuation(static_cast<uint8_t>(s[cut]))) {
        --cut;
    }
    return s.substr(0, cut);
}

std::optional<std::string> env_var(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string trim(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char ch) {
        return std::isspace(ch);
    });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char ch) {
        return std::isspace(ch);
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

FileLogger::FileLogger(std::string path) : path_(std::move(path)) {}

FileLogger::~FileLogger() = default;

void FileLogger::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open log file: " + path_);
    }
    out << line << '\n';
    out.flush();
}

uint16_t parse_port(const std::string& text) {
    const std::string digits = trim(text);
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char ch) {
            return std::isdigit(ch) != 0;
        })) {
        throw std::invalid_argument("invalid port: " + text);
    }
    unsigned long value = std::stoul(digits);
    if (value > 65535) {
        throw std::out_of_range("port out of range: " + text);
    }
    return static_cast<uint16_t>(value);
}

} // namespace bcmpchat
