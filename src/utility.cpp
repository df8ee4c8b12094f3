/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of segenrich and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "utility.hpp"

// standard
#include <atomic>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace logging {
    // ANSI color codes
    const std::string RESET = "\033[0m";
    const std::string YELLOW = "\033[33m";
    const std::string RED = "\033[31m";

    static std::atomic<bool> progress_on{false};
    static std::mutex output_mutex;

    // Internal helper to get timestamp
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t current_time = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&current_time), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    void info(const std::string& message) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cerr << "[SEGENRICH] " << get_timestamp() << " - " << message << std::endl;
    }

    void warning(const std::string& message) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cerr << YELLOW << "[SEGENRICH] " << get_timestamp() << " - WARNING: " << message << RESET << std::endl;
    }

    void error(const std::string& message) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cerr << RED << "[SEGENRICH] " << get_timestamp() << " - ERROR: " << message << RESET << std::endl;
    }

    void set_progress_enabled(bool enabled) {
        progress_on = enabled;
    }

    void progress_start() {
        if (!progress_on) return;
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cerr << std::flush;
    }

    void progress(size_t done, const std::string& prefix) {
        if (!progress_on) return;
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cerr << "\r[SEGENRICH] " << prefix << ": " << done << std::flush;
    }

    void progress_done(size_t total, const std::string& message) {
        if (!progress_on) return;
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cerr << "\r[SEGENRICH] " << message << ": " << total << " (done)" << std::endl;
    }
}

namespace utility {

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (std::getline(iss, field, delim)) {
        fields.push_back(field);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == delim) {
        fields.emplace_back();
    }
    return fields;
}

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> fields;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t begin = line.find_first_not_of(" \t\r", pos);
        if (begin == std::string::npos) break;
        size_t end = line.find_first_of(" \t\r", begin);
        if (end == std::string::npos) end = line.size();
        fields.push_back(line.substr(begin, end - begin));
        pos = end;
    }
    return fields;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string format_bytes(size_t bytes) {
    if (bytes >= 1024ULL * 1024 * 1024) {
        return std::to_string(bytes / (1024ULL * 1024 * 1024)) + " GB";
    }
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    if (bytes >= 1024) {
        return std::to_string(bytes / 1024) + " KB";
    }
    return std::to_string(bytes) + " B";
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double>(elapsed).count();
}

} // namespace utility
