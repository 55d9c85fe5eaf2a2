#include "utils/ActivityLog.hpp"

#include <iostream>

ActivityLog::ActivityLog(size_t capacity, bool echo_to_console)
    : capacity(capacity), echo_to_console(echo_to_console) {}

void ActivityLog::Info(const std::string& message) {
    Append(message, false);
}

void ActivityLog::Warning(const std::string& message) {
    Append("WARNING: " + message, true);
}

void ActivityLog::Error(const std::string& message) {
    Append("ERROR: " + message, true);
}

void ActivityLog::Append(std::string line, bool to_stderr) {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (echo_to_console) {
        if (to_stderr) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }

    lines.push_back(std::move(line));
    while (lines.size() > capacity) {
        lines.pop_front();
    }
}

std::vector<std::string> ActivityLog::GetRecent(size_t count) const {
    std::lock_guard<std::mutex> lock(log_mutex);

    size_t start = lines.size() > count ? lines.size() - count : 0;
    return std::vector<std::string>(lines.begin() + start, lines.end());
}

void ActivityLog::SetEchoToConsole(bool echo) {
    std::lock_guard<std::mutex> lock(log_mutex);
    echo_to_console = echo;
}
