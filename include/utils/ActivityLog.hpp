#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>

// Operator-facing log: echoes to the console and keeps the most recent
// lines for the terminal UI.
class ActivityLog {
public:
    explicit ActivityLog(size_t capacity = 200, bool echo_to_console = true);

    void Info(const std::string& message);
    void Warning(const std::string& message);
    void Error(const std::string& message);

    std::vector<std::string> GetRecent(size_t count) const;
    void SetEchoToConsole(bool echo);

private:
    void Append(std::string line, bool to_stderr);

    mutable std::mutex log_mutex;
    std::deque<std::string> lines;
    size_t capacity;
    bool echo_to_console;
};
