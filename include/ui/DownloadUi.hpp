#pragma once

#include <atomic>
#include <chrono>
#include <thread>

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>

#include "core/DownloadClient.hpp"
#include "utils/ActivityLog.hpp"

class DownloadUi {
public:
    DownloadUi(const DownloadClient& client, const ActivityLog& log);
    ~DownloadUi();

    void Run();

private:
    const DownloadClient& client_;
    const ActivityLog& log_;
    std::atomic<bool> running_{true};
    std::thread update_thread_;
    std::chrono::steady_clock::time_point start_time_;

    ftxui::Component main_component_;

    ftxui::Component BuildUi();
    ftxui::Element Render();
};
