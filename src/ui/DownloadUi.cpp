#include "ui/DownloadUi.hpp"

#include <sstream>

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

using namespace std::chrono_literals;

namespace {

std::string FormatDuration(std::chrono::seconds duration) {
    auto hours = std::chrono::duration_cast<std::chrono::hours>(duration);
    duration -= hours;
    auto minutes = std::chrono::duration_cast<std::chrono::minutes>(duration);
    duration -= minutes;
    auto seconds = duration;

    std::ostringstream oss;
    if (hours.count() > 0) {
        oss << hours.count() << "h ";
    }
    if (minutes.count() > 0 || hours.count() > 0) {
        oss << minutes.count() << "m ";
    }
    oss << seconds.count() << "s";
    return oss.str();
}

ftxui::Element InfoRow(const std::string& label, ftxui::Element value) {
    using namespace ftxui;
    return hbox({
        filler(),
        text(label) | bold,
        std::move(value),
        filler()
    });
}

}

DownloadUi::DownloadUi(const DownloadClient& client, const ActivityLog& log) :
    client_(client),
    log_(log)
{
    main_component_ = BuildUi();
    start_time_ = std::chrono::steady_clock::now();
}

DownloadUi::~DownloadUi() {
    running_ = false;
    if (update_thread_.joinable()) {
        update_thread_.join();
    }
}

ftxui::Component DownloadUi::BuildUi() {
    using namespace ftxui;

    return Renderer([this] {
        return Render();
    });
}

ftxui::Element DownloadUi::Render() {
    using namespace ftxui;

    auto task = client_.GetCurrentTask();
    auto logs = log_.GetRecent(30);

    auto header = hbox({
        text(" RANGE FETCH ") | bold | inverted | center
    }) | center | border;

    Color status_color = Color::GrayLight;
    switch (task.status) {
        case DownloadStatus::kDownloading:
        case DownloadStatus::kCompleting:
            status_color = Color::GreenLight;
            break;
        case DownloadStatus::kCompleted:
            status_color = Color::CyanLight;
            break;
        case DownloadStatus::kError:
            status_color = Color::RedLight;
            break;
        case DownloadStatus::kIncomplete:
            status_color = Color::YellowLight;
            break;
        default:
            status_color = Color::GrayLight;
    }

    Elements task_info;
    task_info.push_back(InfoRow("Server: ", text(task.target)));
    task_info.push_back(InfoRow("Status: ", text(task.GetStatusString()) | bold | color(status_color)));

    if (task.total_size > 0) {
        task_info.push_back(InfoRow("Hashed: ",
            text(task.GetFormattedHashed() + " / " + task.GetFormattedSize())));
        task_info.push_back(InfoRow("Buffered out of order: ",
            text(std::to_string(task.pending_bytes) + " bytes")));
    }

    task_info.push_back(InfoRow("Workers: ", text(task.GetWorkersString())));
    task_info.push_back(InfoRow("Chunks: ",
        text(std::to_string(task.chunks_fetched) + " fetched, " +
             std::to_string(task.placeholders) + " placeholders, " +
             std::to_string(task.fallback_fetches) + " fallback")));

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_);
    task_info.push_back(InfoRow("Time elapsed: ", text(FormatDuration(elapsed))));

    if (!task.digest_hex.empty()) {
        task_info.push_back(InfoRow("SHA-256: ", text(task.digest_hex) | color(Color::CyanLight)));
    }
    if (!task.error_message.empty()) {
        task_info.push_back(InfoRow("Error: ", text(task.error_message) | color(Color::RedLight)));
    }

    task_info.push_back(text(""));

    const int kBarWidth = 50;
    int filled = static_cast<int>((task.progress / 100.0) * kBarWidth);

    std::string progress_bar;
    for (int i = 0; i < kBarWidth; ++i) {
        progress_bar += i < filled ? "#" : ".";
    }

    task_info.push_back(hbox({
        text("["),
        text(progress_bar) | color(Color::GreenLight),
        text("] "),
        text(task.GetFormattedProgress()) | bold
    }) | center);

    auto info_panel = window(
        text(" DOWNLOAD INFO ") | bold | center,
        vbox(task_info) | frame | size(HEIGHT, LESS_THAN, 20)
    );

    Elements log_entries;
    for (const auto& line : logs) {
        std::string log_text = line;
        if (log_text.length() > 90) {
            log_text = log_text.substr(0, 87) + "...";
        }

        Color log_color = Color::GrayLight;
        if (log_text.rfind("ERROR:", 0) == 0) {
            log_color = Color::RedLight;
        } else if (log_text.rfind("WARNING:", 0) == 0) {
            log_color = Color::YellowLight;
        }
        log_entries.push_back(text(log_text) | color(log_color));
    }

    auto log_panel = window(
        text(" ACTIVITY LOG ") | bold | center,
        vbox(log_entries) | frame | flex
    );

    auto footer = hbox({
        text(" Press "),
        text(" Q ") | bold | inverted,
        text(" to quit ")
    }) | center | dim;

    return vbox({
        header,
        separator(),
        info_panel,
        separator(),
        log_panel | flex,
        separator(),
        footer
    });
}

void DownloadUi::Run() {
    using namespace ftxui;

    auto screen = ScreenInteractive::Fullscreen();
    auto component = main_component_ | CatchEvent([&](Event event) {
        if (event == Event::Character('q') ||
            event == Event::Character('Q') ||
            event == Event::Escape) {
            screen.Exit();
            return true;
        }
        return false;
    });

    update_thread_ = std::thread([this, &screen]() {
        while (running_) {
            std::this_thread::sleep_for(500ms);
            screen.PostEvent(Event::Custom);
        }
    });

    screen.Loop(component);

    running_ = false;
    if (update_thread_.joinable()) {
        update_thread_.join();
    }
}
