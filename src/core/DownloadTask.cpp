#include "core/DownloadTask.hpp"

#include <iomanip>
#include <sstream>

#include "utils/byte_tools.hpp"

std::string DownloadTask::GetFormattedSize() const {
    return utils::FormatBytes(total_size);
}

std::string DownloadTask::GetFormattedHashed() const {
    return utils::FormatBytes(bytes_hashed);
}

std::string DownloadTask::GetFormattedProgress() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << progress << "%";
    return oss.str();
}

std::string DownloadTask::GetStatusString() const {
    switch (status) {
        default:
        case DownloadStatus::kIdle:
            return "Idle";
        case DownloadStatus::kProbing:
            return "Probing size";
        case DownloadStatus::kDownloading:
            return "Downloading";
        case DownloadStatus::kCompleting:
            return "Filling gaps";
        case DownloadStatus::kCompleted:
            return "Completed";
        case DownloadStatus::kIncomplete:
            return "Incomplete";
        case DownloadStatus::kError:
            return "Error";
    }
}

std::string DownloadTask::GetWorkersString() const {
    std::ostringstream oss;
    oss << active_workers << "/" << total_workers;
    return oss.str();
}
