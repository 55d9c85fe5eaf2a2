#include <future>
#include <iostream>
#include <thread>

#include "core/DownloadClient.hpp"
#include "ui/DownloadUi.hpp"
#include "utils/ActivityLog.hpp"
#include "utils/byte_tools.hpp"

void DownloadThreadFunction(DownloadClient* client,
                            const DownloadOptions& options,
                            std::promise<DownloadResult>& download_promise) {
    try {
        download_promise.set_value(client->Download(options));
    } catch (const std::exception&) {
        download_promise.set_exception(std::current_exception());
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        std::cout << "Usage: " << argv[0] << " <address> <port> [worker_count]" << std::endl;
        return EXIT_FAILURE;
    }

    DownloadOptions options;
    options.endpoint.host = argv[1];

    auto port = utils::ParseUnsigned(argv[2]);
    if (!port || *port == 0 || *port > 65535) {
        std::cerr << "Error: Port must be a number between 1 and 65535" << std::endl;
        return EXIT_FAILURE;
    }
    options.endpoint.port = static_cast<int>(*port);

    if (argc == 4) {
        auto worker_count = utils::ParseUnsigned(argv[3]);
        if (!worker_count || *worker_count == 0) {
            std::cerr << "Error: Worker count must be at least 1" << std::endl;
            return EXIT_FAILURE;
        }
        options.worker_count = static_cast<size_t>(*worker_count);
    }

    ActivityLog log(200, false);
    DownloadClient client(log);

    std::promise<DownloadResult> download_promise;
    std::future<DownloadResult> download_future = download_promise.get_future();

    std::thread download_thread(DownloadThreadFunction,
                                &client,
                                std::cref(options),
                                std::ref(download_promise));

    {
        DownloadUi download_ui(client, log);
        download_ui.Run();
    }
    log.SetEchoToConsole(true);

    if (download_future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        std::cout << "Waiting for the download to finish..." << std::endl;
    }

    if (download_thread.joinable()) {
        download_thread.join();
    }

    try {
        DownloadResult result = download_future.get();
        if (!result.is_complete) {
            std::cerr << "Warning: only " << result.bytes_hashed << " of "
                      << result.total_size << " bytes were hashed" << std::endl;
        }
        std::cout << "SHA-256 hash of the downloaded data: " << result.digest_hex << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Download failed with error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
