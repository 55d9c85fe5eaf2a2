#include "core/DownloadClient.hpp"
#include "utils/ActivityLog.hpp"
#include "utils/byte_tools.hpp"
#include <iostream>
#include <string>
#include <vector>

void PrintUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <address> <port> [worker_count]" << std::endl;
    std::cout << "Example: " << program_name << " 127.0.0.1 8080 4" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -o, --output <file>   Write the downloaded data to <file>" << std::endl;
    std::cout << "  -t, --timeout <ms>    Connect/read timeout in milliseconds (0 = none)" << std::endl;
    std::cout << "  -h, --help            Show this help message" << std::endl;
}

int main(int argc, char *argv[]) {
    DownloadOptions options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            options.output_file = std::filesystem::path(argv[++i]);
        }
        else if ((arg == "-t" || arg == "--timeout") && i + 1 < argc) {
            auto timeout = utils::ParseUnsigned(argv[++i]);
            if (!timeout) {
                std::cerr << "Error: Timeout must be a non-negative number of milliseconds" << std::endl;
                return 1;
            }
            options.connect_timeout = std::chrono::milliseconds(*timeout);
            options.read_timeout = std::chrono::milliseconds(*timeout);
        }
        else if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (arg.empty() || arg[0] != '-') {
            positional.push_back(arg);
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            PrintUsage(argv[0]);
            return 1;
        }
    }

    if (positional.size() < 2 || positional.size() > 3) {
        std::cerr << "Error: Missing address or port" << std::endl;
        PrintUsage(argv[0]);
        return 1;
    }

    options.endpoint.host = positional[0];

    auto port = utils::ParseUnsigned(positional[1]);
    if (!port || *port == 0 || *port > 65535) {
        std::cerr << "Error: Port must be a number between 1 and 65535" << std::endl;
        return 1;
    }
    options.endpoint.port = static_cast<int>(*port);

    if (positional.size() == 3) {
        auto worker_count = utils::ParseUnsigned(positional[2]);
        if (!worker_count || *worker_count == 0) {
            std::cerr << "Error: Worker count must be at least 1" << std::endl;
            return 1;
        }
        options.worker_count = static_cast<size_t>(*worker_count);
    }

    try {
        ActivityLog log;
        DownloadClient client(log);

        std::cout << "Downloading from " << options.endpoint.ToString()
                  << " with " << options.worker_count << " worker(s)" << std::endl;

        DownloadResult result = client.Download(options);

        std::cout << "=== DOWNLOAD FINISHED ===" << std::endl;
        std::cout << "Download time: " << result.elapsed.count() << " ms" << std::endl;
        std::cout << "Downloaded " << result.bytes_hashed << "/" << result.total_size
                  << " bytes (" << utils::FormatBytes(result.bytes_hashed) << ")" << std::endl;
        std::cout << "Chunks merged: " << result.chunks_merged
                  << ", discarded: " << result.chunks_discarded
                  << ", placeholders: " << result.placeholders
                  << ", fallback requests: " << result.fallback_fetches << std::endl;
        if (options.output_file) {
            std::cout << "Output file: " << options.output_file->generic_string() << std::endl;
        }
        std::cout << "SHA-256 hash of the downloaded data: " << result.digest_hex << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
