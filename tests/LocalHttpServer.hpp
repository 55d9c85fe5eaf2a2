#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>

// Minimal loopback HTTP server answering range GETs for one resource.
// Connections are served one after another on a background thread.
class LocalHttpServer {
public:
    explicit LocalHttpServer(std::string resource, bool send_content_length = true)
        : resource(std::move(resource)), send_content_length(send_content_length) {
        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd == -1) {
            throw std::runtime_error("socket: " + std::string(strerror(errno)));
        }

        int reuse = 1;
        setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        struct sockaddr_in address;
        std::memset(&address, 0, sizeof(address));
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;

        if (bind(listen_fd, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) != 0 ||
            listen(listen_fd, 64) != 0) {
            close(listen_fd);
            throw std::runtime_error("bind/listen: " + std::string(strerror(errno)));
        }

        socklen_t length = sizeof(address);
        getsockname(listen_fd, reinterpret_cast<struct sockaddr*>(&address), &length);
        port = ntohs(address.sin_port);

        server_thread = std::thread([this]() { AcceptLoop(); });
    }

    ~LocalHttpServer() {
        stopping = true;
        shutdown(listen_fd, SHUT_RDWR);
        if (server_thread.joinable()) {
            server_thread.join();
        }
        close(listen_fd);
    }

    int GetPort() const { return port; }
    size_t RequestsServed() const { return requests_served; }

private:
    void AcceptLoop() {
        while (!stopping) {
            int client = accept(listen_fd, nullptr, nullptr);
            if (client == -1) {
                if (stopping) {
                    return;
                }
                continue;
            }
            Serve(client);
            close(client);
        }
    }

    void Serve(int client) {
        std::string request;
        char buffer[1024];
        while (request.find("\r\n\r\n") == std::string::npos) {
            ssize_t received = recv(client, buffer, sizeof(buffer), 0);
            if (received <= 0) {
                return;
            }
            request.append(buffer, static_cast<size_t>(received));
        }

        std::string body = resource;
        std::string status = "200 OK";

        const std::string kRangePrefix = "Range: bytes=";
        size_t range_pos = request.find(kRangePrefix);
        if (range_pos != std::string::npos) {
            size_t dash = request.find('-', range_pos);
            size_t line_end = request.find("\r\n", range_pos);
            uint64_t first = std::stoull(request.substr(range_pos + kRangePrefix.size(),
                                                        dash - range_pos - kRangePrefix.size()));
            uint64_t last = std::stoull(request.substr(dash + 1, line_end - dash - 1));
            if (first >= resource.size()) {
                body.clear();
            } else {
                last = std::min<uint64_t>(last, resource.size() - 1);
                body = resource.substr(first, last - first + 1);
            }
            status = "206 Partial Content";
        }

        std::string response = "HTTP/1.1 " + status + "\r\n";
        if (send_content_length) {
            response += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        }
        response += "Connection: close\r\n\r\n" + body;

        size_t sent_total = 0;
        while (sent_total < response.size()) {
            ssize_t sent = send(client, response.data() + sent_total,
                                response.size() - sent_total, MSG_NOSIGNAL);
            if (sent <= 0) {
                return;
            }
            sent_total += static_cast<size_t>(sent);
        }
        ++requests_served;
    }

    std::string resource;
    bool send_content_length;
    int listen_fd = -1;
    int port = 0;
    std::atomic<bool> stopping{false};
    std::atomic<size_t> requests_served{0};
    std::thread server_thread;
};
