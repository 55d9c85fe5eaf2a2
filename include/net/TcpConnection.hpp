#pragma once

#include <sys/socket.h>

#include <chrono>
#include <string>

#include "net/Endpoint.hpp"
#include "net/Stream.hpp"

class TcpConnection : public Stream {
public:
    // A zero timeout waits indefinitely.
    TcpConnection(Endpoint endpoint,
                  std::chrono::milliseconds connect_timeout,
                  std::chrono::milliseconds read_timeout);
    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    void EstablishConnection();
    void SendData(const std::string& data) override;
    std::string ReceiveSome(size_t max_bytes) override;
    void CloseConnection();

    const Endpoint& GetEndpoint() const;
    bool IsConnected() const;

private:
    void ConnectSocket(int fd, const struct sockaddr* address, socklen_t address_length) const;
    int PollTimeout(std::chrono::milliseconds timeout) const;

    const Endpoint endpoint;
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds read_timeout;
    int socket_fd;
};
