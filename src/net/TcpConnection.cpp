#include "net/TcpConnection.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <sys/poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "utils/Errors.hpp"

TcpConnection::TcpConnection(Endpoint endpoint,
                             std::chrono::milliseconds connect_timeout,
                             std::chrono::milliseconds read_timeout) :
      endpoint(std::move(endpoint)),
      connect_timeout(connect_timeout),
      read_timeout(read_timeout),
      socket_fd(-1)
{}

TcpConnection::~TcpConnection() {
    CloseConnection();
}

void TcpConnection::CloseConnection() {
    if (socket_fd != -1) {
        shutdown(socket_fd, SHUT_RDWR);
        close(socket_fd);
        socket_fd = -1;
    }
}

bool TcpConnection::IsConnected() const {
    return socket_fd != -1;
}

int TcpConnection::PollTimeout(std::chrono::milliseconds timeout) const {
    return timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;
}

void TcpConnection::EstablishConnection() {
    CloseConnection();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addresses = nullptr;
    std::string port = std::to_string(endpoint.port);
    int code = getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &addresses);
    if (code != 0) {
        throw IoError(IoError::kResolve,
                      "Failed to resolve " + endpoint.host + ": " + gai_strerror(code));
    }

    std::string last_error = "no usable address";
    for (struct addrinfo* address = addresses; address != nullptr; address = address->ai_next) {
        int fd = socket(address->ai_family, address->ai_socktype, address->ai_protocol);
        if (fd == -1) {
            last_error = "Failed to create socket: " + std::string(strerror(errno));
            continue;
        }

        try {
            ConnectSocket(fd, address->ai_addr, address->ai_addrlen);
        } catch (const IoError& e) {
            close(fd);
            last_error = e.what();
            continue;
        }

        socket_fd = fd;
        break;
    }
    freeaddrinfo(addresses);

    if (socket_fd == -1) {
        throw IoError(IoError::kConnect,
                      "Cannot connect to " + endpoint.ToString() + ": " + last_error);
    }
}

void TcpConnection::ConnectSocket(int fd, const struct sockaddr* address,
                                  socklen_t address_length) const {
    int current_state = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, current_state | O_NONBLOCK);

    int code = connect(fd, address, address_length);
    if (code != 0) {
        if (errno != EINPROGRESS) {
            throw IoError(IoError::kConnect, "Socket connection error: " + std::string(strerror(errno)));
        }

        struct pollfd poll_fd;
        poll_fd.fd = fd;
        poll_fd.events = POLLOUT;
        code = poll(&poll_fd, 1, PollTimeout(connect_timeout));
        switch (code) {
            case -1:
                throw IoError(IoError::kConnect, "Poll error: " + std::string(strerror(errno)));

            case 0:
                throw IoError(IoError::kTimeout, "Connection timeout");

            default: {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
                if (so_error != 0) {
                    throw IoError(IoError::kConnect, "Socket connection error: " + std::string(strerror(so_error)));
                }
                break;
            }
        }
    }

    current_state = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, current_state & ~O_NONBLOCK);
}

void TcpConnection::SendData(const std::string& data) {
    if (socket_fd == -1) {
        throw IoError(IoError::kSend, "Connection closed");
    }

    size_t sent_total = 0;
    while (sent_total < data.size()) {
        ssize_t sent = send(socket_fd, data.data() + sent_total, data.size() - sent_total, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IoError(IoError::kSend, "Send error: " + std::string(strerror(errno)));
        }
        sent_total += static_cast<size_t>(sent);
    }
}

std::string TcpConnection::ReceiveSome(size_t max_bytes) {
    if (socket_fd == -1) {
        throw IoError(IoError::kReceive, "Connection closed");
    }

    struct pollfd fd;
    fd.fd = socket_fd;
    fd.events = POLLIN;
    int code = poll(&fd, 1, PollTimeout(read_timeout));

    switch (code) {
        case -1:
            throw IoError(IoError::kReceive, "Poll error: " + std::string(strerror(errno)));

        case 0:
            throw IoError(IoError::kTimeout, "Read timeout");

        default:
            break;
    }

    constexpr size_t kBufferSize = 16384;
    char buffer[kBufferSize];
    size_t read_size = max_bytes == 0 ? kBufferSize : std::min(kBufferSize, max_bytes);

    ssize_t received;
    do {
        received = recv(socket_fd, buffer, read_size, 0);
    } while (received < 0 && errno == EINTR);

    if (received < 0) {
        throw IoError(IoError::kReceive, "Read error: " + std::string(strerror(errno)));
    }

    return std::string(buffer, static_cast<size_t>(received));
}

const Endpoint& TcpConnection::GetEndpoint() const {
    return endpoint;
}
