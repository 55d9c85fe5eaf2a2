#pragma once

#include <string>

struct Endpoint {
    std::string host;
    int port;

    // "host:port", also used as the Host header value
    std::string ToString() const {
        return host + ":" + std::to_string(port);
    }
};
