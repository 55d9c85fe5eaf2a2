#pragma once

#include <string>

// Bidirectional byte stream as seen by the HTTP layer.
class Stream {
public:
    virtual ~Stream() = default;

    virtual void SendData(const std::string& data) = 0;

    // Returns at most max_bytes. An empty result means the peer closed the
    // stream.
    virtual std::string ReceiveSome(size_t max_bytes) = 0;
};
