#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "net/Endpoint.hpp"
#include "net/Stream.hpp"
#include "utils/ActivityLog.hpp"

class RangeFetcher {
public:
    virtual ~RangeFetcher() = default;

    // Requests bytes [first, last], both inclusive. The result may be shorter
    // than requested or empty. Throws IoError, ProtocolError or DecodeError.
    virtual std::string FetchRange(uint64_t first, uint64_t last) = 0;
};

// One short-lived connection per request, so a single instance can be shared
// by all worker threads.
class HttpRangeFetcher : public RangeFetcher {
public:
    HttpRangeFetcher(Endpoint endpoint,
                     std::chrono::milliseconds connect_timeout,
                     std::chrono::milliseconds read_timeout,
                     ActivityLog& log);

    std::string FetchRange(uint64_t first, uint64_t last) override;
    uint64_t ProbeResourceSize() const;

    const Endpoint& GetEndpoint() const;

private:
    const Endpoint endpoint;
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds read_timeout;
    ActivityLog& log;
};

// Writes an unranged GET to an already connected stream and returns the
// declared Content-Length. ProtocolError when the header is missing,
// DecodeError when it cannot be decoded.
uint64_t ProbeResourceSize(Stream& stream, const std::string& host);
