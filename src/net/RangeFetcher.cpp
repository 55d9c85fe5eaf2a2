#include "net/RangeFetcher.hpp"

#include "net/HttpMessage.hpp"
#include "net/TcpConnection.hpp"
#include "utils/Errors.hpp"

uint64_t ProbeResourceSize(Stream& stream, const std::string& host) {
    stream.SendData(HttpRequest::Init(host).ToString());
    HttpResponse response = HttpResponse::Read(stream);

    auto length = HttpResponse::ParseContentLength(response.headers);
    if (!length) {
        throw ProtocolError("Content-Length not found in response from " + host);
    }
    return *length;
}

HttpRangeFetcher::HttpRangeFetcher(Endpoint endpoint,
                                   std::chrono::milliseconds connect_timeout,
                                   std::chrono::milliseconds read_timeout,
                                   ActivityLog& log)
    : endpoint(std::move(endpoint)),
      connect_timeout(connect_timeout),
      read_timeout(read_timeout),
      log(log) {}

uint64_t HttpRangeFetcher::ProbeResourceSize() const {
    TcpConnection connection(endpoint, connect_timeout, read_timeout);
    connection.EstablishConnection();
    return ::ProbeResourceSize(connection, endpoint.ToString());
}

std::string HttpRangeFetcher::FetchRange(uint64_t first, uint64_t last) {
    TcpConnection connection(endpoint, connect_timeout, read_timeout);
    connection.EstablishConnection();
    connection.SendData(HttpRequest::InitRanged(endpoint.ToString(), first, last).ToString());

    HttpResponse response = HttpResponse::Read(connection);
    if (response.header_error) {
        log.Warning("Range " + std::to_string(first) + "-" + std::to_string(last) +
                    ": " + *response.header_error + ", using " +
                    std::to_string(response.body.size()) + " bytes already received");
    }
    return std::move(response.body);
}

const Endpoint& HttpRangeFetcher::GetEndpoint() const {
    return endpoint;
}
