#include "net/HttpMessage.hpp"

#include <algorithm>

#include "utils/Errors.hpp"
#include "utils/byte_tools.hpp"

namespace {

constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
constexpr size_t kReadSize = 16384;

}

HttpRequest HttpRequest::Init(const std::string& host) {
    return { host, std::nullopt, std::nullopt };
}

HttpRequest HttpRequest::InitRanged(const std::string& host, uint64_t first, uint64_t last) {
    return { host, first, last };
}

std::string HttpRequest::ToString() const {
    std::string request = "GET / HTTP/1.1\r\n";
    request += "Host: " + host + "\r\n";
    if (range_first && range_last) {
        request += "Range: bytes=" + std::to_string(*range_first) + "-" +
                   std::to_string(*range_last) + "\r\n";
    }
    request += "Connection: close\r\n\r\n";
    return request;
}

std::optional<uint64_t> HttpResponse::ParseContentLength(std::string_view headers) {
    if (!utils::IsValidUtf8(headers)) {
        throw DecodeError("Response headers are not valid UTF-8");
    }

    size_t line_start = 0;
    while (line_start < headers.size()) {
        size_t line_end = headers.find('\n', line_start);
        if (line_end == std::string_view::npos) {
            line_end = headers.size();
        }
        std::string_view line = headers.substr(line_start, line_end - line_start);
        line_start = line_end + 1;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        if (utils::ToLower(utils::Trim(line.substr(0, colon))) != "content-length") {
            continue;
        }

        std::string_view value = utils::Trim(line.substr(colon + 1));
        auto length = utils::ParseUnsigned(value);
        if (!length) {
            throw DecodeError("Invalid Content-Length value: '" + std::string(value) + "'");
        }
        return length;
    }
    return std::nullopt;
}

HttpResponse HttpResponse::Read(Stream& stream) {
    std::string buffer;
    size_t terminator_pos = std::string::npos;

    while (terminator_pos == std::string::npos) {
        std::string data = stream.ReceiveSome(kReadSize);
        if (data.empty()) {
            throw IoError(IoError::kUnexpectedEof,
                          "Stream closed before end of headers (" +
                          std::to_string(buffer.size()) + " bytes read)");
        }

        // the terminator may straddle two reads
        size_t search_from = buffer.size() >= kHeaderTerminator.size() - 1
            ? buffer.size() - (kHeaderTerminator.size() - 1)
            : 0;
        buffer += data;
        terminator_pos = buffer.find(kHeaderTerminator, search_from);
    }

    HttpResponse response;
    response.headers = buffer.substr(0, terminator_pos);
    response.body = buffer.substr(terminator_pos + kHeaderTerminator.size());

    try {
        response.content_length = ParseContentLength(response.headers);
    } catch (const DecodeError& e) {
        response.content_length = std::nullopt;
        response.header_error = e.what();
    }

    if (!response.content_length) {
        return response;
    }

    const uint64_t expected = *response.content_length;
    while (response.body.size() < expected) {
        std::string data = stream.ReceiveSome(
            static_cast<size_t>(std::min<uint64_t>(kReadSize, expected - response.body.size())));
        if (data.empty()) {
            break;
        }
        response.body += data;
    }

    if (response.body.size() > expected) {
        response.body.resize(static_cast<size_t>(expected));
    }
    return response;
}
