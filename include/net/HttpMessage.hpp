#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "net/Stream.hpp"

struct HttpRequest {
    std::string host;
    std::optional<uint64_t> range_first;
    std::optional<uint64_t> range_last;

    static HttpRequest Init(const std::string& host);
    static HttpRequest InitRanged(const std::string& host, uint64_t first, uint64_t last);
    std::string ToString() const;
};

struct HttpResponse {
    std::string headers;
    std::string body;
    std::optional<uint64_t> content_length;
    // set when the length header was present but undecodable
    std::optional<std::string> header_error;

    /*
     * Reads one response from `stream`, after the request has been written.
     *
     * Accumulates reads until the "\r\n\r\n" terminator; a closed stream
     * before that throws IoError(kUnexpectedEof). When a content-length
     * header is present, keeps reading until that many body bytes arrived
     * or the stream closes, whichever comes first; the body is never longer
     * than the declared length. Without a usable length header the body is
     * whatever arrived together with the headers.
     */
    static HttpResponse Read(Stream& stream);

    // Throws DecodeError if the block is not UTF-8 or the value is not a
    // non-negative integer. nullopt when the header is absent.
    static std::optional<uint64_t> ParseContentLength(std::string_view headers);
};
