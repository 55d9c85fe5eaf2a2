#pragma once

#include <stdexcept>
#include <string>

class IoError : public std::runtime_error {
public:
    enum Kind {
        kConnect = 0,
        kResolve,
        kSend,
        kReceive,
        kTimeout,
        kUnexpectedEof,
    };

    IoError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind(kind) {}

    Kind GetKind() const { return kind; }

private:
    Kind kind;
};

// Response carried no content-length header.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Header block is not text, or the length value is not a number.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IntegrityError : public std::runtime_error {
public:
    enum Kind {
        kOverrun = 0,
    };

    IntegrityError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind(kind) {}

    Kind GetKind() const { return kind; }

private:
    Kind kind;
};
