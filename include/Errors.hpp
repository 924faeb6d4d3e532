#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * Raised for any connect/accept/send/receive failure on either socket,
 * including the peer closing the stream before a full packet arrived.
 */
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Raised for malformed framing (bad length prefix, oversized packet,
 * oversized tag).
 */
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};


enum class ErrorKind : uint8_t {
    NONE               = 0,
    TRANSPORT          = 1,
    PROTOCOL           = 2,
    SERVER_REPORTED    = 3,
    LOCAL_PRECONDITION = 4
};

const char* toString(ErrorKind kind);

/**
 * Outcome of one session phase. A default constructed result is a success.
 */
struct SessionResult {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;

    bool ok() const { return kind == ErrorKind::NONE; }

    static SessionResult success() { return SessionResult{}; }

    static SessionResult failure(ErrorKind kind, std::string message) {
        return SessionResult{kind, std::move(message)};
    }
};

#endif // ERRORS_HPP
