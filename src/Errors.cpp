#include "Errors.hpp"

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:               return "none";
        case ErrorKind::TRANSPORT:          return "transport error";
        case ErrorKind::PROTOCOL:           return "protocol error";
        case ErrorKind::SERVER_REPORTED:    return "server error";
        case ErrorKind::LOCAL_PRECONDITION: return "local error";
    }
    return "unknown";
}
