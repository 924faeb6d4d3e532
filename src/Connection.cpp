#include <unistd.h>
#include <utility>

#include "Connection.hpp"
#include "Errors.hpp"
#include "NetworkUtils.hpp"


Connection::Connection(int fd)
    : socket_fd{fd} {}

Connection::~Connection() {
    close();
}

Connection::Connection(Connection&& other) noexcept
    : socket_fd{std::exchange(other.socket_fd, -1)} {}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        socket_fd = std::exchange(other.socket_fd, -1);
    }
    return *this;
}

void Connection::sendAll(const char* data, size_t length) {
    if (socket_fd == -1) {
        throw TransportError("Send on a closed connection");
    }
    if (!NetworkUtils::sendData(socket_fd, data, length)) {
        throw TransportError(NetworkUtils::getLastError());
    }
}

size_t Connection::receiveSome(char* buffer, size_t max_length) {
    if (socket_fd == -1) {
        throw TransportError("Receive on a closed connection");
    }
    ssize_t received = NetworkUtils::receiveData(socket_fd, buffer, max_length);
    if (received < 0) {
        throw TransportError(NetworkUtils::getLastError());
    }
    return static_cast<size_t>(received);
}

void Connection::close() {
    if (socket_fd != -1) {
        ::close(socket_fd);
        socket_fd = -1;
    }
}
