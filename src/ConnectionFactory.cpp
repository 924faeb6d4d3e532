#include "ConnectionFactory.hpp"
#include "Errors.hpp"
#include "NetworkUtils.hpp"


Connection TcpConnectionFactory::connect(const std::string& host, int port) {
    int fd = NetworkUtils::connectToHost(host, port);
    if (fd < 0) {
        throw TransportError(NetworkUtils::getLastError());
    }
    return Connection(fd);
}

Connection TcpConnectionFactory::acceptOne(int port, int backlog) {
    Connection listener(NetworkUtils::listenOn(port, backlog));
    if (!listener.isOpen()) {
        throw TransportError(NetworkUtils::getLastError());
    }

    int fd = NetworkUtils::acceptConnection(listener.fd());
    if (fd < 0) {
        throw TransportError(NetworkUtils::getLastError());
    }
    return Connection(fd);
}
