#include "NetworkUtils.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {
    thread_local std::string last_error;
}

// ====================================================================================================
// Connection Management
// ====================================================================================================

int NetworkUtils::connectToHost(const std::string& host, int port) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;      // IPv4 or IPv6
    hints.ai_socktype = SOCK_STREAM;  // TCP

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);

    // Perform DNS resolution
    int err = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0) {
        last_error = "Could not resolve \"" + host + "\": " + gai_strerror(err);
        return -1;
    }

    // Try each resolved address until one accepts the connection
    int sock_fd = -1;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        sock_fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock_fd < 0) {
            setLastError("Failed to create socket");
            continue;
        }

        if (connect(sock_fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        setLastError("Failed to connect to " + host + ":" + port_str);
        close(sock_fd);
        sock_fd = -1;
    }

    freeaddrinfo(res);
    return sock_fd;
}

int NetworkUtils::listenOn(int port, int backlog) {
    int sock_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (sock_fd < 0) {
        setLastError("Failed to create socket");
        return -1;
    }

    // Set Socket Options to Allow Reuse of Address
    int opt = 1;
    if (setsockopt(sock_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        setLastError("Failed to set socket options");
        close(sock_fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(sock_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        setLastError("Failed to bind to port " + std::to_string(port));
        close(sock_fd);
        return -1;
    }

    if (listen(sock_fd, backlog) < 0) {
        setLastError("Failed to listen on port " + std::to_string(port));
        close(sock_fd);
        return -1;
    }

    return sock_fd;
}

int NetworkUtils::acceptConnection(int listen_fd) {
    sockaddr_storage peer_addr{};
    socklen_t peer_len = sizeof(peer_addr);

    int client_fd;
    do {
        client_fd = accept(listen_fd, reinterpret_cast<struct sockaddr*>(&peer_addr), &peer_len);
    } while (client_fd < 0 && errno == EINTR);

    if (client_fd < 0) {
        setLastError("Failed to accept connection");
        return -1;
    }
    return client_fd;
}

int NetworkUtils::localPort(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        setLastError("Failed to query socket name");
        return -1;
    }

    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
}

// ====================================================================================================
// Data Transmission
// ====================================================================================================

bool NetworkUtils::sendData(int fd, const char* data, size_t length) {
    size_t total_sent = 0;

    while (total_sent < length) {
        // MSG_NOSIGNAL: a closed peer surfaces as EPIPE instead of killing the process
        ssize_t sent = send(fd, data + total_sent, length - total_sent, MSG_NOSIGNAL);

        if (sent < 0) {
            if (errno == EINTR) continue;
            setLastError("Send failed");
            return false;
        }

        if (sent == 0) {
            last_error = "Connection closed during send";
            return false;
        }

        total_sent += sent;
    }

    return true;
}

// ====================================================================================================
// Data Reception
// ====================================================================================================

ssize_t NetworkUtils::receiveData(int fd, char* buffer, size_t max_length) {
    ssize_t received;
    do {
        received = recv(fd, buffer, max_length, 0);
    } while (received < 0 && errno == EINTR);

    if (received < 0) {
        setLastError("Receive failed");
        return -1;
    }

    // 0 means the peer closed the connection
    return received;
}

// ====================================================================================================
// Error Handling
// ====================================================================================================

std::string NetworkUtils::getLastError() {
    return last_error;
}

void NetworkUtils::setLastError(const std::string& context) {
    last_error = context + " (" + std::strerror(errno) + ")";
}
