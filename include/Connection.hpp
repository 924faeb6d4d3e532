#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <cstddef>

/**
 * Connection - Owns one connected stream socket
 *
 * The descriptor is closed when the Connection is closed, reassigned or
 * destroyed. Send and receive failures throw TransportError.
 */
class Connection {
public:
    Connection() = default;
    explicit Connection(int fd);
    ~Connection();

    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /** Send every byte, looping over partial sends */
    void sendAll(const char* data, size_t length);

    /** One receive call; returns 0 once the peer has closed the stream */
    size_t receiveSome(char* buffer, size_t max_length);

    void close();

    bool isOpen() const { return socket_fd != -1; }
    int fd() const { return socket_fd; }

private:
    int socket_fd = -1;
};

#endif // CONNECTION_HPP
