#ifndef CONNECTION_FACTORY_HPP
#define CONNECTION_FACTORY_HPP

#include <string>

#include "Connection.hpp"

/**
 * ConnectionFactory - Where a session gets its two sockets from
 *
 * The control connection is opened outbound. The data connection is the
 * reverse: the client listens on the data port and the server connects in.
 * Both operations throw TransportError on failure.
 */
class ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;

    virtual Connection connect(const std::string& host, int port) = 0;

    /**
     * Listen on port and accept exactly one inbound connection. The
     * listening socket does not outlive the call.
     */
    virtual Connection acceptOne(int port, int backlog) = 0;
};


/** TCP implementation backed by NetworkUtils */
class TcpConnectionFactory : public ConnectionFactory {
public:
    Connection connect(const std::string& host, int port) override;
    Connection acceptOne(int port, int backlog) override;
};

#endif // CONNECTION_FACTORY_HPP
