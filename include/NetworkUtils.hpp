#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <sys/types.h>

/**
 * NetworkUtils - Socket level helpers for both connections of a session
 *
 * Provides the raw operations the client needs:
 * - Making the outbound control connection
 * - Listening for and accepting the inbound data connection
 * - Sending and receiving bytes with error checking
 *
 * Failing calls return -1/false and record a description retrievable
 * through getLastError(). This is a utility class with static methods only.
 */
class NetworkUtils {
public:
    /**
     * Connect to a remote host
     *
     * Performs DNS resolution and establishes a TCP connection.
     * Supports both IPv4 and IPv6.
     *
     * @param host Hostname or IP address
     * @param port Port number
     * @return Socket file descriptor on success, -1 on failure
     */
    static int connectToHost(const std::string& host, int port);

    /**
     * Bind to a local port on all interfaces and start listening
     *
     * SO_REUSEADDR is set so the port can be reused right after a
     * previous session released it.
     *
     * @param port Local port number (0 picks an ephemeral port)
     * @param backlog Queue size for pending connections
     * @return Listening socket file descriptor on success, -1 on failure
     */
    static int listenOn(int port, int backlog);

    /**
     * Accept one pending connection on a listening socket
     *
     * Blocks until a peer connects.
     *
     * @param listen_fd Listening socket file descriptor
     * @return Connected socket file descriptor on success, -1 on failure
     */
    static int acceptConnection(int listen_fd);

    /**
     * Local port a socket is bound to
     *
     * @param fd Socket file descriptor
     * @return Port number, -1 on failure
     */
    static int localPort(int fd);

    /**
     * Send complete data to socket
     *
     * Ensures all data is sent or returns error.
     * Handles partial sends automatically.
     *
     * @param fd Socket file descriptor
     * @param data Data to send
     * @param length Length of data in bytes
     * @return true on success, false on failure
     */
    static bool sendData(int fd, const char* data, size_t length);

    /**
     * Receive up to max_length bytes from socket
     *
     * Blocks until at least one byte is available or the peer closes.
     *
     * @param fd Socket file descriptor
     * @param buffer Buffer to store received data
     * @param max_length Maximum bytes to receive
     * @return Number of bytes received, 0 on EOF, -1 on error
     */
    static ssize_t receiveData(int fd, char* buffer, size_t max_length);

    /**
     * Get description of the last failure recorded by this class
     *
     * @return Human-readable error message
     */
    static std::string getLastError();

private:
    static void setLastError(const std::string& context);

    // Utility class - no instances allowed
    NetworkUtils() = delete;
    ~NetworkUtils() = delete;
    NetworkUtils(const NetworkUtils&) = delete;
    NetworkUtils& operator=(const NetworkUtils&) = delete;
};

#endif // NETWORK_UTILS_HPP
