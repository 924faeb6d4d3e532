#ifndef FTP_CLIENT_HPP
#define FTP_CLIENT_HPP

#include <string>
#include <vector>

#include "Connection.hpp"
#include "ConnectionFactory.hpp"
#include "Errors.hpp"
#include "FileSink.hpp"
#include "Logger.hpp"
#include "SessionParams.hpp"
#include "SessionReporter.hpp"

struct SessionOutcome {
    SessionResult result;
    std::vector<std::string> trailing_errors;  // ERROR payloads seen while draining, in order

    int exitCode() const { return result.ok() ? 0 : 1; }
};

/**
 * FtpClient - Runs one complete session
 *
 * 1. Open the control connection
 * 2. Negotiate (ControlSession); on refusal skip to 5
 * 3. Listen on the data port and accept the server's data connection
 * 4. Consume the payload (DataSession), which ACKs on the control connection
 * 5. Drain ERROR notifications from the control connection until CLOSE
 *    (only when negotiation succeeded)
 * 6. Close the control connection, whatever happened before
 *
 * TransportError and ProtocolError raised by any step end the session
 * and are returned as the outcome.
 */
class FtpClient {
public:
    static constexpr int DATA_BACKLOG = 5;

    FtpClient(const SessionParams& params, ConnectionFactory& factory, FileSink& sink,
              SessionReporter& reporter, Logger& logger);
    ~FtpClient();

    SessionOutcome runSession();
    void disconnect();

private:
    const SessionParams params;
    ConnectionFactory& factory;
    FileSink& sink;
    SessionReporter& reporter;
    Logger& logger;

    Connection control;

    void drainControl(SessionOutcome& outcome);
};

#endif // FTP_CLIENT_HPP
