#ifndef CONTROL_SESSION_HPP
#define CONTROL_SESSION_HPP

#include <cstdint>
#include <string>

#include "Connection.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "SessionParams.hpp"
#include "SessionReporter.hpp"

/**
 * ControlSession - Negotiation over the control connection
 *
 * One synchronous round trip:
 * 1. DPORT with the data port as decimal text
 * 2. LIST, or GET with the filename
 * 3. One response; ERROR carries the reason the request was refused
 *
 * Transport faults propagate as TransportError and leave the state where
 * the failing step found it.
 */
class ControlSession {
public:
    enum class State : uint8_t {
        INIT,
        SENT_DPORT,
        SENT_COMMAND,
        OK,
        FAILED
    };

    ControlSession(Connection& control, const SessionParams& params,
                   SessionReporter& reporter, Logger& logger);

    SessionResult run();

    State state() const { return current_state; }

private:
    Connection& control;
    const SessionParams& params;
    SessionReporter& reporter;
    Logger& logger;
    State current_state = State::INIT;

    void send(const std::string& tag, const std::string& data);
};

#endif // CONTROL_SESSION_HPP
