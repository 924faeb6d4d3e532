#include <string>

#include "ControlSession.hpp"
#include "Protocol.hpp"


ControlSession::ControlSession(Connection& control, const SessionParams& params,
                               SessionReporter& reporter, Logger& logger)
    : control{control}, params{params}, reporter{reporter}, logger{logger} {}


SessionResult ControlSession::run() {
    // Announce where the server should connect for the data connection
    reporter.onStatus("  Transmitting data port ...");
    send(Protocol::Tag::DPORT, std::to_string(params.data_port));
    current_state = State::SENT_DPORT;

    reporter.onStatus("  Transmitting command ...");
    send(commandTag(params.command), params.filename.value_or(""));
    current_state = State::SENT_COMMAND;

    Protocol::Packet response = Protocol::receivePacket(control);
    logger.logPacketReceived("control", response);

    if (response.tag == Protocol::Tag::ERROR) {
        current_state = State::FAILED;
        reporter.onError(response.text());
        return SessionResult::failure(ErrorKind::SERVER_REPORTED, response.text());
    }

    // Any other tag counts as the go-ahead
    if (response.tag != Protocol::Tag::OKAY) {
        logger.logCustomMsg("Unexpected negotiation response \"" + response.tag + "\" treated as success");
    }
    current_state = State::OK;
    return SessionResult::success();
}


void ControlSession::send(const std::string& tag, const std::string& data) {
    Protocol::sendPacket(control, tag, data);
    logger.logPacketSent("control", tag, data);
}
