#include <fmt/format.h>

#include "ControlSession.hpp"
#include "DataSession.hpp"
#include "FtpClient.hpp"
#include "Protocol.hpp"


FtpClient::FtpClient(const SessionParams& params, ConnectionFactory& factory, FileSink& sink,
                     SessionReporter& reporter, Logger& logger)
    : params{params}, factory{factory}, sink{sink}, reporter{reporter}, logger{logger} {}


FtpClient::~FtpClient() {
    disconnect();
}


SessionOutcome FtpClient::runSession() {
    SessionOutcome outcome;

    try {
        // Control connection
        control = factory.connect(params.server_host, params.server_port);
        logger.logConnectionOpened(params.server_host, params.server_port);
        reporter.onStatus(fmt::format("FTP control connection established with \"{}\"", params.server_host));

        // Negotiation
        ControlSession control_session(control, params, reporter, logger);
        outcome.result = control_session.run();

        if (outcome.result.ok()) {
            // The server connects to us for the data connection
            Connection data = factory.acceptOne(params.data_port, DATA_BACKLOG);
            logger.logConnectionAccepted(params.data_port);
            reporter.onStatus(fmt::format("FTP data connection established with \"{}\"", params.server_host));

            DataSession data_session(data, control, sink, reporter, logger, params.server_host);
            outcome.result = data_session.run().result;

            data.close();
            logger.logConnectionClosed("data");

            drainControl(outcome);
        }
    } catch (const TransportError& e) {
        outcome.result = SessionResult::failure(ErrorKind::TRANSPORT, e.what());
        logger.logCustomMsg(fmt::format("Transport error: {}", e.what()));
        reporter.onError(e.what());
    } catch (const ProtocolError& e) {
        outcome.result = SessionResult::failure(ErrorKind::PROTOCOL, e.what());
        logger.logCustomMsg(fmt::format("Protocol error: {}", e.what()));
        reporter.onError(e.what());
    }

    if (outcome.result.ok()) {
        logger.logCustomMsg("Session finished");
    } else {
        logger.logCustomMsg(fmt::format("Session failed, {}: {}", toString(outcome.result.kind),
                                        outcome.result.message));
    }

    disconnect();
    return outcome;
}


void FtpClient::drainControl(SessionOutcome& outcome) {
    while (true) {
        Protocol::Packet packet = Protocol::receivePacket(control);
        logger.logPacketReceived("control", packet);

        if (packet.tag == Protocol::Tag::CLOSE) {
            break;
        }
        if (packet.tag == Protocol::Tag::ERROR) {
            outcome.trailing_errors.push_back(packet.text());
            reporter.onServerError(packet.text());
        }
    }
}


void FtpClient::disconnect() {
    if (control.isOpen()) {
        control.close();
        logger.logConnectionClosed("control");
        reporter.onStatus("FTP control connection closed");
    }
}
