#include <string>
#include <utility>

#include <fmt/format.h>

#include "DataSession.hpp"


DataSession::DataSession(Connection& data, Connection& control, FileSink& sink,
                         SessionReporter& reporter, Logger& logger, std::string server_host)
    : data{data}, control{control}, sink{sink}, reporter{reporter}, logger{logger},
      server_host{std::move(server_host)} {}


DataSessionResult DataSession::run() {
    DataSessionResult out;

    Protocol::Packet first = receive();
    if (first.tag == Protocol::Tag::FNAME) {
        receiveListing(first, out);
    }
    else if (first.tag == Protocol::Tag::FILE) {
        receiveFile(first, out);
    }
    else {
        // A bare DONE is what the server sends when it refused the request
        // on the control connection; the reason arrives there as ERROR.
        std::string message = (first.tag == Protocol::Tag::DONE)
            ? std::string("Server announced no payload")
            : fmt::format("Unexpected packet \"{}\" on data connection", first.tag);
        reporter.onError(message);
        out.result = SessionResult::failure(ErrorKind::PROTOCOL, message);
    }

    acknowledge();
    return out;
}


void DataSession::receiveListing(const Protocol::Packet& first, DataSessionResult& out) {
    out.mode = TransferMode::LISTING;
    reporter.onListingHeader(server_host);

    // DONE ends the listing and is not an entry itself
    Protocol::Packet packet = first;
    while (packet.tag != Protocol::Tag::DONE) {
        reporter.onListingEntry(packet.text());
        ++out.entries;
        packet = receive();
    }
}


void DataSession::receiveFile(const Protocol::Packet& first, DataSessionResult& out) {
    out.mode = TransferMode::FILE;
    out.filename = first.text();

    // Never overwrite an existing local file. The announced payload is still
    // consumed so the server sees a normal ACK afterwards.
    if (sink.exists(out.filename)) {
        std::string message = fmt::format("File \"{}\" already exists", out.filename);
        reporter.onError(message);
        out.result = SessionResult::failure(ErrorKind::LOCAL_PRECONDITION, message);
        logger.logCustomMsg(fmt::format("Discarded {} packets for \"{}\"", discardUntilDone(), out.filename));
        return;
    }

    if (!sink.create(out.filename)) {
        std::string message = fmt::format("Unable to create file \"{}\"", out.filename);
        reporter.onError(message);
        out.result = SessionResult::failure(ErrorKind::LOCAL_PRECONDITION, message);
        logger.logCustomMsg(fmt::format("Discarded {} packets for \"{}\"", discardUntilDone(), out.filename));
        return;
    }

    // Append every chunk until DONE; after a failed write keep reading but stop writing
    bool write_failed = false;
    Protocol::Packet packet = receive();
    while (packet.tag != Protocol::Tag::DONE) {
        if (!write_failed) {
            if (sink.write(packet.data.data(), packet.data.size())) {
                out.bytes_written += packet.data.size();
            } else {
                write_failed = true;
            }
        }
        packet = receive();
    }

    // DONE terminates the file, its payload is not part of it
    if (!packet.data.empty()) {
        logger.logCustomMsg(fmt::format("Ignored {} bytes carried by DONE", packet.data.size()));
    }

    bool closed = sink.close();
    if (write_failed || !closed) {
        std::string message = fmt::format("Failed writing file \"{}\"", out.filename);
        reporter.onError(message);
        out.result = SessionResult::failure(ErrorKind::LOCAL_PRECONDITION, message);
        return;
    }

    reporter.onTransferComplete(out.filename, out.bytes_written);
}


size_t DataSession::discardUntilDone() {
    size_t discarded = 0;
    while (receive().tag != Protocol::Tag::DONE) {
        ++discarded;
    }
    return discarded;
}


Protocol::Packet DataSession::receive() {
    Protocol::Packet packet = Protocol::receivePacket(data);
    logger.logPacketReceived("data", packet);
    return packet;
}


void DataSession::acknowledge() {
    Protocol::sendPacket(control, Protocol::Tag::ACK);
    logger.logPacketSent("control", Protocol::Tag::ACK, "");
}
