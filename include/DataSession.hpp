#ifndef DATA_SESSION_HPP
#define DATA_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "Connection.hpp"
#include "Errors.hpp"
#include "FileSink.hpp"
#include "Logger.hpp"
#include "Protocol.hpp"
#include "SessionReporter.hpp"

enum class TransferMode : uint8_t {
    NONE,
    LISTING,
    FILE
};

struct DataSessionResult {
    SessionResult result;
    TransferMode mode = TransferMode::NONE;
    std::string filename;      // FILE mode: name announced by the server
    size_t entries = 0;        // LISTING mode: filenames reported
    size_t bytes_written = 0;  // FILE mode: bytes stored in the sink
};

/**
 * DataSession - Consumes the payload of the data connection
 *
 * The first packet selects the sub-protocol:
 * - FNAME: a listing, one filename per packet until DONE
 * - FILE:  the payload is the filename, then FILE chunks until DONE
 * Anything else is a protocol violation and nothing more is read.
 *
 * Whatever the outcome, one ACK is sent on the control connection once
 * the data connection has been consumed.
 */
class DataSession {
public:
    DataSession(Connection& data, Connection& control, FileSink& sink,
                SessionReporter& reporter, Logger& logger, std::string server_host);

    DataSessionResult run();

private:
    Connection& data;
    Connection& control;
    FileSink& sink;
    SessionReporter& reporter;
    Logger& logger;
    std::string server_host;

    void receiveListing(const Protocol::Packet& first, DataSessionResult& out);
    void receiveFile(const Protocol::Packet& first, DataSessionResult& out);

    /** Read and drop packets up to and including DONE */
    size_t discardUntilDone();

    Protocol::Packet receive();
    void acknowledge();
};

#endif // DATA_SESSION_HPP
