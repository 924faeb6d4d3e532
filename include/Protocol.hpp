#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

class Connection;


/**
 * Packet framing shared by the control and data connections:
 *
 *   [2 bytes: total length, big-endian] [8 bytes: tag, NUL padded] [payload]
 *
 * The length counts the whole packet, header included.
 */
namespace Protocol {

    constexpr size_t LENGTH_FIELD_SIZE = 2;
    constexpr size_t TAG_LEN = 8;
    constexpr size_t HEADER_SIZE = LENGTH_FIELD_SIZE + TAG_LEN;
    constexpr size_t MAX_PACKET_LEN = 65535;
    constexpr size_t MAX_PAYLOAD_LEN = MAX_PACKET_LEN - HEADER_SIZE;

    namespace Tag {
        constexpr const char* DPORT = "DPORT";  // client -> server, data port as decimal text
        constexpr const char* LIST  = "LIST";   // client -> server, request a listing
        constexpr const char* GET   = "GET";    // client -> server, request a file
        constexpr const char* ACK   = "ACK";    // client -> server, payload received
        constexpr const char* OKAY  = "OKAY";   // server -> client, negotiation accepted
        constexpr const char* ERROR = "ERROR";  // server -> client, human readable message
        constexpr const char* FNAME = "FNAME";  // server -> client, one listed filename
        constexpr const char* FILE  = "FILE";   // server -> client, filename then file chunks
        constexpr const char* DONE  = "DONE";   // server -> client, end of listing or file
        constexpr const char* CLOSE = "CLOSE";  // server -> client, end of trailing errors
    }

    struct Packet {
        std::string tag;
        std::vector<char> data;

        std::string text() const { return std::string(data.begin(), data.end()); }
    };

    /**
     * Reads up to max_length bytes into buffer. Returns the number of bytes
     * read, 0 once the stream is closed. Failures are reported by throwing.
     */
    using ReadFunction = std::function<size_t(char* buffer, size_t max_length)>;

    /**
     * Frame a packet
     *
     * @throws ProtocolError if the tag is longer than TAG_LEN or the packet
     *         would not fit the 16-bit length field
     */
    std::vector<char> encode(const std::string& tag, const std::vector<char>& data);
    std::vector<char> encode(const std::string& tag, const std::string& data);

    /**
     * Read one packet. The tag is returned with its NUL padding removed.
     *
     * @throws TransportError if the stream ends before the packet is complete
     * @throws ProtocolError if the length prefix is shorter than the header
     */
    Packet decode(const ReadFunction& read);

    /**
     * Keep reading until exactly num_bytes have arrived.
     *
     * @throws TransportError if the stream ends first
     */
    std::vector<char> readExactly(const ReadFunction& read, size_t num_bytes);

    void sendPacket(Connection& connection, const std::string& tag, const std::string& data = "");
    Packet receivePacket(Connection& connection);

    // Integer Parsing / Writing (network byte order)
    uint16_t parse_uint16(const char* data);
    void write_uint16(char* dest, uint16_t value);

} // namespace Protocol

#endif // PROTOCOL_HPP
