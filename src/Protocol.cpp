#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <string>

#include "Connection.hpp"
#include "Errors.hpp"
#include "Protocol.hpp"

namespace Protocol {

    /** reverses the byte order (polyfill for std::byteswap from C++23) */
    template<typename T> requires std::integral<T>
    constexpr T byteswap(T value) noexcept {
        static_assert(sizeof(T) <= 2, "only the 16-bit length field is swapped");
        if constexpr (sizeof(T) == 1) {
            return value;
        } else {
            return static_cast<T>((value >> 8) | (value << 8));
        }
    }

    /** Convert an integral value between native and big endian */
    template<typename T> requires std::integral<T>
    constexpr T be_convert(T value) {
        if constexpr (std::endian::native == std::endian::big) {
            return value;
        } else {
            return byteswap(value);
        }
    }

    // Parse a 2-byte big-endian uint from buffer
    uint16_t parse_uint16(const char* data) {
        uint16_t raw;
        std::memcpy(&raw, data, sizeof(raw));
        return be_convert(raw);
    }

    // Write a 2-byte big-endian uint to buffer
    void write_uint16(char* dest, uint16_t value) {
        value = be_convert(value);
        std::memcpy(dest, &value, sizeof(value));
    }


    std::vector<char> encode(const std::string& tag, const std::vector<char>& data) {
        if (tag.size() > TAG_LEN) {
            throw ProtocolError("Tag \"" + tag + "\" exceeds " + std::to_string(TAG_LEN) + " bytes");
        }
        size_t packet_length = HEADER_SIZE + data.size();
        if (packet_length > MAX_PACKET_LEN) {
            throw ProtocolError("Packet of " + std::to_string(packet_length) +
                                " bytes exceeds the 16-bit length field");
        }

        // Length, NUL padded tag, payload
        std::vector<char> packet(packet_length, '\0');
        write_uint16(&packet[0], static_cast<uint16_t>(packet_length));
        std::memcpy(&packet[LENGTH_FIELD_SIZE], tag.data(), tag.size());
        if (!data.empty()) {
            std::memcpy(&packet[HEADER_SIZE], data.data(), data.size());
        }
        return packet;
    }

    std::vector<char> encode(const std::string& tag, const std::string& data) {
        return encode(tag, std::vector<char>(data.begin(), data.end()));
    }


    std::vector<char> readExactly(const ReadFunction& read, size_t num_bytes) {
        std::vector<char> buffer(num_bytes);
        size_t received = 0;

        // A single read may return fewer bytes than requested
        while (received < num_bytes) {
            size_t n = read(buffer.data() + received, num_bytes - received);
            if (n == 0) {
                throw TransportError("Connection closed by peer (expected " +
                                     std::to_string(num_bytes) + " bytes, received " +
                                     std::to_string(received) + ")");
            }
            received += n;
        }
        return buffer;
    }


    Packet decode(const ReadFunction& read) {
        std::vector<char> length_field = readExactly(read, LENGTH_FIELD_SIZE);
        uint16_t packet_length = parse_uint16(length_field.data());
        if (packet_length < HEADER_SIZE) {
            throw ProtocolError("Invalid packet length " + std::to_string(packet_length));
        }

        // Trim the NUL padding off the tag
        std::vector<char> tag_field = readExactly(read, TAG_LEN);
        size_t tag_len = TAG_LEN;
        while (tag_len > 0 && tag_field[tag_len - 1] == '\0') {
            --tag_len;
        }

        Packet packet;
        packet.tag.assign(tag_field.data(), tag_len);
        packet.data = readExactly(read, packet_length - HEADER_SIZE);
        return packet;
    }


    void sendPacket(Connection& connection, const std::string& tag, const std::string& data) {
        std::vector<char> packet = encode(tag, data);
        connection.sendAll(packet.data(), packet.size());
    }

    Packet receivePacket(Connection& connection) {
        return decode([&connection](char* buffer, size_t max_length) {
            return connection.receiveSome(buffer, max_length);
        });
    }

} // namespace Protocol
