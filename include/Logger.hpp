#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>

#include "Protocol.hpp"

class Logger {
    public:
        static constexpr const char* DEFAULT_LOG_FILE = "logs/ftclient.log";

        Logger(std::string sessionID, std::string logfile = DEFAULT_LOG_FILE);
        void logConnectionOpened(const std::string& host, int port); //Log outbound connection
        void logConnectionAccepted(int port); //Log inbound connection on a local port
        void logConnectionClosed(const std::string& channel); //Log connection closure
        void logPacketSent(const std::string& channel, const std::string& tag, const std::string& data);
        void logPacketReceived(const std::string& channel, const Protocol::Packet& packet);
        void logCustomMsg(const std::string& entry); //Log custom message

    private:
        std::string sessionID;
        std::string logfile;
        bool warned = false;
        const std::string getTime();
        void logToFile(const std::string& entry);
};

#endif // LOGGER_HPP
