#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <mutex>

#include <string>
#include <utility>
#include <vector>

// Serialize concurrent file writes across all Logger instances
static std::mutex g_log_file_mutex;

// Payload preview for the log: printable ASCII only, capped length
static std::string sanitize_payload(const std::vector<char>& data) {
    constexpr size_t kMax = 64;

    std::string out;
    out.reserve(std::min(data.size(), kMax));
    for (char ch : data) {
        if (out.size() == kMax) {
            out += "...";
            break;
        }
        unsigned char c = static_cast<unsigned char>(ch);
        out.push_back((c >= 32 && c <= 126) ? static_cast<char>(c) : '.');
    }
    return out;
}


// Create a new logger object for the given session
Logger::Logger(std::string sessionID, std::string logfile)
    : sessionID{std::move(sessionID)}, logfile{std::move(logfile)} {

    // Ensure the log directory exists (safe if it already exists)
    std::filesystem::path parent = std::filesystem::path(this->logfile).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
}

const std::string Logger::getTime(){
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::system_clock::now());
}

void Logger::logConnectionOpened(const std::string& host, int port){
    logToFile(fmt::format("{} [{}]: Connection opened to {}:{}", getTime(), sessionID, host, port));
}

void Logger::logConnectionAccepted(int port){
    logToFile(fmt::format("{} [{}]: Connection accepted on port {}", getTime(), sessionID, port));
}

void Logger::logConnectionClosed(const std::string& channel){
    logToFile(fmt::format("{} [{}]: {} connection closed", getTime(), sessionID, channel));
}

void Logger::logPacketSent(const std::string& channel, const std::string& tag, const std::string& data){
    logToFile(fmt::format("{} [{}]: {} >> {} ({} bytes) \"{}\"", getTime(), sessionID, channel, tag,
                          data.size(), sanitize_payload(std::vector<char>(data.begin(), data.end()))));
}

void Logger::logPacketReceived(const std::string& channel, const Protocol::Packet& packet){
    logToFile(fmt::format("{} [{}]: {} << {} ({} bytes) \"{}\"", getTime(), sessionID, channel, packet.tag,
                          packet.data.size(), sanitize_payload(packet.data)));
}

void Logger::logCustomMsg(const std::string& entry){
    logToFile(fmt::format("{} [{}]: {}", getTime(), sessionID, entry));
}


void Logger::logToFile(const std::string& entry){
    std::lock_guard<std::mutex> lock(g_log_file_mutex); //Guard concurrent appends.

    std::ofstream out(logfile, std::ios::app); //Open in append mode
    if (!out){
        // Logging is best effort; complain once per logger
        if (!warned) {
            std::cerr << "[Logger] WARNING: cannot open " << logfile << "\n";
            warned = true;
        }
        return;
    }
    out << entry << '\n';
}
