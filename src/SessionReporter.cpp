#include <iostream>

#include <fmt/format.h>

#include "SessionReporter.hpp"

// ANSI Color Codes for Terminal Output
#define RESET "\033[0m"
#define RED "\033[31m"     /* Red */
#define GREEN "\033[32m"   /* Green */
#define YELLOW "\033[33m"  /* Yellow */
#define PRINT_ERROR RED << "[ERROR]" << RESET << " "
#define PRINT_SUCCESSES GREEN << "[SUCCESSES]" << RESET << " "
#define PRINT_SERVER YELLOW << "[SERVER]" << RESET << " "


void ConsoleReporter::onStatus(const std::string& message) {
    std::cout << message << "\n";
}

void ConsoleReporter::onListingHeader(const std::string& host) {
    std::cout << fmt::format("File listing on \"{}\"", host) << "\n";
}

void ConsoleReporter::onListingEntry(const std::string& name) {
    std::cout << "  " << name << "\n";
}

void ConsoleReporter::onTransferComplete(const std::string& filename, size_t bytes) {
    std::cout << PRINT_SUCCESSES << fmt::format("Received \"{}\" ({} bytes)", filename, bytes) << "\n";
}

void ConsoleReporter::onError(const std::string& message) {
    std::cerr << PRINT_ERROR << message << "\n";
}

void ConsoleReporter::onServerError(const std::string& message) {
    std::cerr << PRINT_SERVER << message << "\n";
}
