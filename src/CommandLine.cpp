#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#include "CommandLine.hpp"


static ParsedArgs reject(const std::string& error, bool show_usage = false) {
    ParsedArgs args;
    args.error = error;
    args.show_usage = show_usage;
    return args;
}


ParsedArgs CommandLine::parse(int argc, const char* const argv[]) {
    // program host port command [filename] data-port
    if (argc != 5 && argc != 6) {
        return reject("Wrong number of arguments", true);
    }

    std::string host = argv[1];
    std::string server_port_arg = argv[2];
    std::string command_arg = argv[3];
    std::string data_port_arg = (argc == 6) ? argv[5] : argv[4];

    if (command_arg == "-g" && argc != 6) {
        return reject("-g requires a filename", true);
    }
    if (command_arg == "-l" && argc != 5) {
        return reject("-l does not take a filename", true);
    }

    ParsedArgs args;
    args.params.server_host = host;

    if (!parsePort(server_port_arg, args.params.server_port)) {
        return reject("Server port must be an integer in the range [1024, 65535]");
    }

    if (command_arg == "-l") {
        args.params.command = Command::LIST;
    } else if (command_arg == "-g") {
        args.params.command = Command::GET;
        args.params.filename = std::string(argv[4]);
    } else {
        return reject("Command must be either -l or -g");
    }

    if (!parsePort(data_port_arg, args.params.data_port)) {
        return reject("Data port must be an integer in the range [1024, 65535]");
    }

    if (args.params.server_port == args.params.data_port) {
        return reject("Server port and data port cannot match");
    }

    args.valid = true;
    return args;
}


std::string CommandLine::usage(const std::string& program) {
    return "usage: " + program + " <server-hostname> <server-port> -l|-g [<filename>] <data-port>";
}


bool CommandLine::parsePort(const std::string& text, int& port) {
    // Digits only: rejects signs, whitespace and trailing garbage stoi would accept
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c){ return std::isdigit(c); })) {
        return false;
    }

    int value;
    try {
        value = std::stoi(text);
    } catch (const std::out_of_range&) {
        return false;
    }

    if (value < MIN_PORT || value > MAX_PORT) {
        return false;
    }
    port = value;
    return true;
}
