#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <string>

#include "SessionParams.hpp"

struct ParsedArgs {
    bool valid = false;
    bool show_usage = false;  // error is about the shape of the command line
    SessionParams params;
    std::string error;
};

/**
 * CommandLine - Turns argv into SessionParams
 *
 *   ftclient <server-host> <server-port> -l|-g [<filename>] <data-port>
 *
 * Ports are decimal integers in [1024, 65535] and must differ from each
 * other. -g requires a filename, -l takes none.
 */
class CommandLine {
public:
    static constexpr int MIN_PORT = 1024;
    static constexpr int MAX_PORT = 65535;

    static ParsedArgs parse(int argc, const char* const argv[]);
    static std::string usage(const std::string& program);

private:
    static bool parsePort(const std::string& text, int& port);

    CommandLine() = delete;
};

#endif // COMMAND_LINE_HPP
