#ifndef SESSION_PARAMS_HPP
#define SESSION_PARAMS_HPP

#include <cstdint>
#include <optional>
#include <string>

enum class Command : uint8_t {
    LIST = 0,
    GET  = 1
};

/** Control-connection tag that requests the given command */
const char* commandTag(Command command);

/**
 * Already validated inputs of one client run. Built once by the command
 * line layer and passed by const reference to every component.
 */
struct SessionParams {
    std::string server_host;
    int server_port = 0;
    Command command = Command::LIST;
    std::optional<std::string> filename;  // set iff command == GET
    int data_port = 0;
};

#endif // SESSION_PARAMS_HPP
