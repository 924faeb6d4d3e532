#include "Protocol.hpp"
#include "SessionParams.hpp"

const char* commandTag(Command command) {
    return command == Command::GET ? Protocol::Tag::GET : Protocol::Tag::LIST;
}
