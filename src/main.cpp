#include <cstdlib>
#include <iostream>

#include <fmt/format.h>

#include "CommandLine.hpp"
#include "ConnectionFactory.hpp"
#include "FileSink.hpp"
#include "FtpClient.hpp"
#include "Logger.hpp"
#include "SessionReporter.hpp"


int main(int argc, char* argv[]) {
    ParsedArgs args = CommandLine::parse(argc, argv);
    if (!args.valid) {
        if (args.show_usage) {
            std::cerr << CommandLine::usage(argv[0]) << "\n";
        }
        std::cerr << "Client: " << args.error << "\n";
        return 1;
    }

    // Log File Location
    const char* log_file = std::getenv("FTCLIENT_LOG_FILE");
    Logger logger(fmt::format("{}:{}", args.params.server_host, args.params.server_port),
                  log_file != nullptr ? log_file : Logger::DEFAULT_LOG_FILE);

    ConsoleReporter reporter;
    TcpConnectionFactory factory;
    DirectorySink sink;

    FtpClient client(args.params, factory, sink, reporter, logger);
    SessionOutcome outcome = client.runSession();
    return outcome.exitCode();
}
