#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include "HTTPProxyServer.hpp"
#include "ProxyConfig.hpp"

// ANSI Color Codes for Terminal Output
#define RESET "\033[0m"
#define RED "\033[31m"     /* Red */
#define MAGENTA "\033[35m" /* Magenta */
#define PRINT_ERROR RED << "[ERROR]" << RESET << " "
#define PRINT_PROMPT MAGENTA << ">" << RESET << " "

static void printConsoleHelp() {
    std::cout << "Commands:\n"
              << "  block <url>     Refuse requests for <url>\n"
              << "  unblock <url>   Remove <url> from the block list\n"
              << "  list            Show blocked targets\n"
              << "  help            Show this text\n"
              << "  quit            Stop the server\n";
}

// Operator console: edits the block list until "quit" or end of input
static void runConsole(HTTPProxyServer& server) {
    printConsoleHelp();

    std::string line;
    while (std::cout << PRINT_PROMPT << std::flush, std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::string command, url;
        in >> command >> url;

        if (command.empty()) {
            continue;
        } else if (command == "block") {
            if (!server.addBlocked(url)) {
                std::cout << PRINT_ERROR << "URL is empty or already blocked!\n";
            }
        } else if (command == "unblock") {
            if (!server.removeBlocked(url)) {
                std::cout << PRINT_ERROR << "URL is not blocked: " << url << "\n";
            }
        } else if (command == "list") {
            for (const auto& blocked : server.blockedUrls()) {
                std::cout << "  " << blocked << "\n";
            }
        } else if (command == "help") {
            printConsoleHelp();
        } else if (command == "quit") {
            break;
        } else {
            std::cout << PRINT_ERROR << "Unknown command: " << command << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    ProxyConfig config;
    try {
        config = ProxyConfig::parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << ProxyConfig::usage(argv[0]);
        return 1;
    }

    HTTPProxyServer server(config);
    if (!server.listen()) {
        return 1;
    }

    if (!config.console) {
        server.serve();
        return 0;
    }

    std::thread acceptor([&server] { server.serve(); });
    runConsole(server);

    server.stop();
    acceptor.join();

    // Handlers still use the server; let open connections finish first
    if (size_t open = server.activeConnections(); open > 0) {
        std::cout << "Waiting for " << open << " open connection(s) to close...\n";
    }
    server.waitForIdle();
    return 0;
}
