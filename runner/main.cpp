#include "commands.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "toolgate_cli <servers|discover|call> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "servers") return cmd_servers(argc, argv);
    if (cmd == "discover") return cmd_discover(argc, argv);
    if (cmd == "call") return cmd_call(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
