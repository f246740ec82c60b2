#include <iostream>
#include <string>
#include "commands.h"
#include "config_paths.h"

using namespace facesig;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "version" || command == "--version" || command == "-v") {
        std::cout << "facesig version " << VERSION << std::endl;
        return 0;
    }

    CliOptions options;
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a path" << std::endl;
                return 1;
            }
            options.config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage();
            return 1;
        }
    }

    if (command == "encode") {
        return cmd_encode(options);
    }

    if (command == "compare") {
        return cmd_compare(options);
    }

    if (command == "aggregate") {
        return cmd_aggregate(options);
    }

    if (command == "detect") {
        return cmd_detect(options);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
