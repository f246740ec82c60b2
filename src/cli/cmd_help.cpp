#include <iostream>
#include "commands.h"
#include "config_paths.h"

namespace facesig {

void print_usage() {
    std::cout << "facesig - face signature extraction and matching" << std::endl;
    std::cout << "Version: " << VERSION << std::endl << std::endl;
    std::cout << "Usage: facesig <command> [--config <path>] < request.json" << std::endl << std::endl;
    std::cout << "Commands (JSON request on stdin, JSON response on stdout):" << std::endl;
    std::cout << "  encode      {\"image_data\": b64} | {\"image_path\": p}            Encode one face" << std::endl;
    std::cout << "  compare     {\"known_encoding\": [...], \"unknown_image\": b64}    Compare against a stored encoding" << std::endl;
    std::cout << "  aggregate   {\"images\": [b64, ...]}                              Average several captures" << std::endl;
    std::cout << "  detect      {\"image_data\": b64}                                 Check registration quality" << std::endl;
    std::cout << "  version                                                        Show version information" << std::endl;
    std::cout << "  help                                                           Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Configuration: " << CONFIG_DIR << "/facesig.conf (override with --config or $FACESIG_CONFIG)" << std::endl;
    std::cout << "Log level:     $FACESIG_LOG_LEVEL=debug|info|warning|error (logs go to stderr)" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  echo '{\"image_path\": \"me.jpg\"}' | facesig encode" << std::endl;
    std::cout << "  facesig compare --config ./facesig.conf < compare.json" << std::endl;
}

} // namespace facesig
