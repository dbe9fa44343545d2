#include "commands/CommandHandler.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <vector>

int main(int argc, char* argv[]) {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;
    Logger::init_from_env();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            Logger::set_level(LogLevel::Debug);
            continue;
        }
        args.push_back(arg);
    }

    if (args.empty()) {
        std::cerr << "Usage: " << argv[0] << " [-v] <command> <args>" << std::endl;
        std::cerr << "\nAvailable commands:" << std::endl;
        std::cerr << "    decode <encoded_value>" << std::endl;
        std::cerr << "    info <descriptor.json>" << std::endl;
        std::cerr << "    check [-o <output_dir>] [--overwrite] [--only <i,j,...>] <descriptor.json>" << std::endl;
        std::cerr << "    announce <descriptor.json> [tracker_url]" << std::endl;
        return 1;
    }

    std::string command = args.front();
    args.erase(args.begin());
    return CommandHandler::execute(command, args);
}
