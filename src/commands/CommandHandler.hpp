#pragma once
#include <string>
#include <vector>

class CommandHandler {
public:
    static int execute(const std::string& command, const std::vector<std::string>& args);

private:
    static void handle_decode(const std::vector<std::string>& args);
    static void handle_info(const std::vector<std::string>& args);
    static void handle_check(const std::vector<std::string>& args);
    static void handle_announce(const std::vector<std::string>& args);
};
