/**
 * @file main.cpp
 * @brief Точка входа утилиты textnorm
 */

#include "cli_commands.hpp"
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

int printUsage() {
    std::cerr
        << "usage:\n"
        << "  textnorm case <style>|--all <text>...\n"
        << "  textnorm path [options] <path>...\n"
        << "  textnorm help\n";
    return 1;
}

std::vector<std::string> collectArgs(int argc, char* argv[], int first) {
    std::vector<std::string> args;
    for (int i = first; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc < 2) {
            return printUsage();
        }

        std::string_view command(argv[1]);
        textnorm::app::CommandStreams streams{std::cin, std::cout, std::cerr};

        if (command == "help" || command == "--help" || command == "-h") {
            printUsage();
            return 0;
        }

        if (command == "case") {
            return textnorm::app::runCaseCommand(collectArgs(argc, argv, 2), streams);
        }

        if (command == "path") {
            return textnorm::app::runPathCommand(collectArgs(argc, argv, 2), streams);
        }

        std::cerr << "Неизвестная команда: " << command << std::endl;
        return printUsage();
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return 1;
    }
}
