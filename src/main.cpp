#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <string>
#include <vector>

#include "tools/Cli.hpp"

int main(int argc, char** argv) {
    // stdout carries result records only
    spdlog::set_default_logger(spdlog::stderr_color_mt("venue_check"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::vector<std::string> args(argv + 1, argv + argc);
    return venue_guard::run_cli(args, std::cin, std::cout, std::cerr);
}
