#include "tools/Cli.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

#include "ConfigManager.hpp"
#include "tools/BatchChecker.hpp"

namespace venue_guard {

namespace {

int usage(std::ostream& err, int code) {
    err << "Usage: venue_check [--config PATH] [INPUT]\n"
        << "Validates a JSON Lines venue feed. Reads stdin when INPUT is absent or '-'.\n";
    return code;
}

}

int run_cli(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    std::string config_path;
    std::string input_path = "-";
    bool have_input = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            return usage(err, 0);
        }
        if (arg == "--config") {
            if (i + 1 >= args.size()) {
                return usage(err, 2);
            }
            config_path = args[++i];
        } else if (!have_input && (arg == "-" || arg.rfind("--", 0) != 0)) {
            input_path = arg;
            have_input = true;
        } else {
            return usage(err, 2);
        }
    }

    auto config = ConfigManager::load(config_path);
    if (!config) {
        return 1;
    }
    ConfigManager::apply_logging(*config);

    BatchChecker checker(*config);

    if (input_path == "-") {
        checker.run(in, out);
        return 0;
    }

    std::ifstream file(input_path);
    if (!file.is_open()) {
        spdlog::error("🚨 Input file {} cannot be opened", input_path);
        return 1;
    }
    spdlog::info("🛰️ Checking {}", input_path);
    checker.run(file, out);
    return 0;
}

}
