#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace venue_guard {

// venue_check [--config PATH] [INPUT]
// `args` excludes the program name. Result records go to `out`, usage text to `err`.
// Returns 0 on completion, 1 when the config or input cannot be opened, 2 on bad usage.
int run_cli(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

}
