#pragma once

#include "keel/config.hpp"

#include <optional>

namespace keel::cli {

    // Fills cfg from --config (if given) and then the flags. Returns an exit code when the process should stop
    // without serving (--help, --version, --print-config, bad arguments).
    std::optional<int> parse_cli(int argc, char** argv, host_config& cfg);

}  // namespace keel::cli
