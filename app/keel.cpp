#include "cli.hpp"

#include "keel/server.hpp"
#include "keel/utils.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        keel::host_config cfg{};
        if (auto cli_result = keel::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        keel::log::set_threshold(keel::to_log_threshold(cfg.logging));

        keel::server srv{std::move(cfg)};
        return srv.run();
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
