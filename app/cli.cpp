#include "cli.hpp"

#include "keel/router.hpp"

#include <CLI/CLI.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace keel::cli {

    namespace detail {

        using namespace std::string_view_literals;

        template <typename Enum>
        static bool parse_enum_flag(
                const CLI::App& app,
                std::string_view flag,
                const std::string& text,
                Enum& out,
                bool (*parse)(std::string_view, Enum&),
                std::string_view expected) {
            if (app.count(std::string{flag}) == 0U) {
                return true;
            }
            if (!parse(text, out)) {
                std::cerr << "invalid " << flag << " value: " << text << " (expected " << expected << ")\n";
                return false;
            }
            return true;
        }

        static void apply_ms(const CLI::App& app, std::string_view flag, std::int64_t ms, std::chrono::milliseconds& out) {
            if (app.count(std::string{flag}) > 0U) {
                out = std::chrono::milliseconds{ms};
            }
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, host_config& cfg) {
        CLI::App app{"keel: multi-client agent host with a sandboxed code runner"};

        bool show_version = false;
        std::string config_arg{};
        std::string mode_arg{std::string{to_string(cfg.mode)}};
        std::string backend_arg{std::string{to_string(cfg.backend)}};
        std::string log_level_arg{std::string{to_string(cfg.logging)}};
        std::string host_arg{cfg.listen_host};
        std::uint16_t port_arg{cfg.listen_port};
        std::string agent_name_arg{cfg.agent_name};
        std::int64_t request_timeout_arg{cfg.request_timeout.count()};
        std::int64_t prompt_timeout_arg{cfg.prompt_timeout.count()};
        std::int64_t idle_timeout_arg{cfg.idle_timeout.count()};
        std::int64_t execution_timeout_arg{cfg.execution_timeout.count()};
        std::int64_t bridge_timeout_arg{cfg.bridge_timeout.count()};
        unsigned workers_arg{cfg.worker_threads};
        std::size_t max_source_arg{cfg.max_source_bytes};
        std::size_t max_output_arg{cfg.max_output_bytes};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--config", config_arg, "JSON config file applied before the flags")->check(CLI::ExistingFile);
        app.add_option("--mode", mode_arg, "Front-ends: stdio|websocket|dual");
        app.add_option("--host", host_arg, "WebSocket listen address");
        app.add_option("--port", port_arg, "WebSocket listen port");
        app.add_option("--backend", backend_arg, "Agent backend: echo|code");
        app.add_option("--agent-name", agent_name_arg, "Name reported by initialize");
        app.add_option("--request-timeout-ms", request_timeout_arg, "Client request round trip budget")
                ->check(CLI::PositiveNumber);
        app.add_option("--prompt-timeout-ms", prompt_timeout_arg, "Prompt turn budget")->check(CLI::PositiveNumber);
        app.add_option("--idle-timeout-ms", idle_timeout_arg, "Close connections idle this long")
                ->check(CLI::PositiveNumber);
        app.add_option("--execution-timeout-ms", execution_timeout_arg, "Wall clock budget of one program")
                ->check(CLI::PositiveNumber);
        app.add_option("--bridge-timeout-ms", bridge_timeout_arg, "Budget of one host capability call")
                ->check(CLI::PositiveNumber);
        app.add_option("--workers", workers_arg, "Sandbox worker threads")->check(CLI::Range(1U, 256U));
        app.add_option("--max-source-bytes", max_source_arg, "Reject programs larger than this");
        app.add_option("--max-output-bytes", max_output_arg, "Truncate captured output past this size");
        app.add_option("--log-level", log_level_arg, "Log threshold: error|warn|info|debug");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "keel " << keel_version << '\n';
            return std::optional<int>{0};
        }

        // file first, so explicit flags win
        if (!config_arg.empty()) {
            cfg.config_file = config_arg;
            apply_config_file(cfg, *cfg.config_file);
        }

        if (!detail::parse_enum_flag(app, "--mode", mode_arg, cfg.mode, &try_parse_transport_mode, "stdio|websocket|dual") ||
            !detail::parse_enum_flag(app, "--backend", backend_arg, cfg.backend, &try_parse_backend_kind, "echo|code") ||
            !detail::parse_enum_flag(
                    app, "--log-level", log_level_arg, cfg.logging, &try_parse_log_level, "error|warn|info|debug")) {
            return std::optional<int>{2};
        }

        if (app.count("--host") > 0U) {
            cfg.listen_host = host_arg;
        }
        if (app.count("--port") > 0U) {
            cfg.listen_port = port_arg;
        }
        if (app.count("--agent-name") > 0U) {
            cfg.agent_name = agent_name_arg;
        }
        detail::apply_ms(app, "--request-timeout-ms", request_timeout_arg, cfg.request_timeout);
        detail::apply_ms(app, "--prompt-timeout-ms", prompt_timeout_arg, cfg.prompt_timeout);
        detail::apply_ms(app, "--idle-timeout-ms", idle_timeout_arg, cfg.idle_timeout);
        detail::apply_ms(app, "--execution-timeout-ms", execution_timeout_arg, cfg.execution_timeout);
        detail::apply_ms(app, "--bridge-timeout-ms", bridge_timeout_arg, cfg.bridge_timeout);
        if (app.count("--workers") > 0U) {
            cfg.worker_threads = workers_arg;
        }
        if (app.count("--max-source-bytes") > 0U) {
            cfg.max_source_bytes = max_source_arg;
        }
        if (app.count("--max-output-bytes") > 0U) {
            cfg.max_output_bytes = max_output_arg;
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace keel::cli
