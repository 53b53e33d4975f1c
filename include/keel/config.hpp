#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace keel {

    using namespace std::string_view_literals;

    /*
     * Keel Host Config Options
     *
     * Transports
     * - mode: Which front-ends attach. "stdio" serves exactly one editor client over stdin/stdout and is the only
     *   mode that permits unowned (legacy) sessions. "websocket" serves WebSocket clients only. "dual" serves both;
     *   the stdio client then registers like any other client.
     * - listen_host/listen_port: WebSocket listen address (websocket and dual modes).
     *
     * Agent
     * - backend: Turn producer for prompts. "echo" replies with the prompt text, "code" runs fenced code blocks
     *   from the prompt in the sandbox.
     * - agent_name: Reported in the initialize response.
     *
     * Timeouts
     * - request_timeout: Control-plane request/response round trip to a client.
     * - prompt_timeout: Long-running prompt-class requests and the aggregate bound of one prompt turn.
     * - idle_timeout: A connection with no inbound frame for this long is closed.
     * - execution_timeout: Wall-clock budget of one sandbox execution.
     * - bridge_timeout: Budget of one host capability call made from inside the sandbox.
     *
     * Sandbox limits
     * - worker_threads: Sandbox worker pool size (one per concurrently executing program).
     * - max_source_bytes: Reject oversized programs before parsing.
     * - max_output_bytes: Captured print output is truncated past this size.
     *
     * Diagnostics
     * - log_level: error|warn|info|debug threshold for stderr logging.
     * - config_file: Optional JSON file applied before command-line flags.
     * - print_config: Print the resolved config and exit.
     */

    enum class transport_mode { stdio, websocket, dual };
    enum class backend_kind { echo, code };
    enum class log_level { error, warn, info, debug };

    inline constexpr std::string_view to_string(transport_mode mode) {
        switch (mode) {
            case transport_mode::stdio:
                return "stdio"sv;
            case transport_mode::websocket:
                return "websocket"sv;
            case transport_mode::dual:
                return "dual"sv;
        }
        return "stdio"sv;
    }

    inline constexpr bool try_parse_transport_mode(std::string_view text, transport_mode& out) {
        if (utils::str_case_eq(text, "stdio"sv)) {
            out = transport_mode::stdio;
            return true;
        }
        if (utils::str_case_eq(text, "websocket"sv) || utils::str_case_eq(text, "ws"sv)) {
            out = transport_mode::websocket;
            return true;
        }
        if (utils::str_case_eq(text, "dual"sv)) {
            out = transport_mode::dual;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(backend_kind kind) {
        switch (kind) {
            case backend_kind::echo:
                return "echo"sv;
            case backend_kind::code:
                return "code"sv;
        }
        return "echo"sv;
    }

    inline constexpr bool try_parse_backend_kind(std::string_view text, backend_kind& out) {
        if (utils::str_case_eq(text, "echo"sv) || utils::str_case_eq(text, "test"sv)) {
            out = backend_kind::echo;
            return true;
        }
        if (utils::str_case_eq(text, "code"sv)) {
            out = backend_kind::code;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(log_level lvl) {
        switch (lvl) {
            case log_level::error:
                return "error"sv;
            case log_level::warn:
                return "warn"sv;
            case log_level::info:
                return "info"sv;
            case log_level::debug:
                return "debug"sv;
        }
        return "info"sv;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "error"sv)) {
            out = log_level::error;
            return true;
        }
        if (utils::str_case_eq(text, "warn"sv) || utils::str_case_eq(text, "warning"sv)) {
            out = log_level::warn;
            return true;
        }
        if (utils::str_case_eq(text, "info"sv)) {
            out = log_level::info;
            return true;
        }
        if (utils::str_case_eq(text, "debug"sv)) {
            out = log_level::debug;
            return true;
        }
        return false;
    }

    inline constexpr log::level to_log_threshold(log_level lvl) {
        switch (lvl) {
            case log_level::error:
                return log::level::error;
            case log_level::warn:
                return log::level::warn;
            case log_level::info:
                return log::level::info;
            case log_level::debug:
                return log::level::debug;
        }
        return log::level::info;
    }

    struct host_config {
        transport_mode mode{transport_mode::stdio};
        std::string listen_host{"127.0.0.1"};
        std::uint16_t listen_port{8000};

        backend_kind backend{backend_kind::echo};
        std::string agent_name{"keel-agent"};

        std::chrono::milliseconds request_timeout{30'000};
        std::chrono::milliseconds prompt_timeout{300'000};
        std::chrono::milliseconds idle_timeout{300'000};
        std::chrono::milliseconds execution_timeout{60'000};
        std::chrono::milliseconds bridge_timeout{30'000};

        unsigned worker_threads{4U};
        std::size_t max_source_bytes{256U * 1024U};
        std::size_t max_output_bytes{1U << 20U};

        log_level logging{log_level::info};
        std::optional<std::filesystem::path> config_file{};
        bool print_config{false};

        // Legacy unowned sessions are a stdio-only carve-out. Any mode where a WebSocket client can attach must
        // keep this false.
        bool single_client() const { return mode == transport_mode::stdio; }
        bool serves_stdio() const { return mode != transport_mode::websocket; }
        bool serves_websocket() const { return mode != transport_mode::stdio; }
    };

    // Applies a JSON config file onto cfg; keys that are absent keep their current value. Throws
    // std::runtime_error on unreadable or malformed files.
    void apply_config_file(host_config& cfg, const std::filesystem::path& path);

    void print_config(const host_config& cfg, std::ostream& os);

}  // namespace keel
