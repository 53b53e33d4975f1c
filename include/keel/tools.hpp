#pragma once

#include "bridge.hpp"
#include "connection.hpp"
#include "sandbox.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace keel {

    // Everything a session's capabilities need to reach its client.
    struct host_context {
        std::shared_ptr<connection> conn{};
        std::string session_id{};
        // relative paths passed to the capabilities resolve against this
        std::string cwd{};
        const bridge* host_bridge{};
        // whole-call budget enforced by the bridge
        std::chrono::milliseconds call_timeout{30'000};
        // each client round trip inside a call
        std::chrono::milliseconds request_timeout{30'000};
    };

    /*
     * Default host capabilities, each backed by requests to the session's client:
     *
     *   read_file(path, line=None, limit=None) -> str          fs_read_text_file
     *   write_file(path, content) -> None                      fs_write_text_file
     *   run_command(command, args=[], cwd=None) -> dict        terminal_create, terminal_wait_for_exit,
     *                                                          terminal_output, terminal_release
     *
     * run_command returns {"exit_code", "signal", "output", "truncated"}. Every call is exactly one bridge call and
     * is reported to the session as its own tool_call record (kind read, edit or execute) that ends completed or
     * failed, including when the bridge gives up on it.
     */
    capability_map make_host_capabilities(host_context ctx);

    // Joins `path` onto `cwd` when it is relative; absolute paths pass through normalized.
    std::string resolve_path(const std::string& cwd, const std::string& path);

}  // namespace keel
