#pragma once

#include <glaze/glaze.hpp>

#include <optional>
#include <string>
#include <vector>

// Params and result payloads carried inside frames.
namespace keel::schema {

    inline constexpr int current_protocol_version = 1;

    // ── initialize ──────────────────────────────────────────────────

    struct implementation {
        std::string name{};
        std::optional<std::string> title{};
        std::string version{};
        struct glaze {
            using T = implementation;
            static constexpr auto value = glz::object(&T::name, &T::title, &T::version);
        };
    };

    struct initialize_params {
        int protocol_version{current_protocol_version};
        std::optional<implementation> client_info{};
        struct glaze {
            using T = initialize_params;
            static constexpr auto value = glz::object(&T::protocol_version, &T::client_info);
        };
    };

    struct capabilities {
        bool load_session{true};
        bool execute_code{true};
        struct glaze {
            using T = capabilities;
            static constexpr auto value = glz::object(&T::load_session, &T::execute_code);
        };
    };

    struct initialize_result {
        int protocol_version{current_protocol_version};
        capabilities agent_capabilities{};
        implementation agent_info{};
        struct glaze {
            using T = initialize_result;
            static constexpr auto value = glz::object(&T::protocol_version, &T::agent_capabilities, &T::agent_info);
        };
    };

    // ── sessions ────────────────────────────────────────────────────

    struct new_session_params {
        std::string cwd{};
        std::vector<glz::raw_json> mcp_servers{};
        struct glaze {
            using T = new_session_params;
            static constexpr auto value = glz::object(&T::cwd, &T::mcp_servers);
        };
    };

    struct new_session_result {
        std::string session_id{};
        struct glaze {
            using T = new_session_result;
            static constexpr auto value = glz::object(&T::session_id);
        };
    };

    // Reattaches to a session id the client already knows; materialized on first use.
    struct load_session_params {
        std::string session_id{};
        std::string cwd{};
        std::vector<glz::raw_json> mcp_servers{};
        struct glaze {
            using T = load_session_params;
            static constexpr auto value = glz::object(&T::session_id, &T::cwd, &T::mcp_servers);
        };
    };

    struct fork_session_params {
        std::string session_id{};
        std::optional<std::string> cwd{};
        struct glaze {
            using T = fork_session_params;
            static constexpr auto value = glz::object(&T::session_id, &T::cwd);
        };
    };

    struct set_session_mode_params {
        std::string session_id{};
        std::string mode_id{};
        struct glaze {
            using T = set_session_mode_params;
            static constexpr auto value = glz::object(&T::session_id, &T::mode_id);
        };
    };

    struct session_params {
        std::string session_id{};
        struct glaze {
            using T = session_params;
            static constexpr auto value = glz::object(&T::session_id);
        };
    };

    struct empty_result {
        struct glaze {
            using T = empty_result;
            static constexpr auto value = glz::object();
        };
    };

    struct session_summary {
        std::string session_id{};
        std::string cwd{};
        std::string mode{};
        struct glaze {
            using T = session_summary;
            static constexpr auto value = glz::object(&T::session_id, &T::cwd, &T::mode);
        };
    };

    struct list_sessions_result {
        std::vector<session_summary> sessions{};
        struct glaze {
            using T = list_sessions_result;
            static constexpr auto value = glz::object(&T::sessions);
        };
    };

    // ── prompt turns ────────────────────────────────────────────────

    struct content_block {
        std::string type{"text"};
        std::string text{};
        struct glaze {
            using T = content_block;
            static constexpr auto value = glz::object(&T::type, &T::text);
        };
    };

    struct prompt_params {
        std::string session_id{};
        std::vector<content_block> prompt{};
        struct glaze {
            using T = prompt_params;
            static constexpr auto value = glz::object(&T::session_id, &T::prompt);
        };
    };

    struct prompt_result {
        std::string stop_reason{"end_turn"};
        struct glaze {
            using T = prompt_result;
            static constexpr auto value = glz::object(&T::stop_reason);
        };
    };

    struct execute_code_params {
        std::string session_id{};
        std::string code{};
        struct glaze {
            using T = execute_code_params;
            static constexpr auto value = glz::object(&T::session_id, &T::code);
        };
    };

    struct execute_code_result {
        std::string tool_call_id{};
        std::string output{};
        std::optional<std::string> error{};
        struct glaze {
            using T = execute_code_result;
            static constexpr auto value = glz::object(&T::tool_call_id, &T::output, &T::error);
        };
    };

    // ── session_update notifications ────────────────────────────────

    struct session_notification {
        std::string session_id{};
        glz::raw_json update{};
        struct glaze {
            using T = session_notification;
            static constexpr auto value = glz::object(&T::session_id, &T::update);
        };
    };

    struct agent_message_chunk {
        std::string session_update{"agent_message_chunk"};
        content_block content{};
        struct glaze {
            using T = agent_message_chunk;
            static constexpr auto value = glz::object(&T::session_update, &T::content);
        };
    };

    struct tool_call_location {
        std::string path{};
        std::optional<int> line{};
        struct glaze {
            using T = tool_call_location;
            static constexpr auto value = glz::object(&T::path, &T::line);
        };
    };

    struct tool_call_start {
        std::string session_update{"tool_call"};
        std::string tool_call_id{};
        std::string title{};
        std::string kind{};
        std::string status{};
        std::vector<tool_call_location> locations{};
        std::optional<glz::raw_json> raw_input{};
        struct glaze {
            using T = tool_call_start;
            static constexpr auto value = glz::object(
                    &T::session_update,
                    &T::tool_call_id,
                    &T::title,
                    &T::kind,
                    &T::status,
                    &T::locations,
                    &T::raw_input);
        };
    };

    struct tool_call_progress {
        std::string session_update{"tool_call_update"};
        std::string tool_call_id{};
        std::string status{};
        std::vector<content_block> content{};
        struct glaze {
            using T = tool_call_progress;
            static constexpr auto value =
                    glz::object(&T::session_update, &T::tool_call_id, &T::status, &T::content);
        };
    };

    // ── agent → client requests backing read_file/write_file/run_command ──

    struct read_text_file_params {
        std::string session_id{};
        std::string path{};
        std::optional<int> line{};
        std::optional<int> limit{};
        struct glaze {
            using T = read_text_file_params;
            static constexpr auto value = glz::object(&T::session_id, &T::path, &T::line, &T::limit);
        };
    };

    struct read_text_file_result {
        std::string content{};
        struct glaze {
            using T = read_text_file_result;
            static constexpr auto value = glz::object(&T::content);
        };
    };

    struct write_text_file_params {
        std::string session_id{};
        std::string path{};
        std::string content{};
        struct glaze {
            using T = write_text_file_params;
            static constexpr auto value = glz::object(&T::session_id, &T::path, &T::content);
        };
    };

    struct create_terminal_params {
        std::string session_id{};
        std::string command{};
        std::vector<std::string> args{};
        std::optional<std::string> cwd{};
        struct glaze {
            using T = create_terminal_params;
            static constexpr auto value = glz::object(&T::session_id, &T::command, &T::args, &T::cwd);
        };
    };

    struct create_terminal_result {
        std::string terminal_id{};
        struct glaze {
            using T = create_terminal_result;
            static constexpr auto value = glz::object(&T::terminal_id);
        };
    };

    struct terminal_params {
        std::string session_id{};
        std::string terminal_id{};
        struct glaze {
            using T = terminal_params;
            static constexpr auto value = glz::object(&T::session_id, &T::terminal_id);
        };
    };

    struct wait_for_exit_result {
        std::optional<int> exit_code{};
        std::optional<std::string> signal{};
        struct glaze {
            using T = wait_for_exit_result;
            static constexpr auto value = glz::object(&T::exit_code, &T::signal);
        };
    };

    struct terminal_output_result {
        std::string output{};
        bool truncated{false};
        struct glaze {
            using T = terminal_output_result;
            static constexpr auto value = glz::object(&T::output, &T::truncated);
        };
    };

    // What run_command hands back to the program; null members are written out.
    struct command_result {
        std::optional<int> exit_code{};
        std::optional<std::string> signal{};
        std::string output{};
        bool truncated{false};
        struct glaze {
            using T = command_result;
            static constexpr auto value = glz::object(&T::exit_code, &T::signal, &T::output, &T::truncated);
        };
    };

    // ── plain HTTP beside the WebSocket endpoint ────────────────────

    struct health_result {
        std::string status{"ok"};
        struct glaze {
            using T = health_result;
            static constexpr auto value = glz::object(&T::status);
        };
    };

    struct echo_result {
        glz::raw_json echo{};
        struct glaze {
            using T = echo_result;
            static constexpr auto value = glz::object(&T::echo);
        };
    };

}  // namespace keel::schema
