#include "keel/tools.hpp"

#include "keel/errors.hpp"
#include "keel/format.hpp"
#include "keel/protocol.hpp"
#include "keel/schema.hpp"
#include "keel/updates.hpp"
#include "keel/utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <exception>
#include <filesystem>
#include <limits>
#include <utility>

using namespace keel::literals;

namespace keel {

    namespace detail {

        template <typename Params>
        static asio::awaitable<std::string> round_trip(
                std::shared_ptr<connection> conn, std::string method, Params params, std::chrono::milliseconds timeout) {
            auto json = protocol::write_payload(params);
            if (!json) {
                throw host_failure{json.error()};
            }
            auto reply = co_await conn->send_request(method, std::move(*json), timeout);
            if (!reply) {
                throw host_failure{reply.error()};
            }
            co_return std::move(*reply);
        }

        template <typename Result>
        static Result parse_reply(std::string_view method, std::string_view reply) {
            auto parsed = protocol::read_payload<Result>(reply);
            if (!parsed) {
                throw host_failure{make_error(errc::internal, "malformed {} result: {}"_format(method, parsed.error().message))};
            }
            return std::move(*parsed);
        }

        template <typename T, glz::opts Opts = glz::opts{}>
        static std::string json_text(const T& v) {
            std::string out{};
            if (auto ec = glz::write<Opts>(v, out)) {
                throw host_failure{make_error(errc::internal, "cannot encode host result: {}"_format(glz::format_error(ec, out)))};
            }
            return out;
        }

        // JSON text handed to the program plus the text shown on the tool call once it completes.
        struct host_reply {
            std::string json{};
            std::string display{};
        };

        // The tool_call record of one host call. Only touched on the loop; worker threads reach it by posting.
        struct host_call_record {
            std::shared_ptr<connection> conn{};
            std::string session_id{};
            std::string tool_call_id{new_tool_call_id()};
            bool started{false};
            bool settled{false};
        };

        static asio::awaitable<void> announce(std::shared_ptr<host_call_record> rec, schema::tool_call_start start) {
            if (rec->settled) {
                co_return;
            }
            rec->started = true;
            start.tool_call_id = rec->tool_call_id;
            co_await send_session_update(rec->conn, rec->session_id, std::move(start));
        }

        // First settlement wins; a record that never started stays silent.
        static asio::awaitable<void> settle(std::shared_ptr<host_call_record> rec, std::string status, std::string text) {
            if (std::exchange(rec->settled, true) || !rec->started) {
                co_return;
            }
            schema::tool_call_progress done{.tool_call_id = rec->tool_call_id, .status = std::move(status)};
            if (!text.empty()) {
                done.content.push_back(schema::content_block{.text = std::move(text)});
            }
            co_await send_session_update(rec->conn, rec->session_id, std::move(done));
        }

        template <typename Op>
        static asio::awaitable<std::string> tracked(
                std::shared_ptr<host_call_record> rec, schema::tool_call_start start, Op op) {
            co_await announce(rec, std::move(start));

            host_reply reply{};
            std::exception_ptr failure{};
            std::string reason{};
            try {
                reply = co_await op();
            } catch (const std::exception& e) {
                failure = std::current_exception();
                reason = e.what();
            }

            if (failure) {
                co_await settle(rec, "failed", std::move(reason));
                std::rethrow_exception(failure);
            }
            co_await settle(rec, "completed", std::move(reply.display));
            co_return std::move(reply.json);
        }

        // Runs `op` through the bridge as one tracked tool call. A call the bridge gives up on (timeout, stop) is
        // failed from here, since its coroutine may still be waiting on the client.
        template <typename Op>
        static script::value call_tracked(
                const host_context& ctx, script::native_args& a, schema::tool_call_start start, Op op) {
            auto rec = std::make_shared<host_call_record>(host_call_record{.conn = ctx.conn, .session_id = ctx.session_id});
            try {
                return ctx.host_bridge->call_async(
                        [rec, start = std::move(start), op = std::move(op)]() { return tracked(rec, start, op); },
                        ctx.call_timeout,
                        a);
            } catch (const script::script_error& e) {
                if (ctx.conn) {
                    asio::co_spawn(ctx.conn->get_executor(), settle(rec, "failed", e.message()), asio::detached);
                }
                throw;
            }
        }

        static asio::awaitable<host_reply> read_file_op(
                std::shared_ptr<connection> conn, schema::read_text_file_params params, std::chrono::milliseconds timeout) {
            auto reply = co_await round_trip(conn, "fs_read_text_file", std::move(params), timeout);
            auto result = parse_reply<schema::read_text_file_result>("fs_read_text_file", reply);
            co_return host_reply{.json = json_text(result.content), .display = std::move(result.content)};
        }

        static asio::awaitable<host_reply> write_file_op(
                std::shared_ptr<connection> conn, schema::write_text_file_params params, std::chrono::milliseconds timeout) {
            co_await round_trip(conn, "fs_write_text_file", std::move(params), timeout);
            co_return host_reply{.json = "null"};
        }

        static asio::awaitable<host_reply> run_command_op(
                std::shared_ptr<connection> conn, schema::create_terminal_params params, std::chrono::milliseconds timeout) {
            auto created = parse_reply<schema::create_terminal_result>(
                    "terminal_create", co_await round_trip(conn, "terminal_create", params, timeout));
            schema::terminal_params terminal{.session_id = params.session_id, .terminal_id = created.terminal_id};

            schema::wait_for_exit_result status{};
            schema::terminal_output_result output{};
            std::exception_ptr failure{};
            try {
                status = parse_reply<schema::wait_for_exit_result>(
                        "terminal_wait_for_exit", co_await round_trip(conn, "terminal_wait_for_exit", terminal, timeout));
                output = parse_reply<schema::terminal_output_result>(
                        "terminal_output", co_await round_trip(conn, "terminal_output", terminal, timeout));
            } catch (const std::exception&) {
                failure = std::current_exception();
            }

            // the terminal is released whether or not the command could be observed
            auto release_json = protocol::write_payload(terminal);
            if (release_json) {
                auto released = co_await conn->send_request("terminal_release", std::move(*release_json), timeout);
                if (!released) {
                    log::debug{"terminal_release ", terminal.terminal_id, " failed: ", released.error().message};
                }
            }

            if (failure) {
                std::rethrow_exception(failure);
            }

            schema::command_result result{
                    .exit_code = status.exit_code,
                    .signal = status.signal,
                    .output = std::move(output.output),
                    .truncated = output.truncated};
            auto json = json_text<schema::command_result, glz::opts{.skip_null_members = false}>(result);
            co_return host_reply{.json = std::move(json), .display = std::move(result.output)};
        }

        static std::string string_arg(const script::native_args& a, std::size_t i, std::string_view name, std::string_view fname) {
            const auto& v = a.required(i, name, fname);
            if (auto* s = v.get_if<std::string>()) {
                return *s;
            }
            throw script::script_error{
                    "TypeError", "{}() argument '{}' must be str, not {}"_format(fname, name, script::type_name(v))};
        }

        static std::optional<int> int_arg(const script::native_args& a, std::size_t i, std::string_view name, std::string_view fname) {
            auto* v = a.find(i, name);
            if (!v || v->is_none()) {
                return std::nullopt;
            }
            if (auto* n = v->get_if<std::int64_t>()) {
                if (*n < 0 || *n > std::numeric_limits<int>::max()) {
                    throw script::script_error{
                            "ValueError", "{}() argument '{}' out of range: {}"_format(fname, name, *n)};
                }
                return static_cast<int>(*n);
            }
            throw script::script_error{
                    "TypeError", "{}() argument '{}' must be int, not {}"_format(fname, name, script::type_name(*v))};
        }

    }  // namespace detail

    std::string resolve_path(const std::string& cwd, const std::string& path) {
        std::filesystem::path p{path};
        if (p.is_relative() && !cwd.empty()) {
            p = std::filesystem::path{cwd} / p;
        }
        return p.lexically_normal().string();
    }

    capability_map make_host_capabilities(host_context ctx) {
        capability_map caps{};

        caps["read_file"] = [ctx](script::native_args& a) -> script::value {
            schema::read_text_file_params params{
                    .session_id = ctx.session_id,
                    .path = resolve_path(ctx.cwd, detail::string_arg(a, 0, "path", "read_file")),
                    .line = detail::int_arg(a, 1, "line", "read_file"),
                    .limit = detail::int_arg(a, 2, "limit", "read_file")};
            schema::tool_call_start start{
                    .title = "Read {}"_format(params.path),
                    .kind = "read",
                    .status = "in_progress",
                    .locations = {schema::tool_call_location{.path = params.path, .line = params.line}}};
            return detail::call_tracked(
                    ctx, a, std::move(start), [conn = ctx.conn, params, timeout = ctx.request_timeout]() {
                        return detail::read_file_op(conn, params, timeout);
                    });
        };

        caps["write_file"] = [ctx](script::native_args& a) -> script::value {
            schema::write_text_file_params params{
                    .session_id = ctx.session_id,
                    .path = resolve_path(ctx.cwd, detail::string_arg(a, 0, "path", "write_file")),
                    .content = detail::string_arg(a, 1, "content", "write_file")};
            schema::tool_call_start start{
                    .title = "Write {}"_format(params.path),
                    .kind = "edit",
                    .status = "in_progress",
                    .locations = {schema::tool_call_location{.path = params.path}}};
            return detail::call_tracked(
                    ctx, a, std::move(start), [conn = ctx.conn, params, timeout = ctx.request_timeout]() {
                        return detail::write_file_op(conn, params, timeout);
                    });
        };

        caps["run_command"] = [ctx](script::native_args& a) -> script::value {
            schema::create_terminal_params params{
                    .session_id = ctx.session_id, .command = detail::string_arg(a, 0, "command", "run_command")};
            if (auto* args = a.find(1, "args"); args && !args->is_none()) {
                auto* list = args->get_if<std::shared_ptr<script::list_object>>();
                if (!list) {
                    throw script::script_error{"TypeError", "run_command() argument 'args' must be a list of str"};
                }
                for (const auto& item : (*list)->items) {
                    auto* s = item.get_if<std::string>();
                    if (!s) {
                        throw script::script_error{"TypeError", "run_command() argument 'args' must be a list of str"};
                    }
                    params.args.push_back(*s);
                }
            }
            if (auto* cwd = a.find(2, "cwd"); cwd && !cwd->is_none()) {
                params.cwd = resolve_path(ctx.cwd, detail::string_arg(a, 2, "cwd", "run_command"));
            }
            else if (!ctx.cwd.empty()) {
                params.cwd = ctx.cwd;
            }
            std::string title = "Run " + params.command;
            for (const auto& arg : params.args) {
                title += ' ';
                title += arg;
            }
            schema::tool_call_start start{.title = std::move(title), .kind = "execute", .status = "in_progress"};
            return detail::call_tracked(
                    ctx, a, std::move(start), [conn = ctx.conn, params, timeout = ctx.request_timeout]() {
                        return detail::run_command_op(conn, params, timeout);
                    });
        };

        return caps;
    }

}  // namespace keel
