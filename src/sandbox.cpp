#include "keel/sandbox.hpp"

#include "keel/format.hpp"
#include "keel/protocol.hpp"
#include "keel/schema.hpp"
#include "keel/updates.hpp"
#include "keel/utils.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <expected>
#include <functional>
#include <stop_token>

using namespace keel::literals;

namespace keel {

    namespace detail {

        struct code_input {
            std::string code{};
            struct glaze {
                using T = code_input;
                static constexpr auto value = glz::object(&T::code);
            };
        };

        // how long past its deadline the loop waits for a worker before giving up on it
        inline constexpr std::chrono::milliseconds abandon_grace{500};

        // Where a worker hands its outcome back to the loop.
        struct execution_slot {
            explicit execution_slot(asio::any_io_executor ex) : signal{ex} {}

            asio::steady_timer signal;
            bool done{false};
            script::run_outcome outcome{};
            std::optional<std::string> crash{};
            // stops the interpreter on a caller's stop request or when the loop abandons the run
            std::stop_source halt{};
            std::optional<std::stop_callback<std::function<void()>>> forward_stop{};
        };

        static std::expected<std::shared_ptr<const script::program>, execution_error> checked_parse(
                std::string_view source, std::size_t max_source_bytes) {
            if (source.size() > max_source_bytes) {
                return std::unexpected{execution_error{
                        .kind = execution_error_kind::syntax_error,
                        .exception_kind = "SyntaxError",
                        .message = "program is {} bytes; the limit is {}"_format(source.size(), max_source_bytes)}};
            }
            auto parsed = script::parse(source);
            if (!parsed) {
                return std::unexpected{execution_error{
                        .kind = execution_error_kind::syntax_error,
                        .exception_kind = "SyntaxError",
                        .message = std::move(parsed.error().message),
                        .line = parsed.error().line}};
            }
            return std::move(*parsed);
        }

        static execution_error from_failure(const script::run_failure& f, std::chrono::milliseconds timeout) {
            switch (f.kind) {
                case script::failure_kind::execution_timeout:
                    return execution_error{
                            .kind = execution_error_kind::execution_timeout,
                            .exception_kind = "TimeoutError",
                            .message = "execution exceeded {}ms"_format(timeout.count()),
                            .line = f.line};
                case script::failure_kind::cancelled:
                    return execution_error{
                            .kind = execution_error_kind::cancelled,
                            .exception_kind = f.exception_kind,
                            .message = f.message,
                            .line = f.line};
                case script::failure_kind::runtime_error:
                    break;
            }
            return execution_error{
                    .kind = execution_error_kind::runtime_error,
                    .exception_kind = f.exception_kind,
                    .message = f.message,
                    .line = f.line};
        }

        static std::string terminal_text(const execution_result& r) {
            if (!r.error) {
                return r.output;
            }
            if (r.output.empty()) {
                return r.error->summary();
            }
            return "{}\n{}"_format(r.output, r.error->summary());
        }

    }  // namespace detail

    std::string execution_error::summary() const {
        std::string out{to_string(kind)};
        out += ": ";
        if (!exception_kind.empty()) {
            out += exception_kind;
            out += ": ";
        }
        out += message;
        if (line) {
            out += " (line {})"_format(*line);
        }
        return out;
    }

    sandbox::sandbox(unsigned worker_threads, sandbox_limits limits)
        : pool_{std::max(1U, worker_threads)}, limits_{limits} {}

    sandbox::~sandbox() {
        shutdown();
    }

    void sandbox::shutdown() {
        if (stopped_) {
            return;
        }
        stopped_ = true;
        pool_.join();
    }

    std::optional<execution_error> sandbox::validate(std::string_view source) const {
        auto parsed = detail::checked_parse(source, limits_.max_source_bytes);
        if (!parsed) {
            return std::move(parsed.error());
        }
        return std::nullopt;
    }

    asio::awaitable<execution_result> sandbox::execute(execution_request req) {
        auto ex = co_await asio::this_coro::executor;
        execution_result out{.tool_call_id = new_tool_call_id()};

        if (req.notify) {
            schema::tool_call_start start{
                    .tool_call_id = out.tool_call_id, .title = req.title, .kind = "execute", .status = "in_progress"};
            if (auto input = protocol::write_payload(detail::code_input{.code = req.source})) {
                start.raw_input = glz::raw_json{*input};
            }
            co_await send_session_update(req.notify, req.session_id, std::move(start));
        }

        auto prog = detail::checked_parse(req.source, limits_.max_source_bytes);
        if (!prog) {
            out.error = std::move(prog.error());
        }
        else if (stopped_) {
            out.error = execution_error{.message = "sandbox is shut down"};
        }
        else {
            std::map<std::string, script::value> globals{};
            for (auto& [name, fn] : req.callables) {
                globals.emplace(name, script::value{std::make_shared<script::builtin_function>(name, std::move(fn))});
            }

            auto slot = std::make_shared<detail::execution_slot>(ex);
            slot->forward_stop.emplace(req.stop, [slot = slot.get()]() { slot->halt.request_stop(); });

            // the budget starts at submission, so time spent queued behind other programs counts against it
            auto deadline = std::chrono::steady_clock::now() + req.timeout;
            script::run_limits limits{
                    .deadline = deadline, .stop = slot->halt.get_token(), .max_output_bytes = limits_.max_output_bytes};

            asio::post(
                    pool_, [slot, ex, limits, prog = std::move(*prog), globals = std::move(globals)]() mutable {
                        script::run_outcome outcome{};
                        std::optional<std::string> crash{};
                        try {
                            outcome = script::run(std::move(prog), std::move(globals), limits);
                        } catch (const std::exception& e) {
                            crash = e.what();
                        }
                        asio::post(ex, [slot, outcome = std::move(outcome), crash = std::move(crash)]() mutable {
                            slot->outcome = std::move(outcome);
                            slot->crash = std::move(crash);
                            slot->done = true;
                            slot->signal.cancel();
                        });
                    });

            if (!slot->done) {
                slot->signal.expires_at(deadline + detail::abandon_grace);
                boost::system::error_code ec{};
                co_await slot->signal.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            }

            if (!slot->done) {
                // the worker is stuck in a host callable or still queued; its late outcome is dropped
                slot->halt.request_stop();
                log::warn{"abandoning execution ", out.tool_call_id, " after ", req.timeout.count(), "ms"};
                out.error = execution_error{
                        .kind = execution_error_kind::execution_timeout,
                        .exception_kind = "TimeoutError",
                        .message = "execution exceeded {}ms"_format(req.timeout.count())};
            }
            else if (slot->crash) {
                log::error{"sandbox worker failed: ", *slot->crash};
                out.error = execution_error{.exception_kind = "RuntimeError", .message = *slot->crash};
            }
            else {
                out.output = std::move(slot->outcome.output);
                out.output_truncated = slot->outcome.output_truncated;
                if (slot->outcome.failure) {
                    out.error = detail::from_failure(*slot->outcome.failure, req.timeout);
                }
            }
        }

        if (out.output_truncated) {
            out.output += "\n[output truncated]";
        }

        log::debug{
                "execution ", out.tool_call_id, " finished: ", out.error ? out.error->summary() : std::string{"ok"}};

        if (req.notify) {
            schema::tool_call_progress done{
                    .tool_call_id = out.tool_call_id, .status = out.error ? "failed" : "completed"};
            done.content.push_back(schema::content_block{.text = detail::terminal_text(out)});
            co_await send_session_update(req.notify, req.session_id, std::move(done));
        }

        co_return out;
    }

}  // namespace keel
