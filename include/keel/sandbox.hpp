#pragma once

#include "connection.hpp"
#include "script.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace keel {

    using namespace std::string_view_literals;

    enum class execution_error_kind { syntax_error, runtime_error, execution_timeout, cancelled };

    inline constexpr std::string_view to_string(execution_error_kind kind) {
        switch (kind) {
            case execution_error_kind::syntax_error:
                return "syntax_error"sv;
            case execution_error_kind::runtime_error:
                return "runtime_error"sv;
            case execution_error_kind::execution_timeout:
                return "execution_timeout"sv;
            case execution_error_kind::cancelled:
                return "cancelled"sv;
        }
        return "runtime_error"sv;
    }

    struct execution_error {
        execution_error_kind kind{execution_error_kind::runtime_error};
        // Python-level exception name for runtime errors ("NameError", ...)
        std::string exception_kind{};
        std::string message{};
        std::optional<int> line{};

        // One line, e.g. "runtime_error: ZeroDivisionError: division by zero (line 1)"
        std::string summary() const;
    };

    struct execution_result {
        std::string tool_call_id{};
        std::string output{};
        bool output_truncated{false};
        std::optional<execution_error> error{};
    };

    // Host-backed names injected into a program's namespace next to the builtins.
    using capability_map = std::map<std::string, script::native_fn>;

    struct execution_request {
        std::string source{};
        capability_map callables{};
        std::chrono::milliseconds timeout{60'000};
        std::stop_token stop{};
        std::string title{"Run code"};
        // lifecycle notifications go here; none are sent when null
        std::shared_ptr<connection> notify{};
        std::string session_id{};
    };

    struct sandbox_limits {
        std::size_t max_source_bytes{256U * 1024U};
        std::size_t max_output_bytes{1U << 20U};
    };

    /*
     * Runs untrusted programs on a fixed pool of worker threads, never on the loop.
     *
     * Each execution parses first (a syntax error returns before any namespace exists), then runs with a fresh
     * interpreter whose namespace is exactly the builtin allowlist plus the request's callables. With a notify
     * connection, a tool_call notification precedes the run and exactly one terminal tool_call_update follows it.
     *
     * The timeout counts from submission, queueing included. A worker that has not reported back shortly after the
     * deadline (blocked in a host callable, or never picked up) is abandoned: the result is execution_timeout and
     * whatever the worker produces later is dropped.
     */
    class sandbox {
      public:
        sandbox(unsigned worker_threads, sandbox_limits limits);
        ~sandbox();

        sandbox(const sandbox&) = delete;
        sandbox& operator=(const sandbox&) = delete;

        // Awaited on the loop; the program itself runs on a worker.
        asio::awaitable<execution_result> execute(execution_request req);

        // Size check and parse only.
        std::optional<execution_error> validate(std::string_view source) const;

        // Waits for running programs and stops the workers. Idempotent.
        void shutdown();

        const sandbox_limits& limits() const { return limits_; }

      private:
        asio::thread_pool pool_;
        sandbox_limits limits_;
        bool stopped_{false};
    };

}  // namespace keel
