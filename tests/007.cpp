#include "utils.hpp"

namespace keel::test {

    namespace detail {
        struct sandbox_fixture : loop_fixture {
            sandbox engine{2U, sandbox_limits{}};

            ~sandbox_fixture() { engine.shutdown(); }

            execution_result execute(execution_request req) {
                return run([&]() { return engine.execute(std::move(req)); });
            }
        };

        // Decodes the session_update notifications a client end has received so far.
        inline std::vector<glz::generic> drain_updates(loop_fixture& loop, loopback_transport& end, std::size_t n) {
            std::vector<glz::generic> out{};
            for (std::size_t i = 0; i < n; ++i) {
                auto text = loop.run([&]() { return end.read_frame(); });
                REQUIRE(text.has_value());
                auto f = protocol::decode(*text);
                REQUIRE(f.has_value());
                REQUIRE(f->method == "session_update");
                glz::generic params{};
                REQUIRE_FALSE(glz::read_json(params, f->params->str));
                out.push_back(params["update"]);
            }
            return out;
        }
    }  // namespace detail

    TEST_CASE("007: runtime errors carry kind and line", "[007][sandbox]") {
        detail::sandbox_fixture fx{};
        auto r = fx.execute(execution_request{.source = "print('start')\nx = 1/0\n"});
        REQUIRE(r.error);
        CHECK(r.error->kind == execution_error_kind::runtime_error);
        CHECK(r.error->exception_kind == "ZeroDivisionError");
        CHECK(r.error->line == 2);
        CHECK(r.output == "start\n");
        CHECK(r.error->summary().starts_with("runtime_error: ZeroDivisionError: "));
        CHECK(r.error->summary().ends_with("(line 2)"));
        CHECK(r.tool_call_id.starts_with("call_"));
    }

    TEST_CASE("007: syntax errors return before running anything", "[007][sandbox]") {
        detail::sandbox_fixture fx{};
        auto r = fx.execute(execution_request{.source = "print('never')\ndef broken(:\n    pass\n"});
        REQUIRE(r.error);
        CHECK(r.error->kind == execution_error_kind::syntax_error);
        CHECK(r.error->line == 2);
        CHECK(r.output.empty());

        CHECK(fx.engine.validate("import os"));
        CHECK_FALSE(fx.engine.validate("x = [i for i in range(3)]"));
    }

    TEST_CASE("007: oversized programs are rejected", "[007][sandbox]") {
        loop_fixture loop{};
        sandbox small{1U, sandbox_limits{.max_source_bytes = 16}};
        auto r = loop.run([&]() { return small.execute(execution_request{.source = "x = 'this program is too long'"}); });
        small.shutdown();
        REQUIRE(r.error);
        CHECK(r.error->kind == execution_error_kind::syntax_error);
    }

    TEST_CASE("007: wall clock budget ends runaway programs", "[007][sandbox]") {
        detail::sandbox_fixture fx{};
        auto started = std::chrono::steady_clock::now();
        auto r = fx.execute(execution_request{.source = "n = 0\nwhile True:\n    n += 1\n", .timeout = 200ms});
        auto elapsed = std::chrono::steady_clock::now() - started;
        REQUIRE(r.error);
        CHECK(r.error->kind == execution_error_kind::execution_timeout);
        CHECK(r.error->exception_kind == "TimeoutError");
        CHECK(elapsed < 5s);
    }

    TEST_CASE("007: a worker stuck in a host callable is abandoned at the deadline", "[007][sandbox]") {
        detail::sandbox_fixture fx{};
        capability_map caps{};
        caps["stuck"] = [](script::native_args&) -> script::value {
            std::this_thread::sleep_for(1500ms);
            return script::value{};
        };

        auto started = std::chrono::steady_clock::now();
        auto r = fx.execute(
                execution_request{.source = "stuck()\nprint('late')\n", .callables = std::move(caps), .timeout = 200ms});
        CHECK(std::chrono::steady_clock::now() - started < 1200ms);
        REQUIRE(r.error);
        CHECK(r.error->kind == execution_error_kind::execution_timeout);
        CHECK(r.output.empty());
    }

    TEST_CASE("007: time spent queued counts against the budget", "[007][sandbox]") {
        loop_fixture loop{};
        sandbox engine{1U, sandbox_limits{}};

        capability_map caps{};
        caps["busy"] = [](script::native_args&) -> script::value {
            std::this_thread::sleep_for(1500ms);
            return script::value{};
        };
        auto first = asio::co_spawn(
                loop.ctx,
                engine.execute(execution_request{.source = "busy()\n", .callables = std::move(caps), .timeout = 5s}),
                asio::use_future);

        auto started = std::chrono::steady_clock::now();
        auto queued = loop.run([&]() { return engine.execute(execution_request{.source = "print(1)\n", .timeout = 200ms}); });
        CHECK(std::chrono::steady_clock::now() - started < 1200ms);
        REQUIRE(queued.error);
        CHECK(queued.error->kind == execution_error_kind::execution_timeout);

        auto done = first.get();
        CHECK_FALSE(done.error);
        engine.shutdown();
    }

    TEST_CASE("007: a stop request cancels the run", "[007][sandbox]") {
        detail::sandbox_fixture fx{};
        std::stop_source stop{};
        stop.request_stop();
        auto r = fx.execute(execution_request{.source = "while True:\n    pass\n", .stop = stop.get_token()});
        REQUIRE(r.error);
        CHECK(r.error->kind == execution_error_kind::cancelled);
    }

    TEST_CASE("007: missing capabilities surface as NameError", "[007][sandbox]") {
        detail::sandbox_fixture fx{};
        auto src = "try:\n    read_file('notes.txt')\nexcept NameError:\n    print('no read_file')\n";

        auto without = fx.execute(execution_request{.source = src});
        CHECK_FALSE(without.error);
        CHECK(without.output == "no read_file\n");

        capability_map caps{};
        caps["read_file"] = [](script::native_args& a) -> script::value {
            return "contents of " + script::str(a.required(0, "path", "read_file"));
        };
        auto with = fx.execute(execution_request{
                .source = "print(read_file('notes.txt'))\n", .callables = std::move(caps)});
        CHECK_FALSE(with.error);
        CHECK(with.output == "contents of notes.txt\n");

        auto uncaught = fx.execute(execution_request{.source = "run_command('ls')\n"});
        REQUIRE(uncaught.error);
        CHECK(uncaught.error->exception_kind == "NameError");
    }

    TEST_CASE("007: every execution gets a fresh namespace", "[007][sandbox]") {
        detail::sandbox_fixture fx{};
        auto first = fx.execute(execution_request{.source = "leak = 1\nprint = None\n"});
        CHECK_FALSE(first.error);

        auto second = fx.execute(execution_request{.source = "print('ok')\nleak\n"});
        REQUIRE(second.error);
        CHECK(second.output == "ok\n");
        CHECK(second.error->exception_kind == "NameError");

        // only the allowlist is reachable
        for (auto name : {"open", "eval", "exec", "__builtins__", "globals", "getattr", "input"}) {
            auto r = fx.execute(execution_request{.source = "{}\n"_format(name)});
            REQUIRE(r.error);
        }
    }

    TEST_CASE("007: truncated output is marked", "[007][sandbox]") {
        loop_fixture loop{};
        sandbox small{1U, sandbox_limits{.max_output_bytes = 8}};
        auto r = loop.run([&]() {
            return small.execute(execution_request{.source = "for i in range(50):\n    print(i)\n"});
        });
        small.shutdown();
        CHECK_FALSE(r.error);
        CHECK(r.output_truncated);
        CHECK(r.output.ends_with("\n[output truncated]"));
    }

    TEST_CASE("007: lifecycle notifications bracket each execution", "[007][sandbox][lifecycle]") {
        detail::sandbox_fixture fx{};
        auto [agent_end, client_end] = loopback_transport::make_pair(fx.executor());
        auto conn = std::make_shared<connection>(fx.executor(), std::move(agent_end), "lifecycle");
        conn->set_state(connection_state::active);

        auto ok = fx.execute(execution_request{.source = "print(6 * 7)\n", .notify = conn, .session_id = "session-1"});
        auto updates = detail::drain_updates(fx, *client_end, 2);
        CHECK(str_of(updates[0], "session_update") == "tool_call");
        CHECK(str_of(updates[0], "status") == "in_progress");
        CHECK(str_of(updates[0], "kind") == "execute");
        CHECK(str_of(updates[0], "tool_call_id") == ok.tool_call_id);
        CHECK(str_of(updates[0]["raw_input"], "code") == "print(6 * 7)\n");
        CHECK(str_of(updates[1], "session_update") == "tool_call_update");
        CHECK(str_of(updates[1], "status") == "completed");
        CHECK(str_of(updates[1], "tool_call_id") == ok.tool_call_id);
        CHECK(str_of(updates[1]["content"][0], "text") == "42\n");

        auto bad = fx.execute(execution_request{.source = "def (", .notify = conn, .session_id = "session-1"});
        auto failed = detail::drain_updates(fx, *client_end, 2);
        CHECK(str_of(failed[0], "status") == "in_progress");
        CHECK(str_of(failed[1], "status") == "failed");
        CHECK(str_of(failed[1]["content"][0], "text") == bad.error->summary());
        CHECK(bad.tool_call_id != ok.tool_call_id);
    }

}  // namespace keel::test
