#include "utils.hpp"

namespace keel::test {

    namespace detail {
        inline host_operation returns(std::string json) {
            return [json = std::move(json)]() -> asio::awaitable<std::string> { co_return json; };
        }

        inline host_operation fails_with(errc code, std::string message) {
            return [code, message = std::move(message)]() -> asio::awaitable<std::string> {
                throw host_failure{error{.code = code, .message = message}};
                co_return std::string{};
            };
        }

        inline host_operation sleeps(std::chrono::milliseconds d) {
            return [d]() -> asio::awaitable<std::string> {
                co_await sleep_for(d);
                co_return "true";
            };
        }

        // Kind of the script_error a bridge call raised, or "" when it returned.
        inline std::string raised_kind(const std::function<void()>& call) {
            try {
                call();
            } catch (const script::script_error& e) {
                return e.kind();
            }
            return {};
        }
    }  // namespace detail

    TEST_CASE("008: host values cross back into the program", "[008][bridge]") {
        loop_fixture loop{};
        bridge b{loop.ctx.get_executor()};
        script::native_args budget{};

        auto v = b.call_async(detail::returns(R"({"lines":["a","b"],"count":2,"ratio":0.5})"), 1s, budget);
        CHECK(script::repr(v) == "{'count': 2, 'lines': ['a', 'b'], 'ratio': 0.5}");
        CHECK(script::repr(b.call_async(detail::returns("null"), 1s, budget)) == "None");

        auto numbers = b.call_async(detail::returns(R"([9007199254740993, 2.0, 2, -0.5])"), 1s, budget);
        CHECK(script::repr(numbers) == "[9007199254740993, 2.0, 2, -0.5]");
    }

    TEST_CASE("008: host failures map to program exceptions", "[008][bridge]") {
        loop_fixture loop{};
        bridge b{loop.ctx.get_executor()};
        script::native_args budget{};

        CHECK(detail::raised_kind([&]() {
                  b.call_async(detail::fails_with(errc::internal, "no such file"), 1s, budget);
              }) == "HostError");
        CHECK(detail::raised_kind([&]() {
                  b.call_async(detail::fails_with(errc::timeout, "client did not answer"), 1s, budget);
              }) == "TimeoutError");
        CHECK(detail::raised_kind([&]() {
                  b.call_async(
                          []() -> asio::awaitable<std::string> {
                              throw std::runtime_error("socket gone");
                              co_return std::string{};
                          },
                          1s,
                          budget);
              }) == "HostError");
    }

    TEST_CASE("008: slow host calls time out and are abandoned", "[008][bridge]") {
        loop_fixture loop{};
        bridge b{loop.ctx.get_executor()};

        SECTION("own timeout") {
            script::native_args budget{};
            auto started = std::chrono::steady_clock::now();
            CHECK(detail::raised_kind([&]() { b.call_async(detail::sleeps(2s), 150ms, budget); }) == "TimeoutError");
            CHECK(std::chrono::steady_clock::now() - started < 1500ms);
        }
        SECTION("program budget is tighter") {
            script::native_args budget{.deadline = std::chrono::steady_clock::now() + 100ms};
            auto started = std::chrono::steady_clock::now();
            CHECK(detail::raised_kind([&]() { b.call_async(detail::sleeps(2s), 30s, budget); }) == "TimeoutError");
            CHECK(std::chrono::steady_clock::now() - started < 1500ms);
        }
        SECTION("stop request") {
            std::stop_source stop{};
            stop.request_stop();
            script::native_args budget{.stop = stop.get_token()};
            CHECK(detail::raised_kind([&]() { b.call_async(detail::sleeps(2s), 30s, budget); }) == "HostError");
        }

        // the loop is still responsive after abandoning the call
        auto v = b.call_async(detail::returns("7"), 1s, script::native_args{});
        CHECK(script::repr(v) == "7");
    }

    TEST_CASE("008: calling from the loop thread is refused", "[008][bridge]") {
        loop_fixture loop{};
        bridge b{loop.ctx.get_executor()};

        auto kind = loop.run([&]() -> asio::awaitable<std::string> {
            co_return detail::raised_kind([&]() { b.call_async(detail::returns("1"), 1s, script::native_args{}); });
        });
        CHECK(kind == "RuntimeError");
    }

    TEST_CASE("008: sandboxed programs see bridge failures as exceptions", "[008][bridge][sandbox]") {
        loop_fixture loop{};
        bridge b{loop.ctx.get_executor()};
        sandbox engine{1U, sandbox_limits{}};
        auto [agent_end, client_end] = loopback_transport::make_pair(loop.executor());
        auto conn = std::make_shared<connection>(loop.executor(), std::move(agent_end), "bridge");
        conn->set_state(connection_state::active);

        auto make_caps = [&]() {
            capability_map caps{};
            caps["slow"] = [&b](script::native_args& a) { return b.call_async(detail::sleeps(5s), 200ms, a); };
            caps["broken"] = [&b](script::native_args& a) {
                return b.call_async(detail::fails_with(errc::internal, "permission denied"), 1s, a);
            };
            return caps;
        };

        auto handled = loop.run([&]() {
            return engine.execute(execution_request{
                    .source = "try:\n    slow()\nexcept TimeoutError:\n    print('timed out')\n"
                              "try:\n    broken()\nexcept HostError as e:\n    print('host:', e)\n",
                    .callables = make_caps()});
        });
        CHECK_FALSE(handled.error);
        CHECK(handled.output == "timed out\nhost: permission denied\n");

        auto unhandled = loop.run([&]() {
            return engine.execute(execution_request{
                    .source = "slow()\n", .callables = make_caps(), .notify = conn, .session_id = "session-1"});
        });
        REQUIRE(unhandled.error);
        CHECK(unhandled.error->kind == execution_error_kind::runtime_error);
        CHECK(unhandled.error->exception_kind == "TimeoutError");

        std::vector<std::string> statuses{};
        for (int i = 0; i < 2; ++i) {
            auto text = loop.run([&]() { return client_end->read_frame(); });
            REQUIRE(text.has_value());
            auto f = protocol::decode(*text);
            REQUIRE(f.has_value());
            glz::generic params{};
            REQUIRE_FALSE(glz::read_json(params, f->params->str));
            statuses.push_back(std::get<std::string>(params["update"]["status"].data));
        }
        CHECK(statuses == std::vector<std::string>{"in_progress", "failed"});

        engine.shutdown();
    }

}  // namespace keel::test
