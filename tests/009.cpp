#include "utils.hpp"

#include <boost/asio/use_future.hpp>

#include <algorithm>

namespace keel::test {

    namespace detail {

        template <typename T>
        T payload_of(const std::optional<protocol::frame>& f) {
            REQUIRE(f.has_value());
            REQUIRE(f->result.has_value());
            auto parsed = protocol::read_payload<T>(f->result->str);
            REQUIRE(parsed.has_value());
            return std::move(*parsed);
        }

        inline int32_t error_code_of(const std::optional<protocol::frame>& f) {
            REQUIRE(f.has_value());
            REQUIRE(f->error.has_value());
            return f->error->code;
        }

        inline std::string session_params(std::string_view session_id) {
            return R"({{"session_id":"{}"}})"_format(session_id);
        }

        inline std::string prompt_params(std::string_view session_id, std::string_view text) {
            auto json = protocol::write_payload(
                    schema::prompt_params{.session_id = std::string{session_id}, .prompt = {{.text = std::string{text}}}});
            return json.value();
        }

        inline std::string execute_params(std::string_view session_id, std::string_view code) {
            auto json = protocol::write_payload(
                    schema::execute_code_params{.session_id = std::string{session_id}, .code = std::string{code}});
            return json.value();
        }

        inline std::string open_session(host_fixture& fx, test_client& c, std::string_view cwd = "/work") {
            auto reply = fx.run([&]() { return c.call("new_session", R"({{"cwd":"{}","mcp_servers":[]}})"_format(cwd)); });
            return payload_of<schema::new_session_result>(reply).session_id;
        }

        inline std::string text_of(glz::generic& update) {
            auto* s = std::get_if<std::string>(&update["content"]["text"].data);
            return s ? *s : std::string{};
        }

        inline std::string location_of(glz::generic& start) {
            auto* locations = std::get_if<glz::generic::array_t>(&start["locations"].data);
            if (!locations || locations->empty()) {
                return {};
            }
            return str_of(locations->front(), "path");
        }

        // Polls on the loop until `pred` holds or two seconds pass.
        template <typename Pred>
        bool eventually(host_fixture& fx, Pred pred) {
            return fx.run([&]() -> asio::awaitable<bool> {
                for (int i = 0; i < 200; ++i) {
                    if (pred()) {
                        co_return true;
                    }
                    co_await sleep_for(10ms);
                }
                co_return pred();
            });
        }

    }  // namespace detail

    TEST_CASE("009: initialize reports the agent", "[009][router]") {
        host_config cfg{};
        cfg.agent_name = "test-agent";
        host_fixture fx{cfg};
        auto a = fx.connect("a");

        auto reply = fx.run([&]() {
            return a.client.call("initialize", R"({"protocol_version":1,"client_info":{"name":"zed","version":"1.0"}})");
        });
        auto result = detail::payload_of<schema::initialize_result>(reply);
        CHECK(result.protocol_version == 1);
        CHECK(result.agent_info.name == "test-agent");
        CHECK(result.agent_info.version == std::string{keel_version});
        CHECK(result.agent_capabilities.execute_code);
        CHECK(result.agent_capabilities.load_session);
    }

    TEST_CASE("009: sessions belong to the client that opened them", "[009][router][ownership]") {
        host_fixture fx{};
        auto a = fx.connect("a");
        auto b = fx.connect("b");

        auto sid = detail::open_session(fx, a.client);
        CHECK(sid.starts_with("session-"));

        auto prompt = fx.run([&]() { return b.client.call("prompt", detail::prompt_params(sid, "hi")); });
        CHECK(detail::error_code_of(prompt) == -32001);
        auto cancel = fx.run([&]() { return b.client.call("cancel", detail::session_params(sid)); });
        CHECK(detail::error_code_of(cancel) == -32001);
        auto release = fx.run([&]() { return b.client.call("release_session", detail::session_params(sid)); });
        CHECK(detail::error_code_of(release) == -32001);
        auto exec = fx.run([&]() { return b.client.call("execute_code", detail::execute_params(sid, "print(1)")); });
        CHECK(detail::error_code_of(exec) == -32001);

        auto listed = fx.run([&]() { return b.client.call("list_sessions"); });
        CHECK(detail::payload_of<schema::list_sessions_result>(listed).sessions.empty());

        // the owner is unaffected, and b saw none of a's updates
        auto own = fx.run([&]() { return a.client.call("prompt", detail::prompt_params(sid, "still mine")); });
        CHECK(detail::payload_of<schema::prompt_result>(own).stop_reason == "end_turn");
        CHECK(b.client.notifications.empty());

        auto missing = fx.run([&]() { return a.client.call("prompt", detail::prompt_params("session-999", "x")); });
        CHECK(detail::error_code_of(missing) == -32002);
    }

    TEST_CASE("009: disconnect removes the client and its sessions", "[009][router][disconnect]") {
        host_config cfg{};
        cfg.bridge_timeout = 2s;
        host_fixture fx{cfg};
        auto a = fx.connect("a");
        auto b = fx.connect("b");
        auto sid = detail::open_session(fx, a.client);
        auto kept = detail::open_session(fx, b.client);
        CHECK(fx.registry.snapshot().sessions == 2U);

        // a drops off while the host is waiting on one of its answers
        std::size_t pending_at_drop = 0;
        a.client.on_request = [&](const protocol::frame&) -> result<std::string> {
            pending_at_drop = a.agent_side->conn()->pending_count();
            a.client.end->close();
            return fail(errc::connection_closed, "gone");
        };
        auto reply = fx.run([&]() { return a.client.call("execute_code", detail::execute_params(sid, "read_file('x')")); });
        CHECK_FALSE(reply.has_value());
        CHECK(pending_at_drop == 1U);

        CHECK(detail::eventually(fx, [&]() {
            const auto& conn = a.agent_side->conn();
            return conn->state() == connection_state::closed && conn->pending_count() == 0U;
        }));

        auto snap = fx.registry.snapshot();
        CHECK(snap.clients == 1U);
        CHECK(snap.sessions == 1U);
        CHECK_FALSE(fx.registry.resolve_for_request(sid, std::nullopt).has_value());
        CHECK(fx.registry.resolve_for_request(kept, b.agent_side->conn()->client_id()).has_value());

        // the other client keeps working
        auto still = fx.run([&]() { return b.client.call("prompt", detail::prompt_params(kept, "ok")); });
        CHECK(detail::payload_of<schema::prompt_result>(still).stop_reason == "end_turn");
    }

    TEST_CASE("009: malformed frames get an error and the loop continues", "[009][router][protocol]") {
        host_fixture fx{};
        auto a = fx.connect("a");

        auto raw = fx.run([&]() -> asio::awaitable<result<std::string>> {
            co_await a.client.send_raw("{this is not json");
            co_return co_await a.client.end->read_frame();
        });
        REQUIRE(raw.has_value());
        auto f = protocol::decode(*raw);
        REQUIRE(f.has_value());
        CHECK_FALSE(f->id.has_value());
        REQUIRE(f->error.has_value());
        CHECK(f->error->code == -32700);

        auto unknown = fx.run([&]() { return a.client.call("teleport"); });
        CHECK(detail::error_code_of(unknown) == -32601);

        auto bad_params = fx.run([&]() { return a.client.call("prompt", R"({"session_id":42})"); });
        CHECK(detail::error_code_of(bad_params) == -32602);

        auto ok = fx.run([&]() { return a.client.call("initialize"); });
        CHECK(ok.has_value());
        CHECK_FALSE(ok->error.has_value());
    }

    TEST_CASE("009: echo turns stream the prompt back", "[009][router][prompt]") {
        host_fixture fx{};
        auto a = fx.connect("a");
        auto sid = detail::open_session(fx, a.client);

        auto reply = fx.run([&]() { return a.client.call("prompt", detail::prompt_params(sid, "hello there")); });
        CHECK(detail::payload_of<schema::prompt_result>(reply).stop_reason == "end_turn");
        auto chunks = a.client.updates("agent_message_chunk");
        REQUIRE(chunks.size() == 1U);
        CHECK(detail::text_of(chunks[0]) == "hello there");

        auto empty = fx.run([&]() { return a.client.call("prompt", detail::prompt_params(sid, "   ")); });
        CHECK(detail::payload_of<schema::prompt_result>(empty).stop_reason == "refusal");
    }

    TEST_CASE("009: code turns reach the editor through host capabilities", "[009][router][prompt][tools]") {
        host_config cfg{};
        cfg.backend = backend_kind::code;
        host_fixture fx{cfg};
        auto a = fx.connect("a");
        auto sid = detail::open_session(fx, a.client, "/work");

        std::vector<std::string> asked{};
        a.client.on_request = [&](const protocol::frame& f) -> result<std::string> {
            asked.push_back(*f.method);
            auto params = protocol::read_payload<schema::read_text_file_params>(f.params->str);
            if (!params || params->session_id != sid) {
                return fail(errc::invalid_params, "bad read request");
            }
            return R"({{"content":"contents of {}"}})"_format(params->path);
        };

        auto reply = fx.run([&]() {
            return a.client.call("prompt", detail::prompt_params(sid, "run this\n```python\nprint(read_file('notes.txt'))\n```\n"));
        });
        CHECK(detail::payload_of<schema::prompt_result>(reply).stop_reason == "end_turn");
        CHECK(asked == std::vector<std::string>{"fs_read_text_file"});

        // one record for the code block and one for the read it made
        auto starts = a.client.updates("tool_call");
        auto ends = a.client.updates("tool_call_update");
        REQUIRE(starts.size() == 2U);
        REQUIRE(ends.size() == 2U);
        CHECK(str_of(starts[0], "kind") == "execute");
        CHECK(str_of(starts[1], "kind") == "read");
        CHECK(str_of(ends[0], "tool_call_id") == str_of(starts[1], "tool_call_id"));
        CHECK(str_of(ends[0], "status") == "completed");
        CHECK(str_of(ends[1], "status") == "completed");

        auto chunks = a.client.updates("agent_message_chunk");
        REQUIRE(chunks.size() == 1U);
        CHECK(detail::text_of(chunks[0]) == "contents of /work/notes.txt\n");

        auto no_code = fx.run([&]() { return a.client.call("prompt", detail::prompt_params(sid, "just chatting")); });
        CHECK(detail::payload_of<schema::prompt_result>(no_code).stop_reason == "end_turn");
        CHECK(a.client.updates("agent_message_chunk").size() == 2U);
    }

    TEST_CASE("009: execute_code returns output and errors", "[009][router][execute]") {
        host_fixture fx{};
        auto a = fx.connect("a");
        auto sid = detail::open_session(fx, a.client);

        auto ok = fx.run([&]() { return a.client.call("execute_code", detail::execute_params(sid, "print(sum(range(5)))")); });
        auto result = detail::payload_of<schema::execute_code_result>(ok);
        CHECK(result.output == "10\n");
        CHECK_FALSE(result.error.has_value());
        CHECK(result.tool_call_id.starts_with("call_"));

        auto bad = fx.run([&]() { return a.client.call("execute_code", detail::execute_params(sid, "x = 1/0")); });
        auto failed = detail::payload_of<schema::execute_code_result>(bad);
        REQUIRE(failed.error.has_value());
        CHECK(failed.error->starts_with("runtime_error: ZeroDivisionError"));
        CHECK(a.client.updates("tool_call").size() == 2U);
    }

    TEST_CASE("009: every host call gets its own tool call record", "[009][router][execute][tools]") {
        host_fixture fx{};
        auto a = fx.connect("a");
        auto sid = detail::open_session(fx, a.client, "/work");

        a.client.on_request = [&](const protocol::frame& f) -> result<std::string> {
            if (*f.method == "fs_read_text_file") {
                return R"({"content":"alpha"})";
            }
            return fail(errc::access_denied, "read-only workspace");
        };

        auto reply = fx.run([&]() {
            return a.client.call(
                    "execute_code", detail::execute_params(sid, "print(read_file('a', line=2))\nwrite_file('b', 'x')\n"));
        });
        auto result = detail::payload_of<schema::execute_code_result>(reply);
        CHECK(result.output == "alpha\n");
        REQUIRE(result.error.has_value());
        CHECK(result.error->find("HostError") != std::string::npos);

        auto starts = a.client.updates("tool_call");
        auto ends = a.client.updates("tool_call_update");
        REQUIRE(starts.size() == 3U);
        REQUIRE(ends.size() == 3U);
        CHECK(str_of(starts[0], "kind") == "execute");
        CHECK(str_of(starts[1], "kind") == "read");
        CHECK(str_of(starts[1], "title") == "Read /work/a");
        CHECK(detail::location_of(starts[1]) == "/work/a");
        CHECK(str_of(starts[2], "kind") == "edit");
        CHECK(detail::location_of(starts[2]) == "/work/b");

        std::map<std::string, std::string> final_status{};
        for (auto& end : ends) {
            final_status[str_of(end, "tool_call_id")] = str_of(end, "status");
        }
        CHECK(final_status[str_of(starts[0], "tool_call_id")] == "failed");
        CHECK(final_status[str_of(starts[1], "tool_call_id")] == "completed");
        CHECK(final_status[str_of(starts[2], "tool_call_id")] == "failed");

        // out-of-range arguments never reach the client
        auto bad = fx.run([&]() {
            return a.client.call("execute_code", detail::execute_params(sid, "read_file('a', line=2**40)"));
        });
        auto rejected = detail::payload_of<schema::execute_code_result>(bad);
        REQUIRE(rejected.error.has_value());
        CHECK(rejected.error->find("ValueError") != std::string::npos);
        CHECK(a.client.updates("tool_call").size() == 4U);
    }

    TEST_CASE("009: a host call the bridge gives up on is marked failed", "[009][router][execute][tools]") {
        host_config cfg{};
        cfg.bridge_timeout = 200ms;
        host_fixture fx{cfg};
        auto a = fx.connect("a");
        auto sid = detail::open_session(fx, a.client);

        // the client reads everything but never answers the read request
        auto seen = fx.run([&]() -> asio::awaitable<std::vector<protocol::frame>> {
            co_await a.client.send_raw(protocol::encode_request(
                    protocol::request_id{std::int64_t{77}},
                    "execute_code",
                    detail::execute_params(sid, "try:\n    read_file('slow')\nexcept TimeoutError:\n    print('gave up')\n")));
            std::vector<protocol::frame> frames{};
            bool answered = false;
            std::size_t updates = 0;
            while (!answered || updates < 2U) {
                auto text = co_await a.client.end->read_frame();
                if (!text) {
                    break;
                }
                auto f = protocol::decode(*text);
                if (!f) {
                    continue;
                }
                if (protocol::classify(*f) == protocol::frame_kind::response) {
                    answered = true;
                }
                if (f->method && *f->method == "session_update") {
                    a.client.notifications.push_back(*f);
                    updates = a.client.updates("tool_call_update").size();
                }
                frames.push_back(std::move(*f));
            }
            co_return frames;
        });

        auto response = std::ranges::find_if(seen, [](const protocol::frame& f) { return f.result.has_value(); });
        REQUIRE(response != seen.end());
        auto result = protocol::read_payload<schema::execute_code_result>(response->result->str);
        REQUIRE(result.has_value());
        CHECK(result->output == "gave up\n");

        auto starts = a.client.updates("tool_call");
        REQUIRE(starts.size() == 2U);
        CHECK(str_of(starts[1], "kind") == "read");
        auto read_id = str_of(starts[1], "tool_call_id");
        auto ends = a.client.updates("tool_call_update");
        auto read_end = std::ranges::find_if(ends, [&](glz::generic& g) { return str_of(g, "tool_call_id") == read_id; });
        REQUIRE(read_end != ends.end());
        CHECK(str_of(*read_end, "status") == "failed");
    }

    TEST_CASE("009: a cancel notification stops the running turn", "[009][router][cancel]") {
        host_config cfg{};
        cfg.backend = backend_kind::code;
        cfg.execution_timeout = 10s;
        host_fixture fx{cfg};
        auto a = fx.connect("a");
        auto sid = detail::open_session(fx, a.client);
        auto owner = a.agent_side->conn()->client_id();

        auto turn = asio::co_spawn(
                fx.ctx,
                [&]() { return a.client.call("prompt", detail::prompt_params(sid, "```\nwhile True:\n    pass\n```")); },
                asio::use_future);

        CHECK(detail::eventually(fx, [&]() {
            auto s = fx.registry.resolve_for_request(sid, owner);
            return s && (*s)->turns == 1U;
        }));
        auto started = std::chrono::steady_clock::now();
        fx.run([&]() { return a.client.notify("cancel", detail::session_params(sid)); });

        auto reply = turn.get();
        CHECK(std::chrono::steady_clock::now() - started < 5s);
        CHECK(detail::payload_of<schema::prompt_result>(reply).stop_reason == "cancelled");
    }

    TEST_CASE("009: a session runs one turn at a time", "[009][router][cancel][busy]") {
        host_config cfg{};
        cfg.backend = backend_kind::code;
        cfg.execution_timeout = 10s;
        host_fixture fx{cfg};
        auto a = fx.connect("a");
        auto sid = detail::open_session(fx, a.client);
        auto owner = a.agent_side->conn()->client_id();

        auto turn = asio::co_spawn(
                fx.ctx,
                [&]() { return a.client.call("prompt", detail::prompt_params(sid, "```\nwhile True:\n    pass\n```")); },
                asio::use_future);
        CHECK(detail::eventually(fx, [&]() {
            auto s = fx.registry.resolve_for_request(sid, owner);
            return s && (*s)->turns == 1U;
        }));

        // the running call pumps the connection; these answers land in stray_responses
        fx.run([&]() -> asio::awaitable<void> {
            co_await a.client.send_raw(protocol::encode_request(
                    protocol::request_id{std::int64_t{500}}, "prompt", detail::prompt_params(sid, "again")));
            co_await a.client.send_raw(protocol::encode_request(
                    protocol::request_id{std::int64_t{501}}, "execute_code", detail::execute_params(sid, "print(1)")));
        });
        CHECK(detail::eventually(fx, [&]() { return a.client.stray_responses.size() == 2U; }));

        fx.run([&]() { return a.client.notify("cancel", detail::session_params(sid)); });
        auto reply = turn.get();
        CHECK(detail::payload_of<schema::prompt_result>(reply).stop_reason == "cancelled");

        REQUIRE(a.client.stray_responses.size() == 2U);
        for (const auto& f : a.client.stray_responses) {
            REQUIRE(f.error.has_value());
            CHECK(f.error->code == -32007);
        }
        CHECK(fx.registry.resolve_for_request(sid, owner).value()->turns == 1U);

        // the cancel belonged to the first turn only
        auto next = fx.run([&]() { return a.client.call("execute_code", detail::execute_params(sid, "print('free')")); });
        CHECK(detail::payload_of<schema::execute_code_result>(next).output == "free\n");
    }

    TEST_CASE("009: editors can load, fork and switch the mode of sessions", "[009][router][sessions]") {
        host_fixture fx{};
        auto a = fx.connect("a");
        auto b = fx.connect("b");

        auto loaded = fx.run([&]() {
            return a.client.call("load_session", R"({"session_id":"editor-abc","cwd":"/proj","mcp_servers":[]})");
        });
        CHECK_FALSE(loaded->error.has_value());
        auto again = fx.run([&]() {
            return a.client.call("load_session", R"({"session_id":"editor-abc","cwd":"/ignored","mcp_servers":[]})");
        });
        CHECK_FALSE(again->error.has_value());

        auto missing = fx.run([&]() {
            return a.client.call("load_session", R"({"session_id":"session-99","cwd":"/x","mcp_servers":[]})");
        });
        CHECK(detail::error_code_of(missing) == -32002);
        auto foreign = fx.run([&]() {
            return b.client.call("load_session", R"({"session_id":"editor-abc","cwd":"/x","mcp_servers":[]})");
        });
        CHECK(detail::error_code_of(foreign) == -32001);

        auto moded = fx.run([&]() {
            return a.client.call("set_session_mode", R"({"session_id":"editor-abc","mode_id":"architect"})");
        });
        CHECK_FALSE(moded->error.has_value());
        auto blank = fx.run([&]() {
            return a.client.call("set_session_mode", R"({"session_id":"editor-abc","mode_id":""})");
        });
        CHECK(detail::error_code_of(blank) == -32602);

        auto forked = fx.run([&]() { return a.client.call("fork_session", detail::session_params("editor-abc")); });
        auto fork_id = detail::payload_of<schema::new_session_result>(forked).session_id;
        CHECK(fork_id != "editor-abc");
        CHECK(fork_id.starts_with("session-"));
        auto stolen = fx.run([&]() { return b.client.call("fork_session", detail::session_params("editor-abc")); });
        CHECK(detail::error_code_of(stolen) == -32001);

        auto listed = fx.run([&]() { return a.client.call("list_sessions"); });
        auto sessions = detail::payload_of<schema::list_sessions_result>(listed).sessions;
        REQUIRE(sessions.size() == 2U);
        for (const auto& s : sessions) {
            CHECK(s.cwd == "/proj");
            CHECK(s.mode == "architect");
        }
        CHECK(std::ranges::any_of(sessions, [](const schema::session_summary& s) { return s.session_id == "editor-abc"; }));
        CHECK(std::ranges::any_of(sessions, [&](const schema::session_summary& s) { return s.session_id == fork_id; }));

        auto used = fx.run([&]() { return a.client.call("prompt", detail::prompt_params("editor-abc", "hi")); });
        CHECK(detail::payload_of<schema::prompt_result>(used).stop_reason == "end_turn");
    }

    TEST_CASE("009: an idle client is dropped with its sessions", "[009][router][disconnect]") {
        host_fixture fx{};
        auto a = fx.connect("a", false, 150ms);
        auto sid = detail::open_session(fx, a.client);
        CHECK(fx.registry.snapshot().clients == 1U);

        CHECK(detail::eventually(fx, [&]() {
            const auto& conn = a.agent_side->conn();
            return conn->state() == connection_state::closed && conn->pending_count() == 0U;
        }));
        CHECK(detail::eventually(fx, [&]() { return fx.registry.snapshot().sessions == 0U; }));
        CHECK(fx.registry.snapshot().clients == 0U);
        CHECK_FALSE(fx.registry.resolve_for_request(sid, std::nullopt).has_value());
    }

    TEST_CASE("009: sessions can be listed and released", "[009][router][sessions]") {
        host_fixture fx{};
        auto a = fx.connect("a");
        auto first = detail::open_session(fx, a.client, "/one");
        auto second = detail::open_session(fx, a.client, "/two");
        CHECK(first != second);

        auto listed = fx.run([&]() { return a.client.call("list_sessions"); });
        auto sessions = detail::payload_of<schema::list_sessions_result>(listed).sessions;
        REQUIRE(sessions.size() == 2U);
        CHECK(sessions[0].cwd == "/one");
        CHECK(sessions[1].cwd == "/two");

        auto released = fx.run([&]() { return a.client.call("release_session", detail::session_params(first)); });
        CHECK_FALSE(released->error.has_value());

        auto after = fx.run([&]() { return a.client.call("list_sessions"); });
        CHECK(detail::payload_of<schema::list_sessions_result>(after).sessions.size() == 1U);

        auto gone = fx.run([&]() { return a.client.call("prompt", detail::prompt_params(first, "x")); });
        CHECK(detail::error_code_of(gone) == -32002);
    }

    TEST_CASE("009: the single stdio client works without registering", "[009][router][legacy]") {
        host_config cfg{};
        cfg.mode = transport_mode::stdio;
        host_fixture fx{cfg, true};
        auto editor = fx.connect("stdio", true);

        auto sid = detail::open_session(fx, editor.client);
        CHECK(fx.registry.snapshot().clients == 0U);
        CHECK(fx.registry.snapshot().legacy_sessions == 1U);

        auto reply = fx.run([&]() { return editor.client.call("prompt", detail::prompt_params(sid, "hi")); });
        CHECK(detail::payload_of<schema::prompt_result>(reply).stop_reason == "end_turn");

        editor.client.end->close();
        CHECK(detail::eventually(fx, [&]() { return fx.registry.snapshot().sessions == 0U; }));
    }

}  // namespace keel::test
