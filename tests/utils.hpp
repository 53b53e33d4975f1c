#pragma once

#include "keel/agent.hpp"
#include "keel/bridge.hpp"
#include "keel/config.hpp"
#include "keel/connection.hpp"
#include "keel/errors.hpp"
#include "keel/format.hpp"
#include "keel/protocol.hpp"
#include "keel/registry.hpp"
#include "keel/router.hpp"
#include "keel/sandbox.hpp"
#include "keel/schema.hpp"
#include "keel/script.hpp"
#include "keel/tools.hpp"
#include "keel/transport.hpp"
#include "loopback.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace keel::test {

    using namespace std::string_view_literals;
    using namespace std::chrono_literals;
    using namespace keel::literals;

    // An io_context running on its own thread for the lifetime of the fixture, the way the host runs its loop.
    struct loop_fixture {
        asio::io_context ctx{1};
        asio::executor_work_guard<asio::io_context::executor_type> guard{ctx.get_executor()};
        std::thread thread{[this]() { ctx.run(); }};

        loop_fixture() = default;
        loop_fixture(const loop_fixture&) = delete;
        loop_fixture& operator=(const loop_fixture&) = delete;

        ~loop_fixture() { halt(); }

        // Stops the loop and joins its thread. Idempotent.
        void halt() {
            if (!thread.joinable()) {
                return;
            }
            guard.reset();
            ctx.stop();
            thread.join();
        }

        asio::any_io_executor executor() { return ctx.get_executor(); }

        // Runs a coroutine factory on the loop and blocks the calling thread on its result.
        template <typename F>
        auto run(F&& f) {
            return asio::co_spawn(ctx, std::forward<F>(f), asio::use_future).get();
        }
    };

    inline asio::awaitable<void> sleep_for(std::chrono::milliseconds d) {
        asio::steady_timer t{co_await asio::this_coro::executor};
        t.expires_after(d);
        co_await t.async_wait(asio::use_awaitable);
    }

    // The far end of a loopback transport, acting as an editor or browser client.
    struct test_client {
        using request_handler = std::function<result<std::string>(const protocol::frame&)>;

        std::unique_ptr<loopback_transport> end{};
        std::vector<protocol::frame> notifications{};
        // responses to requests sent raw while a call was pumping
        std::vector<protocol::frame> stray_responses{};
        // answers agent -> client requests; unhandled requests get method_not_found
        request_handler on_request{};
        std::int64_t next_id{1};

        asio::awaitable<void> answer(const protocol::frame& f) {
            result<std::string> out = fail(errc::method_not_found, "test client does not serve {}"_format(*f.method));
            if (on_request) {
                out = on_request(f);
            }
            auto reply = out ? protocol::encode_result(*f.id, *out) : protocol::encode_error(f.id, out.error());
            co_await end->write_frame(std::move(reply));
        }

        // Sends a request and pumps frames until its response arrives. Returns the response frame, or nullopt when
        // the agent side went away.
        asio::awaitable<std::optional<protocol::frame>> call(std::string method, std::string params = "{}") {
            auto id = next_id++;
            co_await end->write_frame(protocol::encode_request(protocol::request_id{id}, method, params));
            co_return co_await wait_for(protocol::request_id{id});
        }

        asio::awaitable<std::optional<protocol::frame>> wait_for(protocol::request_id id) {
            for (;;) {
                auto text = co_await end->read_frame();
                if (!text) {
                    co_return std::nullopt;
                }
                auto f = protocol::decode(*text);
                if (!f) {
                    continue;
                }
                switch (protocol::classify(*f)) {
                    case protocol::frame_kind::response:
                        if (f->id == id) {
                            co_return std::move(*f);
                        }
                        stray_responses.push_back(std::move(*f));
                        break;
                    case protocol::frame_kind::request:
                        co_await answer(*f);
                        break;
                    case protocol::frame_kind::notification:
                        notifications.push_back(std::move(*f));
                        break;
                    case protocol::frame_kind::invalid:
                        break;
                }
            }
        }

        asio::awaitable<void> notify(std::string method, std::string params) {
            co_await end->write_frame(protocol::encode_notification(method, params));
        }

        // Raw text, for malformed-frame cases.
        asio::awaitable<void> send_raw(std::string text) { co_await end->write_frame(std::move(text)); }

        // session_update payloads of a given kind ("agent_message_chunk", "tool_call", "tool_call_update")
        std::vector<glz::generic> updates(std::string_view kind) const {
            std::vector<glz::generic> out{};
            for (const auto& n : notifications) {
                if (n.method != "session_update" || !n.params) {
                    continue;
                }
                glz::generic params{};
                if (glz::read_json(params, n.params->str)) {
                    continue;
                }
                auto& update = params["update"];
                auto* tag = std::get_if<std::string>(&update["session_update"].data);
                if (tag && *tag == kind) {
                    out.push_back(update);
                }
            }
            return out;
        }
    };

    // A router wired to a loopback pair plus the client end.
    struct attached {
        std::shared_ptr<router> agent_side{};
        test_client client{};
    };

    // Process-wide services for router tests, with a small worker pool.
    struct host_fixture : loop_fixture {
        host_config config{};
        session_registry registry;
        sandbox engine;
        bridge host_bridge;
        std::unique_ptr<agent_backend> backend;

        explicit host_fixture(host_config cfg = {}, bool single_client = false)
            : config{std::move(cfg)},
              registry{single_client},
              engine{2U, sandbox_limits{.max_source_bytes = config.max_source_bytes, .max_output_bytes = config.max_output_bytes}},
              host_bridge{ctx.get_executor()},
              backend{make_backend(config.backend)} {}

        ~host_fixture() {
            halt();
            engine.shutdown();
        }

        host_services services() {
            return host_services{
                    .config = config, .registry = registry, .engine = engine, .host_bridge = host_bridge, .backend = *backend};
        }

        // Starts a router on the loop; the read loop keeps running until the client end closes.
        attached connect(std::string label, bool legacy = false, std::chrono::milliseconds idle = std::chrono::minutes{5}) {
            auto [agent_end, client_end] = loopback_transport::make_pair(executor(), idle);
            auto conn = std::make_shared<connection>(executor(), std::move(agent_end), std::move(label));
            attached out{.agent_side = std::make_shared<router>(services(), conn, legacy)};
            out.client.end = std::move(client_end);
            asio::co_spawn(ctx, [r = out.agent_side]() { return r->run(); }, asio::detached);
            return out;
        }
    };

    // A string member of a decoded update, or "" when absent.
    inline std::string str_of(glz::generic& g, const char* key) {
        auto* s = std::get_if<std::string>(&g[key].data);
        return s ? *s : std::string{};
    }

    inline std::string write_temp_file(std::string_view name, std::string_view content) {
        auto path = std::filesystem::temp_directory_path() / "keel-tests";
        std::filesystem::create_directories(path);
        path /= name;
        std::ofstream out{path, std::ios::trunc};
        out << content;
        return path.string();
    }

}  // namespace keel::test
