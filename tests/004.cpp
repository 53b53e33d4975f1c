#include "utils.hpp"

#include <boost/asio/redirect_error.hpp>

namespace keel::test {

    namespace detail {
        // Collects `expected` requests, then answers them in reverse arrival order by echoing their params.
        inline asio::awaitable<void> answer_in_reverse(loopback_transport& end, std::size_t expected) {
            std::vector<protocol::frame> requests{};
            while (requests.size() < expected) {
                auto text = co_await end.read_frame();
                if (!text) {
                    co_return;
                }
                auto f = protocol::decode(*text);
                if (f && protocol::classify(*f) == protocol::frame_kind::request) {
                    requests.push_back(std::move(*f));
                }
            }
            for (auto it = requests.rbegin(); it != requests.rend(); ++it) {
                co_await end.write_frame(protocol::encode_result(*it->id, it->params ? it->params->str : "{}"));
            }
        }

        struct token_payload {
            std::string token{};
            struct glaze {
                using T = token_payload;
                static constexpr auto value = glz::object(&T::token);
            };
        };

        // Reads responses off the agent end and routes them, the way the router's read loop does.
        inline asio::awaitable<void> pump_responses(connection& conn, std::size_t expected) {
            for (std::size_t i = 0; i < expected; ++i) {
                auto text = co_await conn.io().read_frame();
                if (!text) {
                    co_return;
                }
                auto f = protocol::decode(*text);
                if (f && f->id && f->result) {
                    conn.resolve(protocol::to_string(*f->id), f->result->str);
                }
            }
        }
    }  // namespace detail

    TEST_CASE("004: pending table settles each waiter exactly once", "[004][pending]") {
        loop_fixture loop{};
        loop.run([&]() -> asio::awaitable<void> {
            auto ex = co_await asio::this_coro::executor;
            pending_table table{};
            auto a = table.add("a", ex);
            auto b = table.add("b", ex);
            REQUIRE(a);
            REQUIRE(b);
            CHECK_FALSE(table.add("a", ex));
            CHECK(table.size() == 2U);

            CHECK(table.resolve("a", std::string{"1"}));
            CHECK_FALSE(table.resolve("a", std::string{"2"}));
            REQUIRE(a->outcome);
            CHECK(**a->outcome == "1");

            CHECK(table.abort_all(make_error(errc::connection_closed, "gone")) == 1U);
            REQUIRE(b->outcome);
            REQUIRE_FALSE(*b->outcome);
            CHECK(b->outcome->error().code == errc::connection_closed);
            CHECK(table.size() == 0U);

            // late responses after abort are no-ops
            CHECK_FALSE(table.resolve("b", std::string{"late"}));
            CHECK(table.abort_all(make_error(errc::connection_closed, "again")) == 0U);
        });
    }

    TEST_CASE("004: send_request times out and forgets the waiter", "[004][pending]") {
        loop_fixture loop{};
        auto [agent_end, client_end] = loopback_transport::make_pair(loop.executor());
        auto conn = std::make_shared<connection>(loop.executor(), std::move(agent_end), "t");
        conn->set_state(connection_state::active);

        auto out = loop.run([&]() { return conn->send_request("fs_read_text_file", "{}", 100ms); });
        REQUIRE_FALSE(out);
        CHECK(out.error().code == errc::timeout);
        CHECK(conn->pending_count() == 0U);

        // the request did go out
        auto sent = loop.run([&]() { return client_end->read_frame(); });
        REQUIRE(sent);
        auto f = protocol::decode(*sent);
        REQUIRE(f);
        CHECK(f->method == "fs_read_text_file");
    }

    TEST_CASE("004: abort_all fails in-flight requests with connection_closed", "[004][pending]") {
        loop_fixture loop{};
        auto [agent_end, client_end] = loopback_transport::make_pair(loop.executor());
        auto conn = std::make_shared<connection>(loop.executor(), std::move(agent_end), "t");
        conn->set_state(connection_state::active);

        auto out = loop.run([&]() -> asio::awaitable<result<std::string>> {
            auto ex = co_await asio::this_coro::executor;
            asio::co_spawn(
                    ex,
                    [conn]() -> asio::awaitable<void> {
                        co_await sleep_for(20ms);
                        CHECK(conn->abort_all(make_error(errc::connection_closed, "client left")) == 1U);
                    },
                    asio::detached);
            co_return co_await conn->send_request("terminal_output", "{}", 10s);
        });
        REQUIRE_FALSE(out);
        CHECK(out.error().code == errc::connection_closed);
        CHECK(conn->pending_count() == 0U);

        conn->set_state(connection_state::closing);
        auto refused = loop.run([&]() { return conn->send_request("terminal_output", "{}", 1s); });
        REQUIRE_FALSE(refused);
        CHECK(refused.error().code == errc::connection_closed);
    }

    TEST_CASE("004: error responses reach the waiter as keel errors", "[004][pending]") {
        loop_fixture loop{};
        auto [agent_end, client_end] = loopback_transport::make_pair(loop.executor());
        auto conn = std::make_shared<connection>(loop.executor(), std::move(agent_end), "t");
        conn->set_state(connection_state::active);

        auto out = loop.run([&]() -> asio::awaitable<result<std::string>> {
            auto ex = co_await asio::this_coro::executor;
            asio::co_spawn(
                    ex,
                    [&]() -> asio::awaitable<void> {
                        auto text = co_await client_end->read_frame();
                        auto f = protocol::decode(*text);
                        conn->resolve(protocol::to_string(*f->id), fail(errc::unknown_session, "no such session"));
                    },
                    asio::detached);
            co_return co_await conn->send_request("fs_write_text_file", "{}", 5s);
        });
        REQUIRE_FALSE(out);
        CHECK(out.error().code == errc::unknown_session);
    }

    TEST_CASE("004: 1000 connections correlate out-of-order responses", "[004][pending][stress]") {
        loop_fixture loop{};
        constexpr std::size_t connections = 1000;
        constexpr std::size_t per_connection = 3;
        constexpr std::size_t total = connections * per_connection;

        struct peer {
            std::shared_ptr<connection> conn{};
            std::unique_ptr<loopback_transport> client{};
        };
        std::vector<peer> peers{};
        for (std::size_t i = 0; i < connections; ++i) {
            auto [agent_end, client_end] = loopback_transport::make_pair(loop.executor());
            auto conn = std::make_shared<connection>(loop.executor(), std::move(agent_end), "c{}"_format(i));
            conn->set_state(connection_state::active);
            peers.push_back(peer{.conn = std::move(conn), .client = std::move(client_end)});
        }

        struct tally {
            std::size_t done{0};
            std::size_t matched{0};
        };

        auto counts = loop.run([&]() -> asio::awaitable<tally> {
            auto ex = co_await asio::this_coro::executor;
            auto t = std::make_shared<tally>();
            asio::steady_timer all_done{ex};
            all_done.expires_after(60s);

            for (auto& p : peers) {
                asio::co_spawn(ex, detail::answer_in_reverse(*p.client, per_connection), asio::detached);
                asio::co_spawn(ex, detail::pump_responses(*p.conn, per_connection), asio::detached);
                for (std::size_t k = 0; k < per_connection; ++k) {
                    asio::co_spawn(
                            ex,
                            [conn = p.conn, k, t, &all_done]() -> asio::awaitable<void> {
                                auto token = "{}-{}"_format(conn->label(), k);
                                auto reply = co_await conn->send_request(
                                        "m", R"({"token":")" + token + R"("})", 30s);
                                if (reply) {
                                    auto parsed = protocol::read_payload<detail::token_payload>(*reply);
                                    if (parsed && parsed->token == token) {
                                        ++t->matched;
                                    }
                                }
                                if (++t->done == total) {
                                    all_done.cancel();
                                }
                            },
                            asio::detached);
                }
            }

            boost::system::error_code ec;
            co_await all_done.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            co_return *t;
        });

        CHECK(counts.done == total);
        CHECK(counts.matched == total);
        for (const auto& p : peers) {
            CHECK(p.conn->pending_count() == 0U);
        }
    }

}  // namespace keel::test
