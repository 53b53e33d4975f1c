#include "utils.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

namespace keel::test {

    namespace detail {

        namespace http = beast::http;
        using tcp = asio::ip::tcp;

        struct exchange {
            result<bool> upgraded{false};
            unsigned status{0};
            std::string body{};
        };

        // One plain HTTP request against a freshly accepted listener socket.
        inline asio::awaitable<exchange> plain_request(http::verb verb, std::string target, std::string body = {}) {
            auto ex = co_await asio::this_coro::executor;
            tcp::acceptor acceptor{ex, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}};
            beast::tcp_stream client{ex};
            co_await client.async_connect(acceptor.local_endpoint(), asio::use_awaitable);
            websocket_transport server_end{co_await acceptor.async_accept(asio::use_awaitable), 5s};

            http::request<http::string_body> req{verb, target, 11};
            req.set(http::field::host, "localhost");
            req.body() = std::move(body);
            req.prepare_payload();
            co_await http::async_write(client, req, asio::use_awaitable);

            exchange out{};
            out.upgraded = co_await server_end.accept();
            beast::flat_buffer buf{};
            http::response<http::string_body> res{};
            co_await http::async_read(client, buf, res, asio::use_awaitable);
            out.status = res.result_int();
            out.body = res.body();
            co_return out;
        }

        struct upgrade_outcome {
            result<bool> upgraded{false};
            result<std::string> first{};
            std::string handshake_error{};
        };

        struct listener_side {
            std::unique_ptr<websocket_transport> end{};
            result<bool> upgraded{false};
            result<std::string> first{};
            bool served{false};
        };

        // A WebSocket client handshaking against `target` and sending one text frame.
        inline asio::awaitable<upgrade_outcome> websocket_request(std::string target) {
            auto ex = co_await asio::this_coro::executor;
            tcp::acceptor acceptor{ex, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}};
            beast::websocket::stream<beast::tcp_stream> client{ex};
            co_await beast::get_lowest_layer(client).async_connect(acceptor.local_endpoint(), asio::use_awaitable);

            auto side = std::make_shared<listener_side>();
            side->end = std::make_unique<websocket_transport>(co_await acceptor.async_accept(asio::use_awaitable), 5s);
            asio::co_spawn(
                    ex,
                    [side]() -> asio::awaitable<void> {
                        side->upgraded = co_await side->end->accept();
                        if (side->upgraded && *side->upgraded) {
                            side->first = co_await side->end->read_frame();
                        }
                        side->served = true;
                    },
                    asio::detached);

            upgrade_outcome out{};
            boost::system::error_code ec;
            co_await client.async_handshake("localhost", target, asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                out.handshake_error = ec.message();
            }
            else {
                client.text(true);
                co_await client.async_write(
                        asio::buffer(std::string_view{"hello"}), asio::redirect_error(asio::use_awaitable, ec));
            }
            for (int i = 0; i < 200 && !side->served; ++i) {
                co_await sleep_for(10ms);
            }
            out.upgraded = side->upgraded;
            out.first = side->first;
            side->end->close();
            co_return out;
        }

    }  // namespace detail

    TEST_CASE("011: health answers over plain HTTP", "[011][http]") {
        loop_fixture loop{};

        auto ok = loop.run([]() { return detail::plain_request(detail::http::verb::get, "/health"); });
        REQUIRE(ok.upgraded.has_value());
        CHECK_FALSE(*ok.upgraded);
        CHECK(ok.status == 200U);
        CHECK(ok.body == R"({"status":"ok"})");

        auto query = loop.run([]() { return detail::plain_request(detail::http::verb::get, "/health?verbose=1"); });
        CHECK(query.status == 200U);

        auto wrong = loop.run([]() { return detail::plain_request(detail::http::verb::post, "/health", "{}"); });
        CHECK(wrong.status == 405U);
    }

    TEST_CASE("011: echo wraps a JSON body", "[011][http]") {
        loop_fixture loop{};

        auto echoed = loop.run(
                []() { return detail::plain_request(detail::http::verb::post, "/echo", R"({"a":[1,2.5]})"); });
        CHECK(echoed.status == 200U);
        CHECK(echoed.body == R"({"echo":{"a":[1,2.5]}})");

        auto garbage = loop.run([]() { return detail::plain_request(detail::http::verb::post, "/echo", "{oops"); });
        CHECK(garbage.status == 400U);

        auto fetched = loop.run([]() { return detail::plain_request(detail::http::verb::get, "/echo"); });
        CHECK(fetched.status == 405U);
    }

    TEST_CASE("011: only /ws upgrades to a WebSocket", "[011][http][websocket]") {
        loop_fixture loop{};

        auto plain_ws = loop.run([]() { return detail::plain_request(detail::http::verb::get, "/ws"); });
        CHECK(plain_ws.status == 426U);
        auto unknown = loop.run([]() { return detail::plain_request(detail::http::verb::get, "/nope"); });
        CHECK(unknown.status == 404U);

        auto upgraded = loop.run([]() { return detail::websocket_request("/ws"); });
        CHECK(upgraded.handshake_error.empty());
        REQUIRE(upgraded.upgraded.has_value());
        CHECK(*upgraded.upgraded);
        REQUIRE(upgraded.first.has_value());
        CHECK(*upgraded.first == "hello");

        auto refused = loop.run([]() { return detail::websocket_request("/elsewhere"); });
        CHECK_FALSE(refused.handshake_error.empty());
        REQUIRE(refused.upgraded.has_value());
        CHECK_FALSE(*refused.upgraded);
    }

}  // namespace keel::test
