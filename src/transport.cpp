#include "keel/transport.hpp"

#include "keel/format.hpp"
#include "keel/schema.hpp"
#include "keel/utils.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/beast/websocket/stream_base.hpp>

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string_view>
#include <utility>

using namespace keel::literals;

namespace keel {

    namespace detail {

        static int dup_or_throw(int fd) {
            int copy = ::dup(fd);
            if (copy < 0) {
                throw std::runtime_error("dup({}) failed: {}"_format(fd, std::strerror(errno)));
            }
            return copy;
        }

        static bool is_peer_gone(const boost::system::error_code& ec) {
            return ec == asio::error::eof || ec == asio::error::broken_pipe || ec == asio::error::connection_reset ||
                   ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor ||
                   ec == beast::websocket::error::closed;
        }

    }  // namespace detail

    // ── stdio ───────────────────────────────────────────────────────

    stdio_transport::stdio_transport(
            asio::any_io_executor ex, int in_fd, int out_fd, std::chrono::milliseconds idle)
        : in_{ex, detail::dup_or_throw(in_fd)},
          out_{ex, detail::dup_or_throw(out_fd)},
          watchdog_{ex},
          idle_{idle} {}

    asio::awaitable<result<std::string>> stdio_transport::read_frame() {
        for (;;) {
            if (auto pos = buffer_.find('\n'); pos != std::string::npos) {
                std::string line = buffer_.substr(0, pos);
                buffer_.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (line.empty()) {
                    continue;
                }
                co_return line;
            }

            *idled_ = false;
            watchdog_.expires_after(idle_);
            watchdog_.async_wait([flag = idled_, &in = in_](const boost::system::error_code& ec) {
                if (!ec) {
                    *flag = true;
                    boost::system::error_code ignored;
                    in.cancel(ignored);
                }
            });

            boost::system::error_code ec;
            co_await asio::async_read_until(
                    in_, asio::dynamic_buffer(buffer_), '\n', asio::redirect_error(asio::use_awaitable, ec));
            watchdog_.cancel();

            if (ec == asio::error::eof) {
                // a final unterminated line is still a frame
                if (!buffer_.empty()) {
                    std::string line = std::move(buffer_);
                    buffer_.clear();
                    co_return line;
                }
                co_return fail(errc::connection_closed, "stdin closed");
            }
            if (ec) {
                if (*idled_) {
                    co_return fail(errc::timeout, "no frame within {}ms"_format(idle_.count()));
                }
                co_return fail(errc::connection_closed, "stdin read failed: {}"_format(ec.message()));
            }
        }
    }

    asio::awaitable<bool> stdio_transport::write_frame(std::string text) {
        text.push_back('\n');
        boost::system::error_code ec;
        co_await asio::async_write(out_, asio::buffer(text), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            log::debug{"stdio write dropped: ", ec.message()};
            co_return false;
        }
        co_return true;
    }

    void stdio_transport::close() {
        boost::system::error_code ec;
        watchdog_.cancel();
        in_.close(ec);
        out_.close(ec);
    }

    // ── websocket ───────────────────────────────────────────────────

    websocket_transport::websocket_transport(asio::ip::tcp::socket socket, std::chrono::milliseconds idle)
        : ws_{std::move(socket)}, idle_{idle} {
        boost::system::error_code ec;
        auto ep = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
        remote_ = ec ? std::string{"unknown"} : "{}:{}"_format(ep.address().to_string(), ep.port());
    }

    namespace detail {

        namespace http = beast::http;

        using http_request = http::request<http::string_body>;

        static std::string_view path_of(const http_request& req) {
            std::string_view target{req.target().data(), req.target().size()};
            return target.substr(0, target.find('?'));
        }

        static http::response<http::string_body> reply(const http_request& req, http::status status, std::string body) {
            http::response<http::string_body> res{status, req.version()};
            res.set(http::field::server, "keel");
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = std::move(body);
            res.prepare_payload();
            return res;
        }

        static std::string error_body(std::string_view message) {
            return R"({{"error":"{}"}})"_format(message);
        }

        // Answers every request that does not become a WebSocket.
        static http::response<http::string_body> serve_plain(const http_request& req) {
            auto path = path_of(req);
            if (path == "/health") {
                if (req.method() != http::verb::get) {
                    return reply(req, http::status::method_not_allowed, error_body("method not allowed"));
                }
                std::string body{};
                if (auto ec = glz::write_json(schema::health_result{}, body)) {
                    return reply(req, http::status::internal_server_error, error_body("encode failed"));
                }
                return reply(req, http::status::ok, std::move(body));
            }
            if (path == "/echo") {
                if (req.method() != http::verb::post) {
                    return reply(req, http::status::method_not_allowed, error_body("method not allowed"));
                }
                glz::generic parsed{};
                if (auto ec = glz::read_json(parsed, req.body())) {
                    return reply(req, http::status::bad_request, error_body("body is not JSON"));
                }
                std::string body{};
                if (auto ec = glz::write_json(schema::echo_result{.echo = glz::raw_json{req.body()}}, body)) {
                    return reply(req, http::status::internal_server_error, error_body("encode failed"));
                }
                return reply(req, http::status::ok, std::move(body));
            }
            if (path == "/ws") {
                return reply(req, http::status::upgrade_required, error_body("websocket upgrade required"));
            }
            return reply(req, http::status::not_found, error_body("not found"));
        }

    }  // namespace detail

    asio::awaitable<result<bool>> websocket_transport::accept() {
        auto& stream = beast::get_lowest_layer(ws_);
        detail::http_request req{};
        boost::system::error_code ec;

        stream.expires_after(std::chrono::seconds{30});
        co_await detail::http::async_read(stream, buffer_, req, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            co_return fail(errc::connection_closed, "http request from {} failed: {}"_format(remote_, ec.message()));
        }

        if (detail::path_of(req) != "/ws" || !beast::websocket::is_upgrade(req)) {
            auto res = detail::serve_plain(req);
            co_await detail::http::async_write(stream, res, asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                log::debug{"http reply to ", remote_, " dropped: ", ec.message()};
            }
            debug_log(req.method_string(), " ", detail::path_of(req), " from ", remote_, " -> ", res.result_int());
            close();
            co_return false;
        }

        // beast's websocket timeouts take over from the stream's own
        stream.expires_never();
        beast::websocket::stream_base::timeout opts{};
        opts.handshake_timeout = std::chrono::seconds{30};
        opts.idle_timeout = idle_;
        opts.keep_alive_pings = false;
        ws_.set_option(opts);
        ws_.text(true);

        co_await ws_.async_accept(req, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            co_return fail(errc::connection_closed, "websocket upgrade from {} failed: {}"_format(remote_, ec.message()));
        }
        co_return true;
    }

    asio::awaitable<result<std::string>> websocket_transport::read_frame() {
        boost::system::error_code ec;
        buffer_.clear();
        co_await ws_.async_read(buffer_, asio::redirect_error(asio::use_awaitable, ec));
        if (ec == beast::error::timeout) {
            co_return fail(errc::timeout, "no frame within {}ms"_format(idle_.count()));
        }
        if (ec) {
            co_return fail(errc::connection_closed, "websocket {} closed: {}"_format(remote_, ec.message()));
        }
        co_return beast::buffers_to_string(buffer_.data());
    }

    asio::awaitable<bool> websocket_transport::write_frame(std::string text) {
        boost::system::error_code ec;
        co_await ws_.async_write(asio::buffer(text), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (!detail::is_peer_gone(ec)) {
                log::warn{"websocket ", remote_, " write failed: ", ec.message()};
            }
            else {
                log::debug{"websocket ", remote_, " write dropped: ", ec.message()};
            }
            co_return false;
        }
        co_return true;
    }

    void websocket_transport::close() {
        boost::system::error_code ec;
        auto& sock = beast::get_lowest_layer(ws_).socket();
        sock.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }

}  // namespace keel
