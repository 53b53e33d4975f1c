#include "keel/server.hpp"

#include "keel/format.hpp"
#include "keel/utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <csignal>
#include <stdexcept>
#include <unistd.h>

using namespace keel::literals;

namespace keel {

    namespace detail {

        static auto log_failure(std::string what) {
            return [what = std::move(what)](std::exception_ptr e) {
                if (!e) {
                    return;
                }
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    log::error{what, ": ", ex.what()};
                }
            };
        }

    }  // namespace detail

    server::server(host_config cfg)
        : config_{std::move(cfg)},
          registry_{config_.single_client()},
          engine_{config_.worker_threads,
                  sandbox_limits{.max_source_bytes = config_.max_source_bytes, .max_output_bytes = config_.max_output_bytes}},
          host_bridge_{ctx_.get_executor()},
          backend_{make_backend(config_.backend)},
          signals_{ctx_, SIGINT, SIGTERM} {}

    server::~server() {
        engine_.shutdown();
    }

    std::shared_ptr<router> server::attach(std::unique_ptr<transport> t, std::string label, bool legacy) {
        auto conn = std::make_shared<connection>(ctx_.get_executor(), std::move(t), std::move(label));
        std::erase_if(live_, [](const std::weak_ptr<connection>& w) { return w.expired(); });
        live_.push_back(conn);
        return std::make_shared<router>(
                host_services{
                        .config = config_,
                        .registry = registry_,
                        .engine = engine_,
                        .host_bridge = host_bridge_,
                        .backend = *backend_},
                std::move(conn),
                legacy);
    }

    void server::listen() {
        namespace ip = asio::ip;
        boost::system::error_code ec;
        auto address = ip::make_address(config_.listen_host, ec);
        if (ec) {
            throw std::runtime_error("invalid listen_host '{}': {}"_format(config_.listen_host, ec.message()));
        }
        ip::tcp::endpoint endpoint{address, config_.listen_port};

        acceptor_.emplace(ctx_);
        acceptor_->open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_->set_option(asio::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_->bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_->listen(asio::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            throw std::runtime_error(
                    "failed to listen on {}:{}: {}"_format(config_.listen_host, config_.listen_port, ec.message()));
        }
        bound_port_ = acceptor_->local_endpoint().port();
        log::info{"listening on ws://", config_.listen_host, ":", *bound_port_};
    }

    asio::awaitable<void> server::accept_loop() {
        while (acceptor_ && acceptor_->is_open()) {
            boost::system::error_code ec;
            auto socket = co_await acceptor_->async_accept(asio::redirect_error(asio::use_awaitable, ec));
            if (ec == asio::error::operation_aborted) {
                break;
            }
            if (ec) {
                log::warn{"accept failed: ", ec.message()};
                continue;
            }
            asio::co_spawn(ctx_, serve_websocket(std::move(socket)), detail::log_failure("websocket client"));
        }
        debug_log("accept loop finished");
    }

    asio::awaitable<void> server::serve_websocket(asio::ip::tcp::socket socket) {
        auto ws = std::make_unique<websocket_transport>(std::move(socket), config_.idle_timeout);
        auto label = "ws {}"_format(ws->remote());
        auto upgraded = co_await ws->accept();
        if (!upgraded) {
            log::warn{upgraded.error().message};
            co_return;
        }
        if (!*upgraded) {
            co_return;
        }
        if (stopping_) {
            co_return;
        }
        co_await attach(std::move(ws), std::move(label), false)->run();
    }

    asio::awaitable<void> server::serve_stdio() {
        auto io = std::make_unique<stdio_transport>(ctx_.get_executor(), STDIN_FILENO, STDOUT_FILENO, config_.idle_timeout);
        // in dual mode the editor is one client among others and must register
        co_await attach(std::move(io), "stdio", config_.single_client())->run();
        if (config_.mode == transport_mode::stdio) {
            log::info{"stdio client left; shutting down"};
            shutdown();
        }
    }

    int server::run() {
        ::signal(SIGPIPE, SIG_IGN);

        signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            log::info{"received signal ", signo, "; shutting down"};
            shutdown();
        });

        if (config_.serves_websocket()) {
            listen();
            asio::co_spawn(ctx_, accept_loop(), detail::log_failure("accept loop"));
        }
        if (config_.serves_stdio()) {
            asio::co_spawn(ctx_, serve_stdio(), detail::log_failure("stdio client"));
        }

        log::info{
                "keel ", keel_version, " serving (mode=", to_string(config_.mode), ", backend=", backend_->name(),
                ", workers=", config_.worker_threads, ")"};

        ctx_.run();

        engine_.shutdown();
        log::info{"stopped"};
        return 0;
    }

    void server::stop() {
        asio::post(ctx_, [this]() { shutdown(); });
    }

    void server::shutdown() {
        if (stopping_) {
            return;
        }
        stopping_ = true;

        registry_.cancel_all_turns();

        boost::system::error_code ec;
        signals_.cancel(ec);
        if (acceptor_) {
            acceptor_->close(ec);
        }
        for (auto& weak : live_) {
            if (auto conn = weak.lock()) {
                conn->close();
            }
        }
        live_.clear();
        ctx_.stop();
    }

}  // namespace keel
