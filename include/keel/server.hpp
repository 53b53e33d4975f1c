#pragma once

#include "agent.hpp"
#include "bridge.hpp"
#include "config.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "sandbox.hpp"
#include "transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace keel {

    /*
     * Owns the loop, the registry, the sandbox pool and the front-ends selected by host_config::mode.
     *
     * run() blocks the calling thread, which becomes the loop thread. It returns after SIGINT/SIGTERM, stop(), or
     * (in stdio mode) the editor closing stdin. Shutdown cancels every turn, closes every connection and joins
     * the sandbox workers.
     */
    class server {
      public:
        explicit server(host_config cfg);
        ~server();

        server(const server&) = delete;
        server& operator=(const server&) = delete;

        int run();

        // Safe from any thread.
        void stop();

        // Wraps an established transport in a connection and its router; run the returned router on the loop.
        std::shared_ptr<router> attach(std::unique_ptr<transport> t, std::string label, bool legacy);

        asio::io_context& context() { return ctx_; }
        session_registry& registry() { return registry_; }
        const host_config& config() const { return config_; }

        // Bound WebSocket port; meaningful once run() has started listening (useful with listen_port 0).
        std::optional<std::uint16_t> bound_port() const { return bound_port_; }

      private:
        void listen();
        asio::awaitable<void> accept_loop();
        asio::awaitable<void> serve_websocket(asio::ip::tcp::socket socket);
        asio::awaitable<void> serve_stdio();
        void shutdown();

        host_config config_;
        asio::io_context ctx_{1};
        session_registry registry_;
        sandbox engine_;
        bridge host_bridge_;
        std::unique_ptr<agent_backend> backend_;
        asio::signal_set signals_;
        std::optional<asio::ip::tcp::acceptor> acceptor_{};
        std::optional<std::uint16_t> bound_port_{};
        std::vector<std::weak_ptr<connection>> live_{};
        bool stopping_{false};
    };

}  // namespace keel
