#pragma once

#include "agent.hpp"
#include "bridge.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "protocol.hpp"
#include "registry.hpp"
#include "sandbox.hpp"

#include <boost/asio/awaitable.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace keel {

    inline constexpr std::string_view keel_version = "0.1.0"sv;

    // Process-wide services every connection's router dispatches into.
    struct host_services {
        const host_config& config;
        session_registry& registry;
        sandbox& engine;
        const bridge& host_bridge;
        const agent_backend& backend;
    };

    /*
     * The read loop and state machine of one connection.
     *
     *   connecting: registers the connection as a client (the single stdio client of a stdio-only host skips this
     *               and works on unowned sessions)
     *   active:     reads frames; responses resolve pending requests, each request runs as its own coroutine,
     *               malformed frames get a -32700 reply and the loop continues
     *   closing:    entered once when the read side ends: abort pending requests, unregister, cancel the turns
     *               of the sessions unregistering removed
     *   closed:     terminal
     */
    class router : public std::enable_shared_from_this<router> {
      public:
        // `legacy` marks the stdio client of a stdio-only host; it does not register and owns no sessions.
        router(host_services services, std::shared_ptr<connection> conn, bool legacy);

        router(const router&) = delete;
        router& operator=(const router&) = delete;

        // Runs until the transport fails, idles out or is closed, then tears the connection down.
        asio::awaitable<void> run();

        const std::shared_ptr<connection>& conn() const { return conn_; }

      private:
        std::optional<std::string> caller() const { return conn_->client_id(); }

        void route_response(const protocol::frame& f);
        void spawn_request(protocol::frame f);
        asio::awaitable<void> handle_request(protocol::frame f);
        asio::awaitable<void> handle_notification(protocol::frame f);

        asio::awaitable<result<std::string>> dispatch(protocol::method m, std::string_view params);

        asio::awaitable<result<std::string>> on_initialize(std::string_view params);
        asio::awaitable<result<std::string>> on_new_session(std::string_view params);
        asio::awaitable<result<std::string>> on_load_session(std::string_view params);
        asio::awaitable<result<std::string>> on_fork_session(std::string_view params);
        asio::awaitable<result<std::string>> on_set_session_mode(std::string_view params);
        asio::awaitable<result<std::string>> on_prompt(std::string_view params);
        asio::awaitable<result<std::string>> on_cancel(std::string_view params);
        asio::awaitable<result<std::string>> on_list_sessions(std::string_view params);
        asio::awaitable<result<std::string>> on_release_session(std::string_view params);
        asio::awaitable<result<std::string>> on_execute_code(std::string_view params);

        capability_map capabilities_for(const session_state& session) const;

        void teardown();

        host_services services_;
        std::shared_ptr<connection> conn_;
        bool legacy_;
        bool torn_down_{false};
    };

}  // namespace keel
