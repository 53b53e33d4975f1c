#pragma once

#include "errors.hpp"
#include "transport.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace keel {

    // Random UUID string, the id of every request this host originates.
    std::string new_request_id();

    struct pending_waiter {
        explicit pending_waiter(asio::any_io_executor ex) : signal{ex} {}

        // expires at the request deadline; resolving cancels it to wake the waiter early
        asio::steady_timer signal;
        std::optional<result<std::string>> outcome{};
    };

    /*
     * Outstanding outbound requests of one connection, keyed by request id. A waiter leaves the table exactly
     * once: through resolve(), abort_all(), or forget() after its deadline passes. Loop-confined.
     */
    class pending_table {
      public:
        // Returns nullptr if the id is already in flight.
        std::shared_ptr<pending_waiter> add(const std::string& id, asio::any_io_executor ex);

        // Fulfills and removes the waiter; false for unknown or already-settled ids.
        bool resolve(const std::string& id, result<std::string> outcome);

        // Fails every waiter with `reason` and clears the table. Returns how many were failed.
        std::size_t abort_all(const error& reason);

        void forget(const std::string& id);

        std::size_t size() const { return waiters_.size(); }
        bool contains(const std::string& id) const { return waiters_.contains(id); }

      private:
        std::unordered_map<std::string, std::shared_ptr<pending_waiter>> waiters_{};
    };

    enum class connection_state { connecting, active, closing, closed };

    inline constexpr std::string_view to_string(connection_state state) {
        switch (state) {
            case connection_state::connecting:
                return "connecting"sv;
            case connection_state::active:
                return "active"sv;
            case connection_state::closing:
                return "closing"sv;
            case connection_state::closed:
                return "closed"sv;
        }
        return "closed"sv;
    }

    // One per physical transport. Owns the pending table and a send path that tolerates a dead peer. All members
    // are used from the loop only; worker threads reach a connection through the bridge.
    class connection : public std::enable_shared_from_this<connection> {
      public:
        connection(asio::any_io_executor ex, std::unique_ptr<transport> t, std::string label);

        connection(const connection&) = delete;
        connection& operator=(const connection&) = delete;

        asio::any_io_executor get_executor() const { return ex_; }

        const std::string& label() const { return label_; }

        // Set once the registry assigns a client id.
        const std::optional<std::string>& client_id() const { return client_id_; }
        void set_client_id(std::string id) { client_id_ = std::move(id); }

        connection_state state() const { return state_; }
        void set_state(connection_state s) { state_ = s; }
        bool alive() const { return state_ == connection_state::connecting || state_ == connection_state::active; }

        transport& io() { return *transport_; }

        // Registers the waiter, then writes the request frame, then waits for resolve(), abort_all() or the
        // deadline. Fails with errc::timeout or errc::connection_closed.
        asio::awaitable<result<std::string>> send_request(
                std::string method, std::string params_json, std::chrono::milliseconds timeout);

        // Best effort; a dead peer is logged, never reported.
        asio::awaitable<void> send_notification(std::string method, std::string params_json);

        // Writes one encoded frame, serialized against every other writer on this connection.
        asio::awaitable<bool> send_frame(std::string text);

        // Routes an inbound response to its waiter. Unknown or duplicate ids are logged and dropped.
        bool resolve(const std::string& request_id, result<std::string> outcome);

        std::size_t abort_all(const error& reason);

        std::size_t pending_count() const { return pending_.size(); }

        // Stops further writes and closes the transport.
        void close();

      private:
        asio::any_io_executor ex_;
        std::unique_ptr<transport> transport_;
        std::string label_;
        std::optional<std::string> client_id_{};
        connection_state state_{connection_state::connecting};
        pending_table pending_{};

        bool writing_{false};
        // never expires; cancelled to wake writers queued behind the current one
        asio::steady_timer write_gate_;
    };

}  // namespace keel
