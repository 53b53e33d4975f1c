#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace keel {

    class connection;

    // Opaque per-session state. Identity fields are fixed at creation. The rest is touched only on the loop: the
    // turn stop source is replaced by the router when a turn starts on an idle session and requested on cancel or
    // owner disconnect.
    struct session_state {
        std::string session_id{};
        std::optional<std::string> owner{};
        std::string cwd{};
        std::string mode{"default"};

        std::stop_source turn_stop{};
        std::uint64_t turns{0};
        // a prompt turn or execute_code call is running
        bool busy{false};

        void cancel_turn() { turn_stop.request_stop(); }
    };

    struct registry_snapshot {
        std::size_t clients{};
        std::size_t sessions{};
        std::size_t legacy_sessions{};
    };

    /*
     * Client and session bookkeeping shared by every connection.
     *
     * Three maps (clients, sessions, session owners) guarded by one mutex; every read-modify-write across them
     * happens in a single critical section, so a session id is in the owner map iff it is in the session map.
     * Validation precedes mutation: a failed call leaves the registry unchanged.
     *
     * Unowned ("legacy") sessions exist only in single-client mode and are reachable only while no client is
     * registered.
     */
    class session_registry {
      public:
        explicit session_registry(bool single_client) : single_client_{single_client} {}

        bool single_client() const { return single_client_; }

        // Assigns the next client-<n>; ids are never reused.
        std::string register_client(std::shared_ptr<connection> conn);

        // Removes the client and every session it owns in one critical section. Returns the removed sessions, whose
        // ids and turns the caller releases (empty for unknown ids).
        std::vector<std::shared_ptr<session_state>> unregister_client(const std::string& client_id);

        // Assigns the next free session-<n>.
        result<std::string> new_session(const std::optional<std::string>& owner, session_state state = {});

        result<std::shared_ptr<session_state>> resolve_for_request(
                const std::string& session_id, const std::optional<std::string>& caller) const;

        // Returns the existing state, or creates one with `make` while still holding the lock, so concurrent
        // callers for the same id converge on one object. Ids shaped like the ones new_session assigns are never
        // created here: an absent session-<n> is unknown_session.
        result<std::shared_ptr<session_state>> resolve_or_create(
                const std::string& session_id,
                const std::optional<std::string>& caller,
                const std::function<session_state()>& make);

        // Same ownership rules as resolve_for_request.
        result<void> release_session(const std::string& session_id, const std::optional<std::string>& caller);

        std::vector<std::shared_ptr<session_state>> list_sessions(const std::optional<std::string>& caller) const;

        bool owns(const std::string& client_id, const std::string& session_id) const;

        registry_snapshot snapshot() const;

        // Requests stop on every session's current turn; used at shutdown.
        void cancel_all_turns();

      private:
        result<void> check_access(
                const std::string& session_id, const std::optional<std::string>& caller) const;  // lock held
        result<void> check_owner(const std::optional<std::string>& owner) const;                // lock held

        const bool single_client_;

        mutable std::mutex mutex_;
        std::uint64_t next_client_{0};
        std::uint64_t next_session_{0};
        std::unordered_map<std::string, std::shared_ptr<connection>> clients_{};
        std::map<std::string, std::shared_ptr<session_state>> sessions_{};
        // value is the owning client id, or nullopt for a legacy session
        std::unordered_map<std::string, std::optional<std::string>> owners_{};
    };

}  // namespace keel
