#include "keel/registry.hpp"

#include "keel/connection.hpp"
#include "keel/format.hpp"
#include "keel/utils.hpp"

#include <algorithm>
#include <string_view>

using namespace keel::literals;

namespace keel {

    namespace detail {
        // "session-" followed by digits only
        static bool assigned_session_id(std::string_view id) {
            constexpr std::string_view prefix = "session-";
            if (!id.starts_with(prefix) || id.size() == prefix.size()) {
                return false;
            }
            return std::ranges::all_of(id.substr(prefix.size()), [](char c) { return c >= '0' && c <= '9'; });
        }
    }  // namespace detail

    std::string session_registry::register_client(std::shared_ptr<connection> conn) {
        std::lock_guard lock{mutex_};
        auto id = "client-{}"_format(++next_client_);
        clients_.emplace(id, std::move(conn));
        log::info{"registered ", id};
        return id;
    }

    std::vector<std::shared_ptr<session_state>> session_registry::unregister_client(const std::string& client_id) {
        std::vector<std::shared_ptr<session_state>> removed{};
        {
            std::lock_guard lock{mutex_};
            if (clients_.erase(client_id) == 0) {
                return removed;
            }
            for (auto it = owners_.begin(); it != owners_.end();) {
                if (it->second == client_id) {
                    auto node = sessions_.extract(it->first);
                    removed.push_back(std::move(node.mapped()));
                    it = owners_.erase(it);
                }
                else {
                    ++it;
                }
            }
        }
        log::info{"unregistered ", client_id, " (", removed.size(), " session(s) removed)"};
        return removed;
    }

    result<void> session_registry::check_owner(const std::optional<std::string>& owner) const {
        if (owner) {
            if (!clients_.contains(*owner)) {
                return fail(errc::unknown_client, "unknown client: {}"_format(*owner));
            }
            return {};
        }
        if (!single_client_) {
            return fail(errc::ownership_required, "sessions must be owned by a registered client");
        }
        return {};
    }

    result<void> session_registry::check_access(
            const std::string& session_id, const std::optional<std::string>& caller) const {
        auto it = owners_.find(session_id);
        if (it == owners_.end()) {
            return fail(errc::unknown_session, "unknown session: {}"_format(session_id));
        }
        const auto& owner = it->second;
        if (!owner) {
            if (!clients_.empty()) {
                return fail(errc::access_denied, "legacy session {} is unavailable while clients are registered"_format(session_id));
            }
            return {};
        }
        if (!caller || *caller != *owner) {
            return fail(errc::access_denied, "session {} is not owned by the caller"_format(session_id));
        }
        return {};
    }

    result<std::string> session_registry::new_session(const std::optional<std::string>& owner, session_state state) {
        std::string id{};
        {
            std::lock_guard lock{mutex_};
            if (auto ok = check_owner(owner); !ok) {
                return std::unexpected{ok.error()};
            }
            do {
                id = "session-{}"_format(++next_session_);
            } while (sessions_.contains(id));
            state.session_id = id;
            state.owner = owner;
            sessions_.emplace(id, std::make_shared<session_state>(std::move(state)));
            owners_.emplace(id, owner);
        }
        log::debug{"created ", id, " owner=", owner.value_or("(legacy)")};
        return id;
    }

    result<std::shared_ptr<session_state>> session_registry::resolve_for_request(
            const std::string& session_id, const std::optional<std::string>& caller) const {
        std::lock_guard lock{mutex_};
        if (auto ok = check_access(session_id, caller); !ok) {
            return std::unexpected{ok.error()};
        }
        return sessions_.at(session_id);
    }

    result<std::shared_ptr<session_state>> session_registry::resolve_or_create(
            const std::string& session_id,
            const std::optional<std::string>& caller,
            const std::function<session_state()>& make) {
        std::lock_guard lock{mutex_};
        if (owners_.contains(session_id)) {
            if (auto ok = check_access(session_id, caller); !ok) {
                return std::unexpected{ok.error()};
            }
            return sessions_.at(session_id);
        }
        if (detail::assigned_session_id(session_id)) {
            return fail(errc::unknown_session, "unknown session: {}"_format(session_id));
        }
        if (auto ok = check_owner(caller); !ok) {
            return std::unexpected{ok.error()};
        }
        auto state = std::make_shared<session_state>(make());
        state->session_id = session_id;
        state->owner = caller;
        sessions_.emplace(session_id, state);
        owners_.emplace(session_id, caller);
        return state;
    }

    result<void> session_registry::release_session(
            const std::string& session_id, const std::optional<std::string>& caller) {
        std::shared_ptr<session_state> state{};
        {
            std::lock_guard lock{mutex_};
            if (auto ok = check_access(session_id, caller); !ok) {
                return ok;
            }
            auto node = sessions_.extract(session_id);
            state = std::move(node.mapped());
            owners_.erase(session_id);
        }
        state->cancel_turn();
        log::debug{"released ", session_id};
        return {};
    }

    std::vector<std::shared_ptr<session_state>> session_registry::list_sessions(
            const std::optional<std::string>& caller) const {
        std::vector<std::shared_ptr<session_state>> out{};
        std::lock_guard lock{mutex_};
        for (const auto& [id, state] : sessions_) {
            if (check_access(id, caller)) {
                out.push_back(state);
            }
        }
        return out;
    }

    bool session_registry::owns(const std::string& client_id, const std::string& session_id) const {
        std::lock_guard lock{mutex_};
        auto it = owners_.find(session_id);
        return it != owners_.end() && it->second == client_id;
    }

    registry_snapshot session_registry::snapshot() const {
        std::lock_guard lock{mutex_};
        registry_snapshot snap{.clients = clients_.size(), .sessions = sessions_.size()};
        for (const auto& [id, owner] : owners_) {
            if (!owner) {
                ++snap.legacy_sessions;
            }
        }
        return snap;
    }

    void session_registry::cancel_all_turns() {
        std::lock_guard lock{mutex_};
        for (auto& [id, state] : sessions_) {
            state->cancel_turn();
        }
    }

}  // namespace keel
