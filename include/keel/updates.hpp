#pragma once

#include "connection.hpp"
#include "protocol.hpp"
#include "schema.hpp"
#include "utils.hpp"

#include <boost/asio/awaitable.hpp>

#include <memory>
#include <string>

namespace keel {

    inline std::string new_tool_call_id() {
        return "call_" + new_request_id();
    }

    // Wraps `update` in a session_update notification for `session_id`. Best effort like every notification.
    template <typename Update>
    asio::awaitable<void> send_session_update(
            std::shared_ptr<connection> conn, std::string session_id, Update update) {
        if (!conn) {
            co_return;
        }
        auto update_json = protocol::write_payload(update);
        if (!update_json) {
            log::warn{"dropping session update: ", update_json.error().message};
            co_return;
        }
        schema::session_notification note{.session_id = std::move(session_id), .update = glz::raw_json{*update_json}};
        auto params = protocol::write_payload(note);
        if (!params) {
            log::warn{"dropping session update: ", params.error().message};
            co_return;
        }
        co_await conn->send_notification("session_update", std::move(*params));
    }

}  // namespace keel
