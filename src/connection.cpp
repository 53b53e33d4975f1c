#include "keel/connection.hpp"

#include "keel/format.hpp"
#include "keel/protocol.hpp"
#include "keel/utils.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <exception>

using namespace keel::literals;

namespace keel {

    std::string new_request_id() {
        thread_local boost::uuids::random_generator gen{};
        return boost::uuids::to_string(gen());
    }

    // ── pending table ───────────────────────────────────────────────

    std::shared_ptr<pending_waiter> pending_table::add(const std::string& id, asio::any_io_executor ex) {
        auto waiter = std::make_shared<pending_waiter>(std::move(ex));
        auto [it, inserted] = waiters_.emplace(id, waiter);
        if (!inserted) {
            return nullptr;
        }
        return waiter;
    }

    bool pending_table::resolve(const std::string& id, result<std::string> outcome) {
        auto node = waiters_.extract(id);
        if (node.empty()) {
            return false;
        }
        auto& waiter = node.mapped();
        waiter->outcome = std::move(outcome);
        waiter->signal.cancel();
        return true;
    }

    std::size_t pending_table::abort_all(const error& reason) {
        // detach first so a waiter resumed by cancel() cannot observe a half-cleared table
        auto waiters = std::move(waiters_);
        waiters_.clear();
        for (auto& [id, waiter] : waiters) {
            waiter->outcome = std::unexpected{reason};
            waiter->signal.cancel();
        }
        return waiters.size();
    }

    void pending_table::forget(const std::string& id) {
        waiters_.erase(id);
    }

    // ── connection ──────────────────────────────────────────────────

    connection::connection(asio::any_io_executor ex, std::unique_ptr<transport> t, std::string label)
        : ex_{ex}, transport_{std::move(t)}, label_{std::move(label)}, write_gate_{ex} {
        write_gate_.expires_at(asio::steady_timer::time_point::max());
    }

    asio::awaitable<result<std::string>> connection::send_request(
            std::string method, std::string params_json, std::chrono::milliseconds timeout) {
        if (!alive()) {
            co_return fail(errc::connection_closed, "{} is {}"_format(label_, state_));
        }

        auto id = new_request_id();
        auto waiter = pending_.add(id, ex_);
        if (!waiter) {
            co_return fail(errc::internal, "request id collision: {}"_format(id));
        }
        waiter->signal.expires_after(timeout);

        auto frame = protocol::encode_request(protocol::request_id{id}, method, params_json);
        if (!co_await send_frame(std::move(frame))) {
            // abort_all may already have settled it while the write was parked
            pending_.resolve(id, fail(errc::connection_closed, "{}: send of '{}' failed"_format(label_, method)));
        }

        if (!waiter->outcome) {
            boost::system::error_code ec;
            co_await waiter->signal.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }

        if (!waiter->outcome) {
            pending_.forget(id);
            log::warn{label_, ": '", method, "' timed out after ", timeout.count(), "ms"};
            co_return fail(errc::timeout, "'{}' timed out after {}ms"_format(method, timeout.count()));
        }
        co_return std::move(*waiter->outcome);
    }

    asio::awaitable<void> connection::send_notification(std::string method, std::string params_json) {
        if (!co_await send_frame(protocol::encode_notification(method, params_json))) {
            log::debug{label_, ": notification '", method, "' dropped"};
        }
    }

    asio::awaitable<bool> connection::send_frame(std::string text) {
        while (writing_) {
            boost::system::error_code ec;
            co_await write_gate_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
        if (state_ == connection_state::closed) {
            co_return false;
        }

        writing_ = true;
        bool ok = false;
        try {
            ok = co_await transport_->write_frame(std::move(text));
        } catch (const std::exception& e) {
            log::debug{label_, ": write raised: ", e.what()};
        }
        writing_ = false;
        write_gate_.cancel();
        co_return ok;
    }

    bool connection::resolve(const std::string& request_id, result<std::string> outcome) {
        if (!pending_.resolve(request_id, std::move(outcome))) {
            log::debug{label_, ": response for unknown or settled request ", request_id};
            return false;
        }
        return true;
    }

    std::size_t connection::abort_all(const error& reason) {
        auto n = pending_.abort_all(reason);
        if (n > 0) {
            log::debug{label_, ": aborted ", n, " pending request(s): ", reason.message};
        }
        return n;
    }

    void connection::close() {
        if (state_ == connection_state::closed) {
            return;
        }
        state_ = connection_state::closed;
        transport_->close();
        write_gate_.cancel();
    }

}  // namespace keel
