#include "loopback.hpp"

#include "keel/format.hpp"
#include "keel/utils.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace keel::literals;

namespace keel::test {

    std::pair<std::unique_ptr<loopback_transport>, std::unique_ptr<loopback_transport>> loopback_transport::make_pair(
            asio::any_io_executor ex, std::chrono::milliseconds idle) {
        auto state = std::make_shared<detail::loopback_state>(ex);
        auto a = std::make_unique<loopback_transport>(private_tag{}, state, state->backward, state->forward, idle);
        auto b = std::make_unique<loopback_transport>(private_tag{}, state, state->forward, state->backward, idle);
        return {std::move(a), std::move(b)};
    }

    asio::awaitable<result<std::string>> loopback_transport::read_frame() {
        auto deadline = std::chrono::steady_clock::now() + idle_;
        for (;;) {
            if (!inbound_.frames.empty()) {
                std::string text = std::move(inbound_.frames.front());
                inbound_.frames.pop_front();
                co_return text;
            }
            if (inbound_.closed) {
                co_return fail(errc::connection_closed, "loopback closed");
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                co_return fail(errc::timeout, "no frame within {}ms"_format(idle_.count()));
            }

            // writers wake the reader by cancelling the wait
            inbound_.signal.expires_at(deadline);
            boost::system::error_code ec;
            co_await inbound_.signal.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
    }

    asio::awaitable<bool> loopback_transport::write_frame(std::string text) {
        if (outbound_.closed) {
            log::debug{"loopback write dropped: peer closed"};
            co_return false;
        }
        outbound_.frames.push_back(std::move(text));
        outbound_.signal.cancel();
        co_return true;
    }

    void loopback_transport::close() {
        for (auto* ch : {&inbound_, &outbound_}) {
            ch->closed = true;
            ch->signal.cancel();
        }
    }

}  // namespace keel::test
