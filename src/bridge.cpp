#include "keel/bridge.hpp"

#include "keel/errors.hpp"
#include "keel/format.hpp"
#include "keel/utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <future>

using namespace keel::literals;

namespace keel {

    namespace detail {
        // granularity at which a blocked worker notices a stop request
        inline constexpr std::chrono::milliseconds stop_poll{50};
    }  // namespace detail

    script::value bridge::call_async(
            host_operation op, std::chrono::milliseconds timeout, const script::native_args& budget) const {
        if (on_loop_thread()) {
            throw script::script_error{"RuntimeError", "host call issued from the event loop thread"};
        }

        auto now = std::chrono::steady_clock::now();
        auto deadline = budget.deadline == std::chrono::steady_clock::time_point::max()
                              ? now + timeout
                              : std::min(now + timeout, budget.deadline);

        std::future<std::string> fut = asio::co_spawn(loop_, std::move(op), asio::use_future);

        while (true) {
            auto left = deadline - std::chrono::steady_clock::now();
            if (left <= std::chrono::steady_clock::duration::zero()) {
                debug_log("host call abandoned after ", timeout.count(), "ms");
                throw script::script_error{"TimeoutError", "host call timed out after {}ms"_format(timeout.count())};
            }
            auto slice = std::min<std::chrono::steady_clock::duration>(left, detail::stop_poll);
            if (fut.wait_for(slice) == std::future_status::ready) {
                break;
            }
            if (budget.stop.stop_requested()) {
                throw script::script_error{"HostError", "host call cancelled"};
            }
        }

        try {
            return script::from_json(fut.get());
        } catch (const host_failure& e) {
            if (e.get().code == errc::timeout) {
                throw script::script_error{"TimeoutError", e.get().message};
            }
            throw script::script_error{"HostError", e.get().message};
        } catch (const script::script_error&) {
            throw;
        } catch (const std::exception& e) {
            throw script::script_error{"HostError", e.what()};
        }
    }

}  // namespace keel
