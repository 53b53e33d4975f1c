#pragma once

#include "script.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace keel {

    namespace asio = boost::asio;

    // A host operation as seen from the sandbox: a coroutine run on the loop that yields the call's result as JSON
    // text or throws (host_failure for typed errors).
    using host_operation = std::function<asio::awaitable<std::string>()>;

    /*
     * Lets sandbox code, running on a worker thread, block on a coroutine that runs on the loop.
     *
     * The wait is bounded by min(timeout, remaining program budget). On timeout the coroutine is abandoned, not
     * cancelled: it runs to completion on the loop and its result is dropped.
     */
    class bridge {
      public:
        explicit bridge(asio::io_context::executor_type loop) : loop_{loop} {}

        // Raises TimeoutError or HostError into the program on failure, RuntimeError when called from the loop
        // thread itself (the loop would wait on its own work).
        script::value call_async(
                host_operation op, std::chrono::milliseconds timeout, const script::native_args& budget) const;

        bool on_loop_thread() const { return loop_.running_in_this_thread(); }

      private:
        asio::io_context::executor_type loop_;
    };

}  // namespace keel
