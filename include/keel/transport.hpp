#pragma once

#include "errors.hpp"

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace keel {

    namespace asio = boost::asio;
    namespace beast = boost::beast;

    // One physical byte channel carrying whole frames. Reads and writes are only issued from the loop; a transport
    // supports one outstanding read and one outstanding write at a time.
    class transport {
      public:
        virtual ~transport() = default;

        // Next inbound frame. Fails with errc::connection_closed at end of stream and errc::timeout when no frame
        // arrives within the idle timeout given at construction.
        virtual asio::awaitable<result<std::string>> read_frame() = 0;

        // Returns false when the peer is gone; the failure is logged at debug level.
        virtual asio::awaitable<bool> write_frame(std::string text) = 0;

        virtual void close() = 0;

        virtual std::string_view kind() const = 0;
    };

    // Newline-delimited JSON over a pair of file descriptors (stdin/stdout for the editor client).
    class stdio_transport final : public transport {
      public:
        stdio_transport(asio::any_io_executor ex, int in_fd, int out_fd, std::chrono::milliseconds idle);

        asio::awaitable<result<std::string>> read_frame() override;
        asio::awaitable<bool> write_frame(std::string text) override;
        void close() override;
        std::string_view kind() const override { return "stdio"; }

      private:
        asio::posix::stream_descriptor in_;
        asio::posix::stream_descriptor out_;
        asio::steady_timer watchdog_;
        std::chrono::milliseconds idle_;
        std::string buffer_{};
        // shared with the watchdog handler, which may run after this object is gone
        std::shared_ptr<bool> idled_{std::make_shared<bool>(false)};
    };

    /*
     * Text frames over an accepted WebSocket. Idle detection is beast's own stream timeout.
     *
     * The listener speaks a little plain HTTP before upgrading: GET /health answers {"status":"ok"}, POST /echo
     * returns its JSON body under "echo", and only /ws upgrades. Every other request gets an error status.
     */
    class websocket_transport final : public transport {
      public:
        websocket_transport(asio::ip::tcp::socket socket, std::chrono::milliseconds idle);

        // Reads the opening HTTP request and either upgrades (true) or answers it and closes (false). Called once
        // before the first read.
        asio::awaitable<result<bool>> accept();

        asio::awaitable<result<std::string>> read_frame() override;
        asio::awaitable<bool> write_frame(std::string text) override;
        void close() override;
        std::string_view kind() const override { return "websocket"; }

        const std::string& remote() const { return remote_; }

      private:
        beast::websocket::stream<beast::tcp_stream> ws_;
        beast::flat_buffer buffer_{};
        std::chrono::milliseconds idle_;
        std::string remote_{};
    };

}  // namespace keel
