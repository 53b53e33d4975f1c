#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace keel {

    using namespace std::string_view_literals;

    // Registry, transport and protocol failures. Sandbox failures have their own taxonomy in sandbox.hpp since
    // they are reported through the tool-call lifecycle instead of as protocol errors.
    enum class errc : uint8_t {
        parse_error,
        invalid_request,
        method_not_found,
        invalid_params,
        internal,
        unknown_client,
        ownership_required,
        access_denied,
        unknown_session,
        connection_closed,
        timeout,
        session_busy,
    };

    inline constexpr std::string_view to_string(errc code) {
        switch (code) {
            case errc::parse_error:
                return "parse_error"sv;
            case errc::invalid_request:
                return "invalid_request"sv;
            case errc::method_not_found:
                return "method_not_found"sv;
            case errc::invalid_params:
                return "invalid_params"sv;
            case errc::internal:
                return "internal"sv;
            case errc::unknown_client:
                return "unknown_client"sv;
            case errc::ownership_required:
                return "ownership_required"sv;
            case errc::access_denied:
                return "access_denied"sv;
            case errc::unknown_session:
                return "unknown_session"sv;
            case errc::connection_closed:
                return "connection_closed"sv;
            case errc::timeout:
                return "timeout"sv;
            case errc::session_busy:
                return "session_busy"sv;
        }
        return "internal"sv;
    }

    inline constexpr int32_t rpc_code(errc code) {
        switch (code) {
            case errc::parse_error:
                return -32700;
            case errc::invalid_request:
                return -32600;
            case errc::method_not_found:
                return -32601;
            case errc::invalid_params:
                return -32602;
            case errc::internal:
                return -32603;
            case errc::access_denied:
                return -32001;
            case errc::unknown_session:
                return -32002;
            case errc::unknown_client:
                return -32003;
            case errc::ownership_required:
                return -32004;
            case errc::connection_closed:
                return -32005;
            case errc::timeout:
                return -32006;
            case errc::session_busy:
                return -32007;
        }
        return -32603;
    }

    inline constexpr errc from_rpc_code(int32_t code) {
        switch (code) {
            case -32700:
                return errc::parse_error;
            case -32600:
                return errc::invalid_request;
            case -32601:
                return errc::method_not_found;
            case -32602:
                return errc::invalid_params;
            case -32001:
                return errc::access_denied;
            case -32002:
                return errc::unknown_session;
            case -32003:
                return errc::unknown_client;
            case -32004:
                return errc::ownership_required;
            case -32005:
                return errc::connection_closed;
            case -32006:
                return errc::timeout;
            case -32007:
                return errc::session_busy;
            default:
                return errc::internal;
        }
    }

    struct error {
        errc code{errc::internal};
        std::string message{};
        // raw JSON forwarded as the "data" member of an error response
        std::optional<std::string> data{};
    };

    inline error make_error(errc code, std::string message) {
        return error{.code = code, .message = std::move(message)};
    }

    template <typename T>
    using result = std::expected<T, error>;

    inline std::unexpected<error> fail(errc code, std::string message) {
        return std::unexpected{make_error(code, std::move(message))};
    }

    // Thrown by host operations running as coroutines; carries a keel::error across co_spawn boundaries, which
    // only transport exceptions.
    class host_failure : public std::exception {
      public:
        explicit host_failure(error err) : err_{std::move(err)} {}

        const char* what() const noexcept override { return err_.message.c_str(); }
        const error& get() const noexcept { return err_; }

      private:
        error err_;
    };

}  // namespace keel
