#pragma once

#include "errors.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace keel::protocol {

    using namespace std::string_view_literals;

    // JSON-RPC ids: peers may use numbers; ids we originate are UUID strings.
    using request_id = std::variant<std::int64_t, std::string>;

    std::string to_string(const request_id& id);

    // The error member of an inbound response. "data" is carried as text, as glz::rpc::error defines it.
    struct rpc_error {
        int32_t code{};
        std::string message{};
        std::optional<std::string> data{};
    };

    // One decoded JSON-RPC message; classify() decides which shape arrived.
    struct frame {
        std::optional<request_id> id{};
        std::optional<std::string> method{};
        std::optional<glz::raw_json> params{};
        std::optional<glz::raw_json> result{};
        std::optional<rpc_error> error{};
    };

    enum class frame_kind : uint8_t { request, notification, response, invalid };

    inline constexpr std::string_view to_string(frame_kind kind) {
        switch (kind) {
            case frame_kind::request:
                return "request"sv;
            case frame_kind::notification:
                return "notification"sv;
            case frame_kind::response:
                return "response"sv;
            case frame_kind::invalid:
                return "invalid"sv;
        }
        return "invalid"sv;
    }

    // A frame with an id and no method is a response; "result": null reads back as a disengaged result.
    frame_kind classify(const frame& f);

    // Parses one frame through glz::rpc's request and response envelopes. Fails with errc::parse_error for text
    // that is not JSON or not an object of the expected shape; unknown members are ignored.
    result<frame> decode(std::string_view text);

    // Params/result payloads are passed as already-serialized JSON; empty text is written as {}. An error without
    // an id is written with "id": null.
    std::string encode_request(const request_id& id, std::string_view method, std::string_view params_json);
    std::string encode_notification(std::string_view method, std::string_view params_json);
    std::string encode_result(const request_id& id, std::string_view result_json);
    std::string encode_error(const std::optional<request_id>& id, const error& err);

    // Converts an inbound error member into a keel::error.
    error to_error(const rpc_error& e);

    // Methods the router serves. Dispatch goes through this tag, never through open-ended string matching.
    enum class method : uint8_t {
        initialize,
        new_session,
        load_session,
        fork_session,
        set_session_mode,
        prompt,
        cancel,
        list_sessions,
        release_session,
        execute_code,
    };

    inline constexpr std::string_view to_string(method m) {
        switch (m) {
            case method::initialize:
                return "initialize"sv;
            case method::new_session:
                return "new_session"sv;
            case method::load_session:
                return "load_session"sv;
            case method::fork_session:
                return "fork_session"sv;
            case method::set_session_mode:
                return "set_session_mode"sv;
            case method::prompt:
                return "prompt"sv;
            case method::cancel:
                return "cancel"sv;
            case method::list_sessions:
                return "list_sessions"sv;
            case method::release_session:
                return "release_session"sv;
            case method::execute_code:
                return "execute_code"sv;
        }
        return "initialize"sv;
    }

    inline constexpr std::optional<method> parse_method(std::string_view name) {
        for (auto m :
             {method::initialize,
              method::new_session,
              method::load_session,
              method::fork_session,
              method::set_session_mode,
              method::prompt,
              method::cancel,
              method::list_sessions,
              method::release_session,
              method::execute_code}) {
            if (to_string(m) == name) {
                return m;
            }
        }
        return std::nullopt;
    }

    inline constexpr std::size_t method_count = 10;

    // Serializes a payload struct with glaze; failures are programming errors and surface as errc::internal.
    template <typename T>
    result<std::string> write_payload(const T& value) {
        std::string json{};
        if (auto ec = glz::write_json(value, json)) {
            return fail(errc::internal, "failed to serialize payload");
        }
        return json;
    }

    // Parses a params/result payload; unknown keys are tolerated so newer peers can add members.
    template <typename T>
    result<T> read_payload(std::string_view json) {
        T value{};
        // glaze expects a null-terminated buffer
        std::string buffer{json.empty() ? "{}"sv : json};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, buffer);
        if (ec) {
            return fail(errc::invalid_params, glz::format_error(ec, buffer));
        }
        return value;
    }

}  // namespace keel::protocol
