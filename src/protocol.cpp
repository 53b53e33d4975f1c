#include "keel/protocol.hpp"

#include "keel/format.hpp"
#include "keel/utils.hpp"

#include <glaze/ext/jsonrpc.hpp>

#include <string>
#include <string_view>
#include <type_traits>

using namespace keel::literals;

namespace keel::protocol {

    static_assert(rpc_code(errc::parse_error) == static_cast<int32_t>(glz::rpc::error_e::parse_error));
    static_assert(rpc_code(errc::invalid_request) == static_cast<int32_t>(glz::rpc::error_e::invalid_request));
    static_assert(rpc_code(errc::method_not_found) == static_cast<int32_t>(glz::rpc::error_e::method_not_found));
    static_assert(rpc_code(errc::invalid_params) == static_cast<int32_t>(glz::rpc::error_e::invalid_params));
    static_assert(rpc_code(errc::internal) == static_cast<int32_t>(glz::rpc::error_e::internal));

    namespace detail {

        // glz::rpc::request_t always writes an id; notifications must not have one.
        struct notification_out {
            std::string_view jsonrpc{"2.0"};
            std::string_view method{};
            glz::raw_json params{"{}"};
            struct glaze {
                using T = notification_out;
                static constexpr auto value = glz::object("jsonrpc", &T::jsonrpc, &T::method, &T::params);
            };
        };

        // Error responses whose data member is not text, which glz::rpc::error rejects. Only code and message
        // are kept.
        struct loose_error {
            int32_t code{};
            std::string message{};
            struct glaze {
                using T = loose_error;
                static constexpr auto value = glz::object(&T::code, &T::message);
            };
        };

        struct loose_error_response {
            std::optional<loose_error> error{};
            struct glaze {
                using T = loose_error_response;
                static constexpr auto value = glz::object(&T::error);
            };
        };

        static glz::raw_json as_raw(std::string_view json) {
            if (json.empty()) {
                return glz::raw_json{"{}"};
            }
            return glz::raw_json{std::string{json}};
        }

        static glz::rpc::id_t to_rpc_id(const request_id& id) {
            if (auto* n = std::get_if<std::int64_t>(&id)) {
                return glz::rpc::id_t{*n};
            }
            return glz::rpc::id_t{std::string_view{std::get<std::string>(id)}};
        }

        static std::optional<request_id> from_rpc_id(const glz::rpc::id_t& id) {
            return std::visit(
                    [](const auto& v) -> std::optional<request_id> {
                        using T = std::decay_t<decltype(v)>;
                        if constexpr (std::is_integral_v<T>) {
                            return request_id{static_cast<std::int64_t>(v)};
                        }
                        else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
                            return request_id{std::string{std::string_view{v}}};
                        }
                        else {
                            return std::nullopt;
                        }
                    },
                    id);
        }

        template <typename T>
        static std::string write_frame(const T& value) {
            std::string json{};
            if (auto ec = glz::write_json(value, json)) {
                log::error{"frame serialization failed: ", glz::format_error(ec, json)};
                glz::rpc::response_t<glz::raw_json> fallback{};
                fallback.error = glz::rpc::error{glz::rpc::error_e::internal, std::nullopt, "frame serialization failed"};
                json.clear();
                if (glz::write_json(fallback, json)) {
                    return {};
                }
            }
            return json;
        }

        static result<frame> decode_response(const std::string& buffer, std::optional<request_id> id) {
            frame f{.id = std::move(id)};
            glz::rpc::response_t<glz::raw_json> response{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(response, buffer);
            if (!ec) {
                f.result = std::move(response.result);
                if (response.error) {
                    f.error = rpc_error{
                            .code = static_cast<int32_t>(response.error->code),
                            .message = std::move(response.error->message),
                            .data = std::move(response.error->data)};
                }
                return f;
            }

            loose_error_response loose{};
            if (glz::read<glz::opts{.error_on_unknown_keys = false}>(loose, buffer) || !loose.error) {
                return fail(errc::parse_error, glz::format_error(ec, buffer));
            }
            f.error = rpc_error{.code = loose.error->code, .message = std::move(loose.error->message)};
            return f;
        }

    }  // namespace detail

    std::string to_string(const request_id& id) {
        if (auto* s = std::get_if<std::string>(&id)) {
            return *s;
        }
        return std::to_string(std::get<std::int64_t>(id));
    }

    frame_kind classify(const frame& f) {
        if (f.method) {
            if (f.method->empty()) {
                return frame_kind::invalid;
            }
            return f.id ? frame_kind::request : frame_kind::notification;
        }
        if (f.id) {
            return frame_kind::response;
        }
        return frame_kind::invalid;
    }

    result<frame> decode(std::string_view text) {
        // glaze expects a null-terminated buffer; request views below point into it
        std::string buffer{text};
        glz::rpc::generic_request_t request{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(request, buffer)) {
            return fail(errc::parse_error, glz::format_error(ec, buffer));
        }

        auto id = detail::from_rpc_id(request.id);
        if (request.method.empty()) {
            return detail::decode_response(buffer, std::move(id));
        }

        frame f{.id = std::move(id), .method = std::string{request.method}};
        if (!request.params.str.empty()) {
            f.params = glz::raw_json{std::string{request.params.str}};
        }
        return f;
    }

    std::string encode_request(const request_id& id, std::string_view method, std::string_view params_json) {
        glz::rpc::request_t<glz::raw_json> req{};
        req.id = detail::to_rpc_id(id);
        req.method = method;
        req.params = detail::as_raw(params_json);
        return detail::write_frame(req);
    }

    std::string encode_notification(std::string_view method, std::string_view params_json) {
        return detail::write_frame(detail::notification_out{.method = method, .params = detail::as_raw(params_json)});
    }

    std::string encode_result(const request_id& id, std::string_view result_json) {
        glz::rpc::response_t<glz::raw_json> resp{};
        resp.id = detail::to_rpc_id(id);
        resp.result = detail::as_raw(result_json);
        return detail::write_frame(resp);
    }

    std::string encode_error(const std::optional<request_id>& id, const error& err) {
        glz::rpc::response_t<glz::raw_json> resp{};
        if (id) {
            resp.id = detail::to_rpc_id(*id);
        }
        // keel's own codes sit in the server error range next to the standard ones
        resp.error = glz::rpc::error{static_cast<glz::rpc::error_e>(rpc_code(err.code)), err.data, err.message};
        return detail::write_frame(resp);
    }

    error to_error(const rpc_error& e) {
        return error{.code = from_rpc_code(e.code), .message = e.message, .data = e.data};
    }

}  // namespace keel::protocol
