#include "keel/router.hpp"

#include "keel/format.hpp"
#include "keel/schema.hpp"
#include "keel/tools.hpp"
#include "keel/updates.hpp"
#include "keel/utils.hpp"

#include <boost/asio/co_spawn.hpp>

#include <algorithm>
#include <exception>

using namespace keel::literals;

namespace keel {

    namespace detail {

        template <typename Params>
        static result<Params> params_of(std::string_view raw) {
            return protocol::read_payload<Params>(raw);
        }

        static std::string prompt_text(const std::vector<schema::content_block>& blocks) {
            std::string text{};
            for (const auto& block : blocks) {
                if (block.type == "text") {
                    text += block.text;
                }
            }
            return text;
        }

        static std::string execution_message(const execution_result& r) {
            if (!r.error) {
                return r.output.empty() ? std::string{"(no output)"} : r.output;
            }
            if (r.output.empty()) {
                return r.error->summary();
            }
            return "{}\n{}"_format(r.output, r.error->summary());
        }

        // Holds a session for one prompt turn or execute_code call.
        class busy_claim {
          public:
            explicit busy_claim(std::shared_ptr<session_state> session) : session_{std::move(session)} {
                session_->busy = true;
                // a fresh stop source per claim; cancelling it never reaches an earlier turn
                session_->turn_stop = std::stop_source{};
            }
            ~busy_claim() { session_->busy = false; }

            busy_claim(const busy_claim&) = delete;
            busy_claim& operator=(const busy_claim&) = delete;

          private:
            std::shared_ptr<session_state> session_;
        };

        static result<void> claimable(const session_state& session) {
            if (session.busy) {
                return fail(errc::session_busy, "session {} is already running a turn"_format(session.session_id));
            }
            return {};
        }

        static void log_task_failure(std::string_view what, std::exception_ptr e) {
            if (!e) {
                return;
            }
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                log::error{what, " failed: ", ex.what()};
            }
        }

    }  // namespace detail

    router::router(host_services services, std::shared_ptr<connection> conn, bool legacy)
        : services_{services}, conn_{std::move(conn)}, legacy_{legacy} {}

    asio::awaitable<void> router::run() {
        if (!legacy_) {
            conn_->set_client_id(services_.registry.register_client(conn_));
        }
        conn_->set_state(connection_state::active);
        log::info{conn_->label(), " active as ", caller().value_or("legacy client")};

        while (conn_->alive()) {
            auto text = co_await conn_->io().read_frame();
            if (!text) {
                log::info{conn_->label(), " read side ended: ", text.error().message};
                break;
            }
            if (text->empty()) {
                continue;
            }

            auto decoded = protocol::decode(*text);
            if (!decoded) {
                log::warn{conn_->label(), ": ", decoded.error().message};
                co_await conn_->send_frame(protocol::encode_error(std::nullopt, decoded.error()));
                continue;
            }

            switch (protocol::classify(*decoded)) {
                case protocol::frame_kind::response:
                    route_response(*decoded);
                    break;
                case protocol::frame_kind::request:
                    spawn_request(std::move(*decoded));
                    break;
                case protocol::frame_kind::notification:
                    co_await handle_notification(std::move(*decoded));
                    break;
                case protocol::frame_kind::invalid:
                    log::warn{conn_->label(), ": invalid frame"};
                    co_await conn_->send_frame(protocol::encode_error(
                            decoded->id, make_error(errc::invalid_request, "frame is not a request, response or notification")));
                    break;
            }
        }

        teardown();
    }

    void router::route_response(const protocol::frame& f) {
        result<std::string> outcome{};
        if (f.error) {
            outcome = std::unexpected{protocol::to_error(*f.error)};
        }
        else {
            outcome = f.result ? f.result->str : std::string{"null"};
        }
        conn_->resolve(protocol::to_string(*f.id), std::move(outcome));
    }

    void router::spawn_request(protocol::frame f) {
        auto method = f.method.value_or("");
        asio::co_spawn(
                conn_->get_executor(),
                [self = shared_from_this(), f = std::move(f)]() mutable -> asio::awaitable<void> {
                    co_await self->handle_request(std::move(f));
                },
                [method = std::move(method)](std::exception_ptr e) { detail::log_task_failure(method, e); });
    }

    asio::awaitable<void> router::handle_request(protocol::frame f) {
        const auto& id = *f.id;
        std::string params = f.params ? f.params->str : std::string{};

        result<std::string> out{};
        if (auto m = protocol::parse_method(*f.method)) {
            debug_log(conn_->label(), " -> ", *f.method);
            try {
                out = co_await dispatch(*m, params);
            } catch (const std::exception& e) {
                log::error{*f.method, " handler threw: ", e.what()};
                out = fail(errc::internal, e.what());
            }
        }
        else {
            out = fail(errc::method_not_found, "unknown method: {}"_format(*f.method));
        }

        if (!out) {
            log::debug{*f.method, " failed: ", out.error().message};
        }
        auto reply = out ? protocol::encode_result(id, *out) : protocol::encode_error(id, out.error());
        if (!co_await conn_->send_frame(std::move(reply))) {
            log::debug{conn_->label(), ": reply to ", *f.method, " dropped"};
        }
    }

    asio::awaitable<void> router::handle_notification(protocol::frame f) {
        auto m = protocol::parse_method(*f.method);
        if (m == protocol::method::cancel) {
            auto out = co_await on_cancel(f.params ? f.params->str : std::string{});
            if (!out) {
                log::debug{"cancel notification ignored: ", out.error().message};
            }
            co_return;
        }
        log::debug{conn_->label(), ": ignoring notification ", *f.method};
    }

    asio::awaitable<result<std::string>> router::dispatch(protocol::method m, std::string_view params) {
        switch (m) {
            case protocol::method::initialize:
                co_return co_await on_initialize(params);
            case protocol::method::new_session:
                co_return co_await on_new_session(params);
            case protocol::method::load_session:
                co_return co_await on_load_session(params);
            case protocol::method::fork_session:
                co_return co_await on_fork_session(params);
            case protocol::method::set_session_mode:
                co_return co_await on_set_session_mode(params);
            case protocol::method::prompt:
                co_return co_await on_prompt(params);
            case protocol::method::cancel:
                co_return co_await on_cancel(params);
            case protocol::method::list_sessions:
                co_return co_await on_list_sessions(params);
            case protocol::method::release_session:
                co_return co_await on_release_session(params);
            case protocol::method::execute_code:
                co_return co_await on_execute_code(params);
        }
        co_return fail(errc::method_not_found, "unhandled method {}"_format(m));
    }

    // ── handlers ────────────────────────────────────────────────────

    asio::awaitable<result<std::string>> router::on_initialize(std::string_view raw) {
        auto params = detail::params_of<schema::initialize_params>(raw);
        if (!params) {
            co_return std::unexpected{params.error()};
        }
        if (params->client_info) {
            log::info{conn_->label(), " is ", params->client_info->name, " ", params->client_info->version};
        }

        schema::initialize_result result{
                .protocol_version = std::min(params->protocol_version, schema::current_protocol_version),
                .agent_info = {.name = services_.config.agent_name, .title = "keel", .version = std::string{keel_version}}};
        co_return protocol::write_payload(result);
    }

    asio::awaitable<result<std::string>> router::on_new_session(std::string_view raw) {
        auto params = detail::params_of<schema::new_session_params>(raw);
        if (!params) {
            co_return std::unexpected{params.error()};
        }
        if (!params->mcp_servers.empty()) {
            log::debug{"ignoring ", params->mcp_servers.size(), " mcp server(s)"};
        }

        auto id = services_.registry.new_session(caller(), session_state{.cwd = params->cwd});
        if (!id) {
            co_return std::unexpected{id.error()};
        }
        log::info{caller().value_or("legacy client"), " opened ", *id};
        co_return protocol::write_payload(schema::new_session_result{.session_id = *id});
    }

    asio::awaitable<result<std::string>> router::on_load_session(std::string_view raw) {
        auto params = detail::params_of<schema::load_session_params>(raw);
        if (!params) {
            co_return std::unexpected{params.error()};
        }
        if (params->session_id.empty()) {
            co_return fail(errc::invalid_params, "session_id must not be empty");
        }
        auto session = services_.registry.resolve_or_create(
                params->session_id, caller(), [&]() { return session_state{.cwd = params->cwd}; });
        if (!session) {
            co_return std::unexpected{session.error()};
        }
        log::info{caller().value_or("legacy client"), " loaded ", params->session_id};
        co_return protocol::write_payload(schema::empty_result{});
    }

    asio::awaitable<result<std::string>> router::on_fork_session(std::string_view raw) {
        auto params = detail::params_of<schema::fork_session_params>(raw);
        if (!params) {
            co_return std::unexpected{params.error()};
        }
        auto source = services_.registry.resolve_for_request(params->session_id, caller());
        if (!source) {
            co_return std::unexpected{source.error()};
        }
        auto id = services_.registry.new_session(
                caller(), session_state{.cwd = params->cwd.value_or((*source)->cwd), .mode = (*source)->mode});
        if (!id) {
            co_return std::unexpected{id.error()};
        }
        log::info{caller().value_or("legacy client"), " forked ", params->session_id, " into ", *id};
        co_return protocol::write_payload(schema::new_session_result{.session_id = *id});
    }

    asio::awaitable<result<std::string>> router::on_set_session_mode(std::string_view raw) {
        auto params = detail::params_of<schema::set_session_mode_params>(raw);
        if (!params) {
            co_return std::unexpected{params.error()};
        }
        if (params->mode_id.empty()) {
            co_return fail(errc::invalid_params, "mode_id must not be empty");
        }
        auto session = services_.registry.resolve_for_request(params->session_id, caller());
        if (!session) {
            co_return std::unexpected{session.error()};
        }
        (*session)->mode = std::move(params->mode_id);
        log::debug{params->session_id, " mode is now ", (*session)->mode};
        co_return protocol::write_payload(schema::empty_result{});
    }

    asio::awaitable<result<std::string>> router::on_prompt(std::string_view raw) {
        auto params = detail::params_of<schema::prompt_params>(raw);
        if (!params) {
            co_return std::unexpected{params.error()};
        }
        auto resolved = services_.registry.resolve_for_request(params->session_id, caller());
        if (!resolved) {
            co_return std::unexpected{resolved.error()};
        }
        auto session = *resolved;
        if (auto ok = detail::claimable(*session); !ok) {
            co_return std::unexpected{ok.error()};
        }
        detail::busy_claim claim{session};
        ++session->turns;
        auto stop = session->turn_stop.get_token();
        auto deadline = std::chrono::steady_clock::now() + services_.config.prompt_timeout;

        auto plan = services_.backend.plan_turn(detail::prompt_text(params->prompt), *session);

        for (auto& text : plan.messages) {
            co_await send_session_update(
                    conn_, session->session_id, schema::agent_message_chunk{.content = {.text = std::move(text)}});
        }

        for (auto& code : plan.code_blocks) {
            if (stop.stop_requested()) {
                break;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left <= std::chrono::milliseconds::zero()) {
                co_await send_session_update(
                        conn_,
                        session->session_id,
                        schema::agent_message_chunk{.content = {.text = "turn time budget exhausted; remaining code skipped"}});
                break;
            }

            auto executed = co_await services_.engine.execute(execution_request{
                    .source = std::move(code),
                    .callables = capabilities_for(*session),
                    .timeout = std::min(services_.config.execution_timeout, left),
                    .stop = stop,
                    .notify = conn_,
                    .session_id = session->session_id});

            co_await send_session_update(
                    conn_,
                    session->session_id,
                    schema::agent_message_chunk{.content = {.text = detail::execution_message(executed)}});
        }

        if (stop.stop_requested()) {
            plan.stop_reason = "cancelled";
        }
        co_return protocol::write_payload(schema::prompt_result{.stop_reason = plan.stop_reason});
    }

    asio::awaitable<result<std::string>> router::on_cancel(std::string_view raw) {
        auto params = detail::params_of<schema::session_params>(raw);
        if (!params) {
            co_return std::unexpected{params.error()};
        }
        auto session = services_.registry.resolve_for_request(params->session_id, caller());
        if (!session) {
            co_return std::unexpected{session.error()};
        }
        (*session)->cancel_turn();
        log::debug{"cancelled turn of ", params->session_id};
        co_return protocol::write_payload(schema::empty_result{});
    }

    asio::awaitable<result<std::string>> router::on_list_sessions(std::string_view) {
        schema::list_sessions_result result{};
        for (const auto& s : services_.registry.list_sessions(caller())) {
            result.sessions.push_back(schema::session_summary{.session_id = s->session_id, .cwd = s->cwd, .mode = s->mode});
        }
        co_return protocol::write_payload(result);
    }

    asio::awaitable<result<std::string>> router::on_release_session(std::string_view raw) {
        auto params = detail::params_of<schema::session_params>(raw);
        if (!params) {
            co_return std::unexpected{params.error()};
        }
        if (auto ok = services_.registry.release_session(params->session_id, caller()); !ok) {
            co_return std::unexpected{ok.error()};
        }
        co_return protocol::write_payload(schema::empty_result{});
    }

    asio::awaitable<result<std::string>> router::on_execute_code(std::string_view raw) {
        auto params = detail::params_of<schema::execute_code_params>(raw);
        if (!params) {
            co_return std::unexpected{params.error()};
        }
        auto resolved = services_.registry.resolve_for_request(params->session_id, caller());
        if (!resolved) {
            co_return std::unexpected{resolved.error()};
        }
        auto session = *resolved;
        if (auto ok = detail::claimable(*session); !ok) {
            co_return std::unexpected{ok.error()};
        }
        detail::busy_claim claim{session};

        auto executed = co_await services_.engine.execute(execution_request{
                .source = std::move(params->code),
                .callables = capabilities_for(*session),
                .timeout = services_.config.execution_timeout,
                .stop = session->turn_stop.get_token(),
                .notify = conn_,
                .session_id = session->session_id});

        schema::execute_code_result result{.tool_call_id = executed.tool_call_id, .output = executed.output};
        if (executed.error) {
            result.error = executed.error->summary();
        }
        co_return protocol::write_payload(result);
    }

    capability_map router::capabilities_for(const session_state& session) const {
        return make_host_capabilities(host_context{
                .conn = conn_,
                .session_id = session.session_id,
                .cwd = session.cwd,
                .host_bridge = &services_.host_bridge,
                .call_timeout = services_.config.bridge_timeout,
                .request_timeout = services_.config.request_timeout});
    }

    // ── teardown ────────────────────────────────────────────────────

    void router::teardown() {
        if (torn_down_) {
            return;
        }
        torn_down_ = true;
        conn_->set_state(connection_state::closing);

        try {
            auto n = conn_->abort_all(make_error(errc::connection_closed, "{} disconnected"_format(conn_->label())));
            if (n > 0) {
                log::debug{conn_->label(), ": aborted ", n, " pending request(s)"};
            }
        } catch (const std::exception& e) {
            log::error{conn_->label(), ": abort_all failed: ", e.what()};
        }

        std::vector<std::shared_ptr<session_state>> removed{};
        try {
            if (auto id = caller()) {
                removed = services_.registry.unregister_client(*id);
            }
            else if (legacy_) {
                removed = services_.registry.list_sessions(std::nullopt);
                for (const auto& s : removed) {
                    if (auto ok = services_.registry.release_session(s->session_id, std::nullopt); !ok) {
                        log::debug{"release of ", s->session_id, " failed: ", ok.error().message};
                    }
                }
            }
        } catch (const std::exception& e) {
            log::error{conn_->label(), ": unregister failed: ", e.what()};
        }

        for (const auto& s : removed) {
            s->cancel_turn();
        }

        conn_->close();
        log::info{conn_->label(), " closed"};
    }

}  // namespace keel
