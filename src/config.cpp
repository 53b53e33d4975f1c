#include "keel/config.hpp"

#include "keel/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>

using namespace keel::literals;

namespace keel {

    namespace detail {

        // On-disk shape; every key is optional and timeouts are in milliseconds.
        struct config_file_values {
            std::optional<std::string> mode{};
            std::optional<std::string> listen_host{};
            std::optional<std::uint16_t> listen_port{};
            std::optional<std::string> backend{};
            std::optional<std::string> agent_name{};
            std::optional<std::int64_t> request_timeout_ms{};
            std::optional<std::int64_t> prompt_timeout_ms{};
            std::optional<std::int64_t> idle_timeout_ms{};
            std::optional<std::int64_t> execution_timeout_ms{};
            std::optional<std::int64_t> bridge_timeout_ms{};
            std::optional<unsigned> worker_threads{};
            std::optional<std::size_t> max_source_bytes{};
            std::optional<std::size_t> max_output_bytes{};
            std::optional<std::string> log_level{};

            struct glaze {
                using T = config_file_values;
                static constexpr auto value = glz::object(
                        &T::mode,
                        &T::listen_host,
                        &T::listen_port,
                        &T::backend,
                        &T::agent_name,
                        &T::request_timeout_ms,
                        &T::prompt_timeout_ms,
                        &T::idle_timeout_ms,
                        &T::execution_timeout_ms,
                        &T::bridge_timeout_ms,
                        &T::worker_threads,
                        &T::max_source_bytes,
                        &T::max_output_bytes,
                        &T::log_level);
            };
        };

        static void apply_timeout(
                std::chrono::milliseconds& out, const std::optional<std::int64_t>& ms, std::string_view key) {
            if (!ms) {
                return;
            }
            if (*ms <= 0) {
                throw std::runtime_error("config key '{}' must be positive, got {}"_format(key, *ms));
            }
            out = std::chrono::milliseconds{*ms};
        }

        template <typename Enum>
        static void apply_enum(
                Enum& out,
                const std::optional<std::string>& text,
                std::string_view key,
                bool (*parse)(std::string_view, Enum&),
                std::string_view expected) {
            if (!text) {
                return;
            }
            if (!parse(*text, out)) {
                throw std::runtime_error("invalid config value {}='{}' (expected {})"_format(key, *text, expected));
            }
        }

    }  // namespace detail

    void apply_config_file(host_config& cfg, const std::filesystem::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw std::runtime_error("cannot read config file {}"_format(path.string()));
        }
        std::stringstream ss;
        ss << in.rdbuf();
        std::string buffer = ss.str();

        detail::config_file_values values{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(values, buffer)) {
            throw std::runtime_error("malformed config file {}: {}"_format(path.string(), glz::format_error(ec, buffer)));
        }

        detail::apply_enum(cfg.mode, values.mode, "mode", &try_parse_transport_mode, "stdio|websocket|dual");
        detail::apply_enum(cfg.backend, values.backend, "backend", &try_parse_backend_kind, "echo|code");
        detail::apply_enum(cfg.logging, values.log_level, "log_level", &try_parse_log_level, "error|warn|info|debug");

        if (values.listen_host) {
            cfg.listen_host = *values.listen_host;
        }
        if (values.listen_port) {
            cfg.listen_port = *values.listen_port;
        }
        if (values.agent_name) {
            cfg.agent_name = *values.agent_name;
        }

        detail::apply_timeout(cfg.request_timeout, values.request_timeout_ms, "request_timeout_ms");
        detail::apply_timeout(cfg.prompt_timeout, values.prompt_timeout_ms, "prompt_timeout_ms");
        detail::apply_timeout(cfg.idle_timeout, values.idle_timeout_ms, "idle_timeout_ms");
        detail::apply_timeout(cfg.execution_timeout, values.execution_timeout_ms, "execution_timeout_ms");
        detail::apply_timeout(cfg.bridge_timeout, values.bridge_timeout_ms, "bridge_timeout_ms");

        if (values.worker_threads) {
            if (*values.worker_threads == 0U) {
                throw std::runtime_error("config key 'worker_threads' must be at least 1");
            }
            cfg.worker_threads = *values.worker_threads;
        }
        if (values.max_source_bytes) {
            cfg.max_source_bytes = *values.max_source_bytes;
        }
        if (values.max_output_bytes) {
            cfg.max_output_bytes = *values.max_output_bytes;
        }
    }

    void print_config(const host_config& cfg, std::ostream& os) {
        os << "mode=" << to_string(cfg.mode) << '\n';
        os << "listen=" << cfg.listen_host << ':' << cfg.listen_port << '\n';
        os << "backend=" << to_string(cfg.backend) << '\n';
        os << "agent_name=" << cfg.agent_name << '\n';
        os << "request_timeout_ms=" << cfg.request_timeout.count() << '\n';
        os << "prompt_timeout_ms=" << cfg.prompt_timeout.count() << '\n';
        os << "idle_timeout_ms=" << cfg.idle_timeout.count() << '\n';
        os << "execution_timeout_ms=" << cfg.execution_timeout.count() << '\n';
        os << "bridge_timeout_ms=" << cfg.bridge_timeout.count() << '\n';
        os << "worker_threads=" << cfg.worker_threads << '\n';
        os << "max_source_bytes=" << cfg.max_source_bytes << '\n';
        os << "max_output_bytes=" << cfg.max_output_bytes << '\n';
        os << "log_level=" << to_string(cfg.logging) << '\n';
        os << "config_file=" << (cfg.config_file ? cfg.config_file->string() : "<none>") << '\n';
    }

}  // namespace keel
