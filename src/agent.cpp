#include "keel/agent.hpp"

#include "keel/format.hpp"
#include "keel/utils.hpp"

#include <optional>

using namespace keel::literals;

namespace keel {

    namespace detail {

        static std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
                s.remove_prefix(1);
            }
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
                s.remove_suffix(1);
            }
            return s;
        }

        static bool runnable_tag(std::string_view tag) {
            return tag.empty() || utils::str_case_eq(tag, "python"sv) || utils::str_case_eq(tag, "py"sv);
        }

        static constexpr auto no_code_message =
                "No code to run. Put the program in a fenced block (```python ... ```) and it will be executed "
                "with this session's capabilities."sv;

    }  // namespace detail

    std::vector<std::string> extract_code_blocks(std::string_view text) {
        std::vector<std::string> blocks{};
        std::optional<std::string> current{};
        bool keep = false;

        std::size_t pos = 0;
        while (pos < text.size()) {
            auto end = text.find('\n', pos);
            auto line = text.substr(pos, end == std::string_view::npos ? text.npos : end - pos);
            auto stripped = detail::trim(line);

            if (stripped.starts_with("```"sv)) {
                if (current) {
                    if (keep) {
                        blocks.push_back(std::move(*current));
                    }
                    current.reset();
                }
                else {
                    current.emplace();
                    keep = detail::runnable_tag(detail::trim(stripped.substr(3)));
                }
            }
            else if (current) {
                current->append(line);
                current->push_back('\n');
            }

            if (end == std::string_view::npos) {
                break;
            }
            pos = end + 1;
        }
        if (current && keep && !current->empty()) {
            blocks.push_back(std::move(*current));
        }
        return blocks;
    }

    turn_plan echo_backend::plan_turn(std::string_view prompt, const session_state&) const {
        turn_plan plan{};
        if (detail::trim(prompt).empty()) {
            plan.stop_reason = "refusal";
            return plan;
        }
        plan.messages.emplace_back(prompt);
        return plan;
    }

    turn_plan code_backend::plan_turn(std::string_view prompt, const session_state& session) const {
        turn_plan plan{};
        if (detail::trim(prompt).empty()) {
            plan.stop_reason = "refusal";
            return plan;
        }
        plan.code_blocks = extract_code_blocks(prompt);
        if (plan.code_blocks.empty()) {
            plan.messages.emplace_back(detail::no_code_message);
        }
        else {
            debug_log("session ", session.session_id, ": ", plan.code_blocks.size(), " code block(s)");
        }
        return plan;
    }

    std::unique_ptr<agent_backend> make_backend(backend_kind kind) {
        switch (kind) {
            case backend_kind::echo:
                return std::make_unique<echo_backend>();
            case backend_kind::code:
                return std::make_unique<code_backend>();
        }
        return std::make_unique<echo_backend>();
    }

}  // namespace keel
