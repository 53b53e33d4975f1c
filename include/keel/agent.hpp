#pragma once

#include "config.hpp"
#include "registry.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace keel {

    // What one prompt turn does: text replies streamed as agent messages, then each code block executed in the
    // sandbox with its result streamed back.
    struct turn_plan {
        std::vector<std::string> messages{};
        std::vector<std::string> code_blocks{};
        std::string stop_reason{"end_turn"};
    };

    class agent_backend {
      public:
        virtual ~agent_backend() = default;

        virtual std::string_view name() const = 0;

        // Called on the loop; must not block.
        virtual turn_plan plan_turn(std::string_view prompt, const session_state& session) const = 0;
    };

    class echo_backend final : public agent_backend {
      public:
        std::string_view name() const override { return "echo"; }
        turn_plan plan_turn(std::string_view prompt, const session_state& session) const override;
    };

    // Runs the fenced code blocks found in the prompt.
    class code_backend final : public agent_backend {
      public:
        std::string_view name() const override { return "code"; }
        turn_plan plan_turn(std::string_view prompt, const session_state& session) const override;
    };

    std::unique_ptr<agent_backend> make_backend(backend_kind kind);

    // Bodies of ``` fences whose info string is empty, "python" or "py". An unterminated fence runs to the end.
    std::vector<std::string> extract_code_blocks(std::string_view text);

}  // namespace keel
