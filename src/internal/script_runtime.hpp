#pragma once

#include "script_ast.hpp"

#include "keel/script.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace keel::internal::script {

    using keel::script::native_args;
    using keel::script::run_limits;
    using keel::script::script_error;

    struct scope {
        std::unordered_map<std::string, value> vars{};
        std::shared_ptr<scope> parent{};
    };

    using scope_ptr = std::shared_ptr<scope>;

    // Services the evaluator offers to builtins and methods that call back into the program.
    class runtime {
      public:
        virtual ~runtime() = default;

        // Calls any callable value (user function, builtin, bound method, exception class).
        virtual value call(const value& fn, std::vector<value> args) = 0;

        virtual void write_output(std::string_view text) = 0;

        // Raises the interrupt when the deadline passed or a stop was requested.
        virtual void check_budget() = 0;

        virtual const run_limits& limits() const = 0;
    };

    // ── operators (script_ops.cpp) ──────────────────────────────────

    value binary(binary_op op, const value& lhs, const value& rhs, const run_limits& limits);
    bool compare(compare_op op, const value& lhs, const value& rhs);
    // total order for sorted/min/max; raises TypeError for unorderable pairs
    bool less_than(const value& lhs, const value& rhs);

    value getitem(const value& obj, const value& key);
    value getslice(const value& obj, const value& lower, const value& upper, const value& step);
    void setitem(const value& obj, const value& key, value v);
    value getattr(const value& obj, const std::string& name);
    void setattr(const value& obj, const std::string& name, value v);

    std::int64_t length(const value& v);
    bool contains(const value& container, const value& item);
    // materializes any iterable; raises TypeError otherwise
    std::vector<value> iterate(const value& v);

    std::int64_t to_index(const value& v, std::string_view what);
    std::string format_value(const value& v, std::string_view spec, std::size_t max_length);

    // UTF-8 code points of s, each as its own string.
    std::vector<std::string> utf8_chars(std::string_view s);
    bool is_ascii(std::string_view s);

    // ── builtins and methods (script_builtins.cpp) ──────────────────

    std::map<std::string, value> make_builtins(runtime& rt);
    bool has_method(const value& self, std::string_view name);
    value call_method(runtime& rt, const value& self, const std::string& name, native_args& args);

    // `except handler:` matching; `handler` is an exception class or a tuple of them
    bool exception_matches(const keel::script::exception_object& exc, const value& handler);

}  // namespace keel::internal::script

namespace keel::script {

    struct function_object {
        std::string name{};
        const internal::script::def_stmt* def{};
        // one slot per parameter; none where the parameter has no default
        std::vector<std::optional<value>> defaults{};
        internal::script::scope_ptr closure{};
        // keeps the AST that `def` points into alive
        std::shared_ptr<const program> anchor{};
    };

}  // namespace keel::script
