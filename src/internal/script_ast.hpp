#pragma once

#include "keel/script.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace keel::internal::script {

    using keel::script::value;

    struct expr;
    struct stmt;

    using expr_ptr = std::unique_ptr<expr>;
    using stmt_ptr = std::unique_ptr<stmt>;
    using block = std::vector<stmt_ptr>;

    enum class unary_op : uint8_t { neg, pos, logical_not };

    enum class binary_op : uint8_t { add, sub, mul, div, floordiv, mod, pow };

    enum class compare_op : uint8_t { eq, ne, lt, le, gt, ge, in, not_in, is, is_not };

    struct literal_expr {
        value constant{};
    };

    struct name_expr {
        std::string id{};
    };

    struct fstring_part {
        std::string literal{};
        // engaged for a {field}; literal text precedes it
        expr_ptr field{};
        char conversion{0};
        std::string spec{};
    };

    struct fstring_expr {
        std::vector<fstring_part> parts{};
    };

    struct list_expr {
        std::vector<expr_ptr> items{};
    };

    struct tuple_expr {
        std::vector<expr_ptr> items{};
    };

    struct dict_expr {
        std::vector<std::pair<expr_ptr, expr_ptr>> entries{};
    };

    struct comp_clause {
        expr_ptr target{};
        expr_ptr iter{};
        std::vector<expr_ptr> conditions{};
    };

    enum class comp_kind : uint8_t { list, dict };

    struct comprehension_expr {
        comp_kind kind{comp_kind::list};
        expr_ptr element{};
        // dict comprehensions only
        expr_ptr element_value{};
        std::vector<comp_clause> clauses{};
    };

    struct unary_expr {
        unary_op op{};
        expr_ptr operand{};
    };

    struct binary_expr {
        binary_op op{};
        expr_ptr lhs{};
        expr_ptr rhs{};
    };

    struct bool_expr {
        bool is_and{true};
        expr_ptr lhs{};
        expr_ptr rhs{};
    };

    struct compare_expr {
        expr_ptr first{};
        std::vector<std::pair<compare_op, expr_ptr>> rest{};
    };

    struct conditional_expr {
        expr_ptr condition{};
        expr_ptr then{};
        expr_ptr otherwise{};
    };

    struct call_expr {
        expr_ptr callee{};
        std::vector<expr_ptr> args{};
        std::vector<std::pair<std::string, expr_ptr>> kwargs{};
    };

    struct slice_expr {
        expr_ptr lower{};
        expr_ptr upper{};
        expr_ptr step{};
    };

    struct subscript_expr {
        expr_ptr object{};
        expr_ptr index{};
    };

    struct attribute_expr {
        expr_ptr object{};
        std::string attr{};
    };

    struct expr {
        int line{};
        std::variant<
                literal_expr,
                name_expr,
                fstring_expr,
                list_expr,
                tuple_expr,
                dict_expr,
                comprehension_expr,
                unary_expr,
                binary_expr,
                bool_expr,
                compare_expr,
                conditional_expr,
                call_expr,
                slice_expr,
                subscript_expr,
                attribute_expr>
                node;
    };

    // ── statements ──────────────────────────────────────────────────

    struct expr_stmt {
        expr_ptr e{};
    };

    struct assign_stmt {
        // a = b = value has two targets
        std::vector<expr_ptr> targets{};
        expr_ptr value_expr{};
    };

    struct aug_assign_stmt {
        expr_ptr target{};
        binary_op op{};
        expr_ptr value_expr{};
    };

    struct if_stmt {
        std::vector<std::pair<expr_ptr, block>> branches{};
        block orelse{};
    };

    struct while_stmt {
        expr_ptr condition{};
        block body{};
        block orelse{};
    };

    struct for_stmt {
        expr_ptr target{};
        expr_ptr iter{};
        block body{};
        block orelse{};
    };

    struct param {
        std::string name{};
        expr_ptr default_value{};
    };

    struct def_stmt {
        std::string name{};
        std::vector<param> params{};
        block body{};
    };

    struct return_stmt {
        expr_ptr value_expr{};
    };

    struct pass_stmt {};
    struct break_stmt {};
    struct continue_stmt {};

    struct except_handler {
        // null catches everything
        expr_ptr type{};
        std::optional<std::string> name{};
        block body{};
        int line{};
    };

    struct try_stmt {
        block body{};
        std::vector<except_handler> handlers{};
        block orelse{};
        block finalbody{};
    };

    struct raise_stmt {
        // null re-raises the exception being handled
        expr_ptr exc{};
    };

    struct assert_stmt {
        expr_ptr condition{};
        expr_ptr message{};
    };

    struct stmt {
        int line{};
        std::variant<
                expr_stmt,
                assign_stmt,
                aug_assign_stmt,
                if_stmt,
                while_stmt,
                for_stmt,
                def_stmt,
                return_stmt,
                pass_stmt,
                break_stmt,
                continue_stmt,
                try_stmt,
                raise_stmt,
                assert_stmt>
                node;
    };

}  // namespace keel::internal::script

namespace keel::script {

    struct program {
        internal::script::block body{};
    };

}  // namespace keel::script
