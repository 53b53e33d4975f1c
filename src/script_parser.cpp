#include "internal/script_ast.hpp"
#include "internal/script_lexer.hpp"

#include "keel/format.hpp"
#include "keel/utils.hpp"

#include <charconv>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

using namespace keel::literals;

namespace keel::internal::script {

    namespace detail {

        struct parse_abort : std::exception {
            explicit parse_abort(syntax_failure f) : failure{std::move(f)} {}
            const char* what() const noexcept override { return failure.message.c_str(); }
            syntax_failure failure;
        };

        // Statements that would let a program reach outside its namespace.
        inline constexpr std::string_view forbidden_keywords[] = {
                "import", "from", "class", "global", "nonlocal", "lambda", "with", "async", "await", "del", "yield"};

        inline bool is_forbidden(std::string_view kw) {
            for (auto f : forbidden_keywords) {
                if (f == kw) {
                    return true;
                }
            }
            return false;
        }

        inline constexpr std::string_view augmented_ops[] = {"+=", "-=", "*=", "/=", "//=", "%=", "**="};

        inline binary_op augmented_to_binary(std::string_view op) {
            if (op == "+=") {
                return binary_op::add;
            }
            if (op == "-=") {
                return binary_op::sub;
            }
            if (op == "*=") {
                return binary_op::mul;
            }
            if (op == "/=") {
                return binary_op::div;
            }
            if (op == "//=") {
                return binary_op::floordiv;
            }
            if (op == "%=") {
                return binary_op::mod;
            }
            return binary_op::pow;
        }

        template <typename Node>
        expr_ptr make_expr(int line, Node node) {
            auto e = std::make_unique<expr>();
            e->line = line;
            e->node = std::move(node);
            return e;
        }

        template <typename Node>
        stmt_ptr make_stmt(int line, Node node) {
            auto s = std::make_unique<stmt>();
            s->line = line;
            s->node = std::move(node);
            return s;
        }

    }  // namespace detail

    class parser {
      public:
        explicit parser(std::vector<token> tokens, int line_offset = 0)
            : tokens_{std::move(tokens)}, line_offset_{line_offset} {}

        block parse_module() {
            block out{};
            while (!check(token_kind::end_of_file)) {
                if (match(token_kind::newline)) {
                    continue;
                }
                parse_statement(out);
            }
            return out;
        }

        // For f-string fields: one expression, then end of input.
        expr_ptr parse_standalone_expression() {
            while (match(token_kind::newline)) {}
            auto e = parse_exprlist();
            while (match(token_kind::newline)) {}
            if (!check(token_kind::end_of_file)) {
                error("unexpected '{}' in f-string field"_format(current().text));
            }
            return e;
        }

      private:
        // ── token cursor ────────────────────────────────────────────

        const token& current() const { return tokens_[std::min(index_, tokens_.size() - 1)]; }

        const token& lookahead(std::size_t n = 1) const {
            return tokens_[std::min(index_ + n, tokens_.size() - 1)];
        }

        int line() const { return current().line + line_offset_; }

        bool check(token_kind kind) const { return current().kind == kind; }

        bool check_op(std::string_view op) const { return check(token_kind::op) && current().text == op; }

        bool check_keyword(std::string_view kw) const { return check(token_kind::keyword) && current().text == kw; }

        bool match(token_kind kind) {
            if (!check(kind)) {
                return false;
            }
            ++index_;
            return true;
        }

        bool match_op(std::string_view op) {
            if (!check_op(op)) {
                return false;
            }
            ++index_;
            return true;
        }

        bool match_keyword(std::string_view kw) {
            if (!check_keyword(kw)) {
                return false;
            }
            ++index_;
            return true;
        }

        [[noreturn]] void error(std::string message) const {
            throw detail::parse_abort{
                    syntax_failure{.message = std::move(message), .line = line(), .column = current().column}};
        }

        std::string describe(const token& tok) const {
            switch (tok.kind) {
                case token_kind::end_of_file:
                    return "end of input";
                case token_kind::newline:
                    return "end of line";
                case token_kind::indent:
                    return "indent";
                case token_kind::dedent:
                    return "dedent";
                case token_kind::string:
                case token_kind::fstring:
                    return "string literal";
                default:
                    return "'{}'"_format(tok.text);
            }
        }

        void expect_op(std::string_view op) {
            if (!match_op(op)) {
                error("expected '{}' but found {}"_format(op, describe(current())));
            }
        }

        void expect(token_kind kind, std::string_view what) {
            if (!match(kind)) {
                error("expected {} but found {}"_format(what, describe(current())));
            }
        }

        void expect_keyword(std::string_view kw) {
            if (!match_keyword(kw)) {
                error("expected '{}' but found {}"_format(kw, describe(current())));
            }
        }

        std::string expect_name(std::string_view what) {
            if (!check(token_kind::name)) {
                error("expected {} but found {}"_format(what, describe(current())));
            }
            std::string name = current().text;
            check_name(name);
            ++index_;
            return name;
        }

        void check_name(std::string_view name) const {
            if (is_dunder(name)) {
                error("name '{}' is not allowed"_format(name));
            }
        }

        void reject_forbidden() const {
            if (check(token_kind::keyword) && detail::is_forbidden(current().text)) {
                error("'{}' is not allowed"_format(current().text));
            }
        }

        // ── statements ──────────────────────────────────────────────

        void parse_statement(block& out) {
            reject_forbidden();
            if (check_keyword("if")) {
                out.push_back(parse_if());
            }
            else if (check_keyword("while")) {
                out.push_back(parse_while());
            }
            else if (check_keyword("for")) {
                out.push_back(parse_for());
            }
            else if (check_keyword("def")) {
                out.push_back(parse_def());
            }
            else if (check_keyword("try")) {
                out.push_back(parse_try());
            }
            else if (check(token_kind::indent)) {
                error("unexpected indent");
            }
            else {
                parse_simple_statements(out);
            }
        }

        void parse_simple_statements(block& out) {
            out.push_back(parse_small_statement());
            while (match_op(";")) {
                if (check(token_kind::newline)) {
                    break;
                }
                out.push_back(parse_small_statement());
            }
            expect(token_kind::newline, "end of line");
        }

        block parse_block() {
            expect_op(":");
            block body{};
            if (match(token_kind::newline)) {
                expect(token_kind::indent, "an indented block");
                while (!match(token_kind::dedent)) {
                    if (check(token_kind::end_of_file)) {
                        break;
                    }
                    if (match(token_kind::newline)) {
                        continue;
                    }
                    parse_statement(body);
                }
            }
            else {
                parse_simple_statements(body);
            }
            return body;
        }

        block parse_loop_body() {
            ++loop_depth_;
            auto body = parse_block();
            --loop_depth_;
            return body;
        }

        stmt_ptr parse_small_statement() {
            reject_forbidden();
            int ln = line();

            if (match_keyword("pass")) {
                return detail::make_stmt(ln, pass_stmt{});
            }
            if (match_keyword("break")) {
                if (loop_depth_ == 0) {
                    error("'break' outside loop");
                }
                return detail::make_stmt(ln, break_stmt{});
            }
            if (match_keyword("continue")) {
                if (loop_depth_ == 0) {
                    error("'continue' not properly in loop");
                }
                return detail::make_stmt(ln, continue_stmt{});
            }
            if (match_keyword("return")) {
                if (function_depth_ == 0) {
                    error("'return' outside function");
                }
                return_stmt r{};
                if (starts_expression()) {
                    r.value_expr = parse_exprlist();
                }
                return detail::make_stmt(ln, std::move(r));
            }
            if (match_keyword("raise")) {
                raise_stmt r{};
                if (starts_expression()) {
                    r.exc = parse_expr();
                }
                if (match_keyword("from")) {
                    error("'raise ... from' is not supported");
                }
                return detail::make_stmt(ln, std::move(r));
            }
            if (match_keyword("assert")) {
                assert_stmt a{};
                a.condition = parse_expr();
                if (match_op(",")) {
                    a.message = parse_expr();
                }
                return detail::make_stmt(ln, std::move(a));
            }

            auto first = parse_exprlist();

            for (auto op : detail::augmented_ops) {
                if (match_op(op)) {
                    check_target(*first, false);
                    aug_assign_stmt a{};
                    a.target = std::move(first);
                    a.op = detail::augmented_to_binary(op);
                    a.value_expr = parse_exprlist();
                    return detail::make_stmt(ln, std::move(a));
                }
            }

            if (check_op("=")) {
                assign_stmt a{};
                a.targets.push_back(std::move(first));
                while (match_op("=")) {
                    a.value_expr = parse_exprlist();
                    if (check_op("=")) {
                        a.targets.push_back(std::move(a.value_expr));
                    }
                }
                for (auto& t : a.targets) {
                    check_target(*t, true);
                }
                return detail::make_stmt(ln, std::move(a));
            }

            if (check_op(":")) {
                error("annotated assignments are not supported");
            }
            return detail::make_stmt(ln, expr_stmt{std::move(first)});
        }

        void check_target(const expr& target, bool allow_unpack) const {
            if (std::holds_alternative<name_expr>(target.node) || std::holds_alternative<subscript_expr>(target.node) ||
                std::holds_alternative<attribute_expr>(target.node)) {
                return;
            }
            if (allow_unpack) {
                if (auto* t = std::get_if<tuple_expr>(&target.node)) {
                    for (auto& item : t->items) {
                        check_target(*item, true);
                    }
                    return;
                }
                if (auto* l = std::get_if<list_expr>(&target.node)) {
                    for (auto& item : l->items) {
                        check_target(*item, true);
                    }
                    return;
                }
            }
            throw detail::parse_abort{
                    syntax_failure{.message = "cannot assign to expression", .line = target.line, .column = 1}};
        }

        stmt_ptr parse_if() {
            int ln = line();
            expect_keyword("if");
            if_stmt s{};
            auto cond = parse_expr();
            s.branches.emplace_back(std::move(cond), parse_block());
            while (check_keyword("elif")) {
                ++index_;
                auto c = parse_expr();
                s.branches.emplace_back(std::move(c), parse_block());
            }
            if (match_keyword("else")) {
                s.orelse = parse_block();
            }
            return detail::make_stmt(ln, std::move(s));
        }

        stmt_ptr parse_while() {
            int ln = line();
            expect_keyword("while");
            while_stmt s{};
            s.condition = parse_expr();
            s.body = parse_loop_body();
            if (match_keyword("else")) {
                s.orelse = parse_block();
            }
            return detail::make_stmt(ln, std::move(s));
        }

        stmt_ptr parse_for() {
            int ln = line();
            expect_keyword("for");
            for_stmt s{};
            s.target = parse_target_list();
            expect_keyword("in");
            s.iter = parse_exprlist();
            s.body = parse_loop_body();
            if (match_keyword("else")) {
                s.orelse = parse_block();
            }
            return detail::make_stmt(ln, std::move(s));
        }

        stmt_ptr parse_def() {
            int ln = line();
            expect_keyword("def");
            def_stmt d{};
            d.name = expect_name("function name");
            expect_op("(");
            bool seen_default = false;
            while (!check_op(")")) {
                if (check_op("*") || check_op("**")) {
                    error("variadic parameters are not supported");
                }
                param p{};
                p.name = expect_name("parameter name");
                for (const auto& other : d.params) {
                    if (other.name == p.name) {
                        error("duplicate parameter '{}'"_format(p.name));
                    }
                }
                if (match_op(":")) {
                    // annotations are parsed and ignored
                    (void)parse_expr();
                }
                if (match_op("=")) {
                    p.default_value = parse_expr();
                    seen_default = true;
                }
                else if (seen_default) {
                    error("parameter without a default follows parameter with a default");
                }
                d.params.push_back(std::move(p));
                if (!match_op(",")) {
                    break;
                }
            }
            expect_op(")");
            if (match_op("->")) {
                (void)parse_expr();
            }
            auto enclosing_loops = std::exchange(loop_depth_, 0);
            ++function_depth_;
            d.body = parse_block();
            --function_depth_;
            loop_depth_ = enclosing_loops;
            return detail::make_stmt(ln, std::move(d));
        }

        stmt_ptr parse_try() {
            int ln = line();
            expect_keyword("try");
            try_stmt t{};
            t.body = parse_block();
            while (check_keyword("except")) {
                except_handler h{};
                h.line = line();
                ++index_;
                if (!check_op(":")) {
                    h.type = parse_expr();
                    if (match_keyword("as")) {
                        h.name = expect_name("exception name");
                    }
                }
                h.body = parse_block();
                t.handlers.push_back(std::move(h));
            }
            if (match_keyword("else")) {
                if (t.handlers.empty()) {
                    error("'else' requires an 'except' clause");
                }
                t.orelse = parse_block();
            }
            if (match_keyword("finally")) {
                t.finalbody = parse_block();
            }
            else if (t.handlers.empty()) {
                error("expected 'except' or 'finally' block");
            }
            return detail::make_stmt(ln, std::move(t));
        }

        // ── expressions ─────────────────────────────────────────────

        bool starts_expression() const {
            if (check(token_kind::newline) || check(token_kind::end_of_file) || check(token_kind::dedent) ||
                check(token_kind::indent)) {
                return false;
            }
            if (check(token_kind::op)) {
                auto op = current().text;
                return op == "(" || op == "[" || op == "{" || op == "-" || op == "+" || op == "~";
            }
            if (check(token_kind::keyword)) {
                auto kw = current().text;
                return kw == "None" || kw == "True" || kw == "False" || kw == "not" || kw == "lambda" ||
                       kw == "await";
            }
            return true;
        }

        expr_ptr parse_exprlist() {
            int ln = line();
            auto first = parse_expr();
            if (!check_op(",")) {
                return first;
            }
            tuple_expr t{};
            t.items.push_back(std::move(first));
            while (match_op(",")) {
                if (!starts_expression()) {
                    break;
                }
                t.items.push_back(parse_expr());
            }
            return detail::make_expr(ln, std::move(t));
        }

        // for-loop and comprehension targets; stops before 'in'
        expr_ptr parse_target_list() {
            int ln = line();
            auto first = parse_primary();
            if (!check_op(",")) {
                check_target(*first, true);
                return first;
            }
            tuple_expr t{};
            t.items.push_back(std::move(first));
            while (match_op(",")) {
                if (check_keyword("in")) {
                    break;
                }
                t.items.push_back(parse_primary());
            }
            auto out = detail::make_expr(ln, std::move(t));
            check_target(*out, true);
            return out;
        }

        expr_ptr parse_expr() {
            reject_forbidden();
            int ln = line();
            auto e = parse_or();
            if (match_keyword("if")) {
                conditional_expr c{};
                c.then = std::move(e);
                c.condition = parse_or();
                expect_keyword("else");
                c.otherwise = parse_expr();
                return detail::make_expr(ln, std::move(c));
            }
            return e;
        }

        // conditional without a trailing `if`, used where `if` starts a comprehension filter
        expr_ptr parse_expr_no_cond() { return parse_or(); }

        expr_ptr parse_or() {
            int ln = line();
            auto lhs = parse_and();
            while (match_keyword("or")) {
                lhs = detail::make_expr(ln, bool_expr{false, std::move(lhs), parse_and()});
            }
            return lhs;
        }

        expr_ptr parse_and() {
            int ln = line();
            auto lhs = parse_not();
            while (match_keyword("and")) {
                lhs = detail::make_expr(ln, bool_expr{true, std::move(lhs), parse_not()});
            }
            return lhs;
        }

        expr_ptr parse_not() {
            int ln = line();
            if (match_keyword("not")) {
                return detail::make_expr(ln, unary_expr{unary_op::logical_not, parse_not()});
            }
            return parse_comparison();
        }

        std::optional<compare_op> match_compare_op() {
            if (match_op("==")) {
                return compare_op::eq;
            }
            if (match_op("!=")) {
                return compare_op::ne;
            }
            if (match_op("<=")) {
                return compare_op::le;
            }
            if (match_op(">=")) {
                return compare_op::ge;
            }
            if (match_op("<")) {
                return compare_op::lt;
            }
            if (match_op(">")) {
                return compare_op::gt;
            }
            if (match_keyword("in")) {
                return compare_op::in;
            }
            if (check_keyword("not") && lookahead().kind == token_kind::keyword && lookahead().text == "in") {
                index_ += 2;
                return compare_op::not_in;
            }
            if (match_keyword("is")) {
                return match_keyword("not") ? compare_op::is_not : compare_op::is;
            }
            return std::nullopt;
        }

        expr_ptr parse_comparison() {
            int ln = line();
            auto first = parse_arith();
            compare_expr c{};
            while (auto op = match_compare_op()) {
                c.rest.emplace_back(*op, parse_arith());
            }
            if (c.rest.empty()) {
                return first;
            }
            c.first = std::move(first);
            return detail::make_expr(ln, std::move(c));
        }

        expr_ptr parse_arith() {
            int ln = line();
            auto lhs = parse_term();
            for (;;) {
                if (match_op("+")) {
                    lhs = detail::make_expr(ln, binary_expr{binary_op::add, std::move(lhs), parse_term()});
                }
                else if (match_op("-")) {
                    lhs = detail::make_expr(ln, binary_expr{binary_op::sub, std::move(lhs), parse_term()});
                }
                else {
                    return lhs;
                }
            }
        }

        expr_ptr parse_term() {
            int ln = line();
            auto lhs = parse_factor();
            for (;;) {
                binary_op op{};
                if (match_op("*")) {
                    op = binary_op::mul;
                }
                else if (match_op("/")) {
                    op = binary_op::div;
                }
                else if (match_op("//")) {
                    op = binary_op::floordiv;
                }
                else if (match_op("%")) {
                    op = binary_op::mod;
                }
                else {
                    return lhs;
                }
                lhs = detail::make_expr(ln, binary_expr{op, std::move(lhs), parse_factor()});
            }
        }

        expr_ptr parse_factor() {
            int ln = line();
            if (match_op("-")) {
                return detail::make_expr(ln, unary_expr{unary_op::neg, parse_factor()});
            }
            if (match_op("+")) {
                return detail::make_expr(ln, unary_expr{unary_op::pos, parse_factor()});
            }
            if (check_op("~")) {
                error("bitwise operators are not supported");
            }
            return parse_power();
        }

        expr_ptr parse_power() {
            int ln = line();
            auto base = parse_primary();
            if (match_op("**")) {
                return detail::make_expr(ln, binary_expr{binary_op::pow, std::move(base), parse_factor()});
            }
            return base;
        }

        expr_ptr parse_primary() {
            auto e = parse_atom();
            for (;;) {
                int ln = line();
                if (match_op("(")) {
                    e = parse_call(std::move(e), ln);
                }
                else if (match_op("[")) {
                    subscript_expr s{};
                    s.object = std::move(e);
                    s.index = parse_subscript();
                    expect_op("]");
                    e = detail::make_expr(ln, std::move(s));
                }
                else if (match_op(".")) {
                    attribute_expr a{};
                    a.object = std::move(e);
                    a.attr = expect_name("attribute name");
                    e = detail::make_expr(ln, std::move(a));
                }
                else {
                    return e;
                }
            }
        }

        expr_ptr parse_call(expr_ptr callee, int ln) {
            call_expr c{};
            c.callee = std::move(callee);
            while (!check_op(")")) {
                if (check_op("*") || check_op("**")) {
                    error("argument unpacking is not supported");
                }
                if (check(token_kind::name) && lookahead().kind == token_kind::op && lookahead().text == "=") {
                    std::string kw = expect_name("keyword argument");
                    ++index_;
                    for (const auto& [existing, _] : c.kwargs) {
                        if (existing == kw) {
                            error("keyword argument repeated: {}"_format(kw));
                        }
                    }
                    c.kwargs.emplace_back(std::move(kw), parse_expr());
                }
                else {
                    if (!c.kwargs.empty()) {
                        error("positional argument follows keyword argument");
                    }
                    int arg_line = line();
                    auto arg = parse_expr();
                    if (check_keyword("for")) {
                        // f(x for x in xs) passes a single materialized list
                        arg = parse_comprehension(comp_kind::list, std::move(arg), nullptr, arg_line);
                    }
                    c.args.push_back(std::move(arg));
                }
                if (!match_op(",")) {
                    break;
                }
            }
            expect_op(")");
            return detail::make_expr(ln, std::move(c));
        }

        expr_ptr parse_subscript() {
            int ln = line();
            expr_ptr lower{};
            if (!check_op(":")) {
                lower = parse_expr();
                if (!check_op(":")) {
                    if (check_op(",")) {
                        tuple_expr t{};
                        t.items.push_back(std::move(lower));
                        while (match_op(",")) {
                            if (check_op("]")) {
                                break;
                            }
                            t.items.push_back(parse_expr());
                        }
                        return detail::make_expr(ln, std::move(t));
                    }
                    return lower;
                }
            }
            slice_expr s{};
            s.lower = std::move(lower);
            expect_op(":");
            if (!check_op("]") && !check_op(":")) {
                s.upper = parse_expr();
            }
            if (match_op(":")) {
                if (!check_op("]")) {
                    s.step = parse_expr();
                }
            }
            return detail::make_expr(ln, std::move(s));
        }

        expr_ptr parse_comprehension(comp_kind kind, expr_ptr element, expr_ptr element_value, int ln) {
            comprehension_expr c{};
            c.kind = kind;
            c.element = std::move(element);
            c.element_value = std::move(element_value);
            while (match_keyword("for")) {
                comp_clause clause{};
                clause.target = parse_target_list();
                expect_keyword("in");
                clause.iter = parse_or();
                while (match_keyword("if")) {
                    clause.conditions.push_back(parse_expr_no_cond());
                }
                c.clauses.push_back(std::move(clause));
            }
            return detail::make_expr(ln, std::move(c));
        }

        expr_ptr parse_atom() {
            reject_forbidden();
            int ln = line();
            const token& tok = current();

            switch (tok.kind) {
                case token_kind::name: {
                    std::string name = expect_name("name");
                    return detail::make_expr(ln, name_expr{std::move(name)});
                }
                case token_kind::keyword: {
                    if (match_keyword("None")) {
                        return detail::make_expr(ln, literal_expr{value{}});
                    }
                    if (match_keyword("True")) {
                        return detail::make_expr(ln, literal_expr{value{true}});
                    }
                    if (match_keyword("False")) {
                        return detail::make_expr(ln, literal_expr{value{false}});
                    }
                    error("unexpected keyword '{}'"_format(tok.text));
                }
                case token_kind::integer:
                    return detail::make_expr(ln, literal_expr{parse_integer(tok.text)});
                case token_kind::floating:
                    return detail::make_expr(ln, literal_expr{parse_float(tok.text)});
                case token_kind::string:
                case token_kind::fstring:
                    return parse_strings();
                case token_kind::op:
                    break;
                default:
                    error("unexpected {}"_format(describe(tok)));
            }

            if (match_op("(")) {
                if (match_op(")")) {
                    return detail::make_expr(ln, tuple_expr{});
                }
                auto first = parse_expr();
                if (check_keyword("for")) {
                    auto comp = parse_comprehension(comp_kind::list, std::move(first), nullptr, ln);
                    expect_op(")");
                    return comp;
                }
                if (match_op(")")) {
                    return first;
                }
                tuple_expr t{};
                t.items.push_back(std::move(first));
                while (match_op(",")) {
                    if (check_op(")")) {
                        break;
                    }
                    t.items.push_back(parse_expr());
                }
                expect_op(")");
                return detail::make_expr(ln, std::move(t));
            }

            if (match_op("[")) {
                list_expr l{};
                if (match_op("]")) {
                    return detail::make_expr(ln, std::move(l));
                }
                auto first = parse_expr();
                if (check_keyword("for")) {
                    auto comp = parse_comprehension(comp_kind::list, std::move(first), nullptr, ln);
                    expect_op("]");
                    return comp;
                }
                l.items.push_back(std::move(first));
                while (match_op(",")) {
                    if (check_op("]")) {
                        break;
                    }
                    l.items.push_back(parse_expr());
                }
                expect_op("]");
                return detail::make_expr(ln, std::move(l));
            }

            if (match_op("{")) {
                dict_expr d{};
                if (match_op("}")) {
                    return detail::make_expr(ln, std::move(d));
                }
                auto key = parse_expr();
                if (!match_op(":")) {
                    error("set literals are not supported");
                }
                auto val = parse_expr();
                if (check_keyword("for")) {
                    auto comp = parse_comprehension(comp_kind::dict, std::move(key), std::move(val), ln);
                    expect_op("}");
                    return comp;
                }
                d.entries.emplace_back(std::move(key), std::move(val));
                while (match_op(",")) {
                    if (check_op("}")) {
                        break;
                    }
                    auto k = parse_expr();
                    expect_op(":");
                    d.entries.emplace_back(std::move(k), parse_expr());
                }
                expect_op("}");
                return detail::make_expr(ln, std::move(d));
            }

            error("unexpected {}"_format(describe(tok)));
        }

        value parse_integer(const std::string& text) {
            std::string digits{};
            int base = 10;
            std::string_view body{text};
            if (body.size() > 2 && body[0] == '0') {
                char p = utils::char_tolower(body[1]);
                if (p == 'x' || p == 'o' || p == 'b') {
                    base = p == 'x' ? 16 : (p == 'o' ? 8 : 2);
                    body.remove_prefix(2);
                }
            }
            for (char c : body) {
                if (c != '_') {
                    digits.push_back(c);
                }
            }
            if (base == 10 && digits.size() > 1 && digits.front() == '0' && digits.find_first_not_of('0') != digits.npos) {
                error("leading zeros in decimal integer literals are not permitted");
            }
            auto parsed = utils::parse_arithmetic<std::int64_t>(digits, base);
            if (!parsed) {
                error("integer literal out of range: {}"_format(text));
            }
            ++index_;
            return value{*parsed};
        }

        value parse_float(const std::string& text) {
            std::string digits{};
            for (char c : text) {
                if (c != '_') {
                    digits.push_back(c);
                }
            }
            auto parsed = utils::parse_arithmetic<double>(digits);
            if (!parsed) {
                error("invalid float literal: {}"_format(text));
            }
            ++index_;
            return value{*parsed};
        }

        // Adjacent string literals concatenate; any f-string among them makes the whole an f-string.
        expr_ptr parse_strings() {
            int ln = line();
            std::vector<fstring_part> parts{};
            bool formatted = false;
            while (check(token_kind::string) || check(token_kind::fstring)) {
                const token& tok = current();
                if (tok.kind == token_kind::string) {
                    append_literal(parts, tok.text);
                }
                else {
                    formatted = true;
                    split_fstring(tok, parts);
                }
                ++index_;
            }
            if (!formatted) {
                std::string text{};
                for (auto& p : parts) {
                    text += p.literal;
                }
                return detail::make_expr(ln, literal_expr{value{std::move(text)}});
            }
            return detail::make_expr(ln, fstring_expr{std::move(parts)});
        }

        static void append_literal(std::vector<fstring_part>& parts, std::string_view text) {
            if (parts.empty() || parts.back().field) {
                parts.push_back(fstring_part{});
            }
            parts.back().literal += text;
        }

        void split_fstring(const token& tok, std::vector<fstring_part>& parts) {
            bool raw = tok.text.front() == 'r';
            std::string_view body = std::string_view{tok.text}.substr(1);
            std::string pending{};

            auto flush_literal = [&] {
                if (pending.empty()) {
                    return;
                }
                if (raw) {
                    append_literal(parts, pending);
                }
                else {
                    std::string decoded{};
                    if (decode_escapes(pending, decoded)) {
                        error("invalid escape sequence in f-string");
                    }
                    append_literal(parts, decoded);
                }
                pending.clear();
            };

            for (std::size_t i = 0; i < body.size(); ++i) {
                char c = body[i];
                if (c == '{' && i + 1 < body.size() && body[i + 1] == '{') {
                    pending.push_back('{');
                    ++i;
                    continue;
                }
                if (c == '}') {
                    if (i + 1 < body.size() && body[i + 1] == '}') {
                        pending.push_back('}');
                        ++i;
                        continue;
                    }
                    error("single '}' is not allowed in f-string");
                }
                if (c != '{') {
                    pending.push_back(c);
                    continue;
                }

                // field: find the matching close brace, honoring nested brackets and quotes
                std::size_t start = i + 1;
                int depth = 0;
                char quote = 0;
                std::size_t expr_end = std::string_view::npos;
                std::size_t end = start;
                for (; end < body.size(); ++end) {
                    char d = body[end];
                    if (quote) {
                        if (d == quote) {
                            quote = 0;
                        }
                        continue;
                    }
                    if (d == '\'' || d == '"') {
                        quote = d;
                    }
                    else if (d == '(' || d == '[' || d == '{') {
                        ++depth;
                    }
                    else if ((d == ')' || d == ']' || d == '}') && depth > 0) {
                        --depth;
                    }
                    else if (depth == 0 && d == '}') {
                        break;
                    }
                    else if (depth == 0 && expr_end == std::string_view::npos &&
                             ((d == '!' && end + 1 < body.size() && body[end + 1] != '=') || d == ':')) {
                        expr_end = end;
                    }
                }
                if (end >= body.size()) {
                    error("expected '}' in f-string");
                }

                fstring_part part{};
                std::string_view field = body.substr(start, (expr_end == std::string_view::npos ? end : expr_end) - start);
                if (expr_end != std::string_view::npos) {
                    std::string_view tail = body.substr(expr_end, end - expr_end);
                    if (tail.front() == '!') {
                        if (tail.size() < 2 || (tail[1] != 'r' && tail[1] != 's')) {
                            error("f-string conversion must be !r or !s");
                        }
                        part.conversion = tail[1];
                        tail.remove_prefix(2);
                    }
                    if (!tail.empty()) {
                        if (tail.front() != ':') {
                            error("invalid f-string field");
                        }
                        part.spec = std::string{tail.substr(1)};
                    }
                }

                flush_literal();
                part.field = parse_field(field, tok.line + line_offset_);
                if (!parts.empty() && !parts.back().field) {
                    part.literal = std::move(parts.back().literal);
                    parts.pop_back();
                }
                parts.push_back(std::move(part));
                i = end;
            }
            flush_literal();
        }

        expr_ptr parse_field(std::string_view source, int ln) const {
            if (source.find_first_not_of(" \t") == std::string_view::npos) {
                error("empty expression in f-string");
            }
            std::string wrapped = "(" + std::string{source} + ")";
            lexer lx{wrapped};
            if (auto failure = lx.run()) {
                failure->line = ln;
                throw detail::parse_abort{*failure};
            }
            parser sub{std::move(lx.tokens()), ln - 1};
            return sub.parse_standalone_expression();
        }

        std::vector<token> tokens_;
        std::size_t index_{0};
        int line_offset_{0};
        int loop_depth_{0};
        int function_depth_{0};
    };

}  // namespace keel::internal::script

namespace keel::script {

    std::expected<std::shared_ptr<const program>, syntax_failure> parse(std::string_view source) {
        internal::script::lexer lx{source};
        if (auto failure = lx.run()) {
            return std::unexpected{std::move(*failure)};
        }
        try {
            internal::script::parser p{std::move(lx.tokens())};
            auto prog = std::make_shared<program>();
            prog->body = p.parse_module();
            return std::shared_ptr<const program>{std::move(prog)};
        } catch (const internal::script::detail::parse_abort& e) {
            return std::unexpected{e.failure};
        }
    }

}  // namespace keel::script
