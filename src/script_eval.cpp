#include "internal/script_runtime.hpp"

#include "keel/format.hpp"

#include <chrono>
#include <limits>
#include <unordered_map>

using namespace keel::literals;

namespace keel::internal::script {

    using keel::script::bound_method;
    using keel::script::builtin_function;
    using keel::script::dict_object;
    using keel::script::exception_object;
    using keel::script::exception_type;
    using keel::script::failure_kind;
    using keel::script::function_object;
    using keel::script::list_object;
    using keel::script::module_object;
    using keel::script::range_t;
    using keel::script::run_failure;
    using keel::script::run_outcome;
    using keel::script::tuple_object;

    namespace detail {

        // Deadline or stop request. Not a script_error and not a std::exception, so neither `except` clauses nor
        // native-call translation can intercept it.
        struct interrupted {
            failure_kind kind{failure_kind::execution_timeout};
        };

        enum class flow : uint8_t { normal, brk, cont, ret };

        [[noreturn]] static void raise(std::string kind, std::string message) {
            throw script_error{std::move(kind), std::move(message)};
        }

        struct depth_guard {
            std::size_t& depth;
            explicit depth_guard(std::size_t& d) : depth{d} { ++depth; }
            ~depth_guard() { --depth; }
            depth_guard(const depth_guard&) = delete;
            depth_guard& operator=(const depth_guard&) = delete;
        };

        template <typename T>
        struct stack_guard {
            std::vector<T>& stack;
            stack_guard(std::vector<T>& s, T item) : stack{s} { stack.push_back(std::move(item)); }
            ~stack_guard() { stack.pop_back(); }
            stack_guard(const stack_guard&) = delete;
            stack_guard& operator=(const stack_guard&) = delete;
        };

        static bool is_callable_kind(const value& v) {
            return v.is<std::shared_ptr<builtin_function>>() || v.is<std::shared_ptr<function_object>>() ||
                   v.is<std::shared_ptr<bound_method>>() || v.is<std::shared_ptr<module_object>>() ||
                   v.is<exception_type>();
        }

    }  // namespace detail

    using detail::flow;

    class evaluator final : public runtime {
      public:
        evaluator(std::shared_ptr<const keel::script::program> prog, const run_limits& limits)
            : prog_{std::move(prog)}, limits_{limits}, builtins_{make_builtins(*this)} {}

        evaluator(const evaluator&) = delete;
        evaluator& operator=(const evaluator&) = delete;

        ~evaluator() override {
            // closures and the scopes holding them reference each other
            for (auto& [_, weak] : closures_) {
                if (auto sc = weak.lock()) {
                    sc->vars.clear();
                }
            }
            if (globals_) {
                globals_->vars.clear();
            }
        }

        run_outcome run(std::map<std::string, value> globals) {
            run_outcome out{};
            globals_ = std::make_shared<scope>();
            for (auto& [name, v] : globals) {
                globals_->vars.insert_or_assign(name, std::move(v));
            }

            try {
                exec_block(prog_->body, globals_);
            } catch (const script_error& e) {
                out.failure = run_failure{failure_kind::runtime_error, e.kind(), e.message(), e.line()};
            } catch (const detail::interrupted& i) {
                out.failure = run_failure{
                        i.kind,
                        i.kind == failure_kind::cancelled ? "CancelledError" : "TimeoutError",
                        i.kind == failure_kind::cancelled ? "execution cancelled" : "execution time budget exceeded",
                        std::nullopt};
            } catch (const std::exception& e) {
                out.failure = run_failure{failure_kind::runtime_error, "RuntimeError", e.what(), std::nullopt};
            }

            out.output = std::move(output_);
            out.output_truncated = truncated_;
            for (const auto& [name, v] : globals_->vars) {
                if (!detail::is_callable_kind(v)) {
                    out.globals.emplace(name, v);
                }
            }
            return out;
        }

        value call(const value& fn, std::vector<value> args) override { return call_value(fn, std::move(args), {}); }

        void write_output(std::string_view text) override {
            if (truncated_) {
                return;
            }
            auto room = limits_.max_output_bytes - output_.size();
            if (text.size() > room) {
                output_.append(text.substr(0, room));
                truncated_ = true;
                return;
            }
            output_.append(text);
        }

        void check_budget() override {
            if (limits_.stop.stop_requested()) {
                throw detail::interrupted{failure_kind::cancelled};
            }
            if (std::chrono::steady_clock::now() >= limits_.deadline) {
                throw detail::interrupted{failure_kind::execution_timeout};
            }
        }

        const run_limits& limits() const override { return limits_; }

      private:
        std::shared_ptr<const keel::script::program> prog_;
        run_limits limits_;
        std::map<std::string, value> builtins_;
        scope_ptr globals_{};

        std::string output_{};
        bool truncated_{false};

        std::size_t depth_{0};
        std::optional<value> returning_{};
        // exceptions being handled, innermost last; bare `raise` re-raises the top
        std::vector<script_error> handling_{};
        std::unordered_map<const scope*, std::weak_ptr<scope>> closures_{};

        // ── names ───────────────────────────────────────────────────

        value lookup(const std::string& name, const scope_ptr& sc) const {
            for (const scope* s = sc.get(); s; s = s->parent.get()) {
                if (auto it = s->vars.find(name); it != s->vars.end()) {
                    return it->second;
                }
            }
            if (auto it = builtins_.find(name); it != builtins_.end()) {
                return it->second;
            }
            detail::raise("NameError", "name '{}' is not defined"_format(name));
        }

        // ── iteration ───────────────────────────────────────────────

        // Calls fn for each item until it returns false. Ranges are walked lazily.
        template <typename F>
        void for_each_item(const value& iterable, F&& fn) {
            if (auto* r = iterable.get_if<range_t>()) {
                auto n = r->size();
                for (std::int64_t i = 0; i < n; ++i) {
                    check_budget();
                    if (!fn(value{r->at(i)})) {
                        return;
                    }
                }
                return;
            }
            for (auto& item : iterate(iterable)) {
                check_budget();
                if (!fn(std::move(item))) {
                    return;
                }
            }
        }

        // ── statements ──────────────────────────────────────────────

        flow exec_block(const block& body, const scope_ptr& sc) {
            for (const auto& s : body) {
                if (auto f = exec(*s, sc); f != flow::normal) {
                    return f;
                }
            }
            return flow::normal;
        }

        flow exec(const stmt& s, const scope_ptr& sc) {
            check_budget();
            try {
                return std::visit([&](const auto& node) { return exec_node(node, sc); }, s.node);
            } catch (script_error& e) {
                e.set_line(s.line);
                throw;
            }
        }

        flow exec_node(const expr_stmt& n, const scope_ptr& sc) {
            eval(*n.e, sc);
            return flow::normal;
        }

        flow exec_node(const assign_stmt& n, const scope_ptr& sc) {
            value v = eval(*n.value_expr, sc);
            for (const auto& target : n.targets) {
                assign_to(*target, v, sc);
            }
            return flow::normal;
        }

        flow exec_node(const aug_assign_stmt& n, const scope_ptr& sc) {
            const expr& target = *n.target;
            if (auto* name = std::get_if<name_expr>(&target.node)) {
                value current = lookup(name->id, sc);
                value rhs = eval(*n.value_expr, sc);
                sc->vars.insert_or_assign(name->id, augmented(n.op, current, rhs));
            }
            else if (auto* sub = std::get_if<subscript_expr>(&target.node)) {
                if (std::holds_alternative<slice_expr>(sub->index->node)) {
                    detail::raise("TypeError", "slice assignment is not supported");
                }
                value obj = eval(*sub->object, sc);
                value key = eval(*sub->index, sc);
                value current = getitem(obj, key);
                value rhs = eval(*n.value_expr, sc);
                setitem(obj, key, augmented(n.op, current, rhs));
            }
            else if (auto* attr = std::get_if<attribute_expr>(&target.node)) {
                value obj = eval(*attr->object, sc);
                value current = getattr(obj, attr->attr);
                value rhs = eval(*n.value_expr, sc);
                setattr(obj, attr->attr, augmented(n.op, current, rhs));
            }
            else {
                detail::raise("TypeError", "illegal expression for augmented assignment");
            }
            return flow::normal;
        }

        // lists extend in place under +=, so aliases observe the change
        value augmented(binary_op op, const value& current, const value& rhs) {
            if (op == binary_op::add) {
                if (auto* l = current.get_if<std::shared_ptr<list_object>>()) {
                    auto more = iterate(rhs);
                    if ((*l)->items.size() + more.size() > limits_.max_sequence_length) {
                        detail::raise("RuntimeError", "list too large");
                    }
                    (*l)->items.insert((*l)->items.end(), more.begin(), more.end());
                    return current;
                }
            }
            return binary(op, current, rhs, limits_);
        }

        flow exec_node(const if_stmt& n, const scope_ptr& sc) {
            for (const auto& [condition, body] : n.branches) {
                if (keel::script::truthy(eval(*condition, sc))) {
                    return exec_block(body, sc);
                }
            }
            return exec_block(n.orelse, sc);
        }

        flow exec_node(const while_stmt& n, const scope_ptr& sc) {
            while (true) {
                check_budget();
                if (!keel::script::truthy(eval(*n.condition, sc))) {
                    break;
                }
                auto f = exec_block(n.body, sc);
                if (f == flow::brk) {
                    return flow::normal;
                }
                if (f == flow::ret) {
                    return f;
                }
            }
            return exec_block(n.orelse, sc);
        }

        flow exec_node(const for_stmt& n, const scope_ptr& sc) {
            bool broke = false;
            flow result = flow::normal;
            for_each_item(eval(*n.iter, sc), [&](value item) {
                assign_to(*n.target, item, sc);
                auto f = exec_block(n.body, sc);
                if (f == flow::brk) {
                    broke = true;
                    return false;
                }
                if (f == flow::ret) {
                    result = f;
                    return false;
                }
                return true;
            });
            if (result == flow::ret) {
                return result;
            }
            if (!broke) {
                return exec_block(n.orelse, sc);
            }
            return flow::normal;
        }

        flow exec_node(const def_stmt& n, const scope_ptr& sc) {
            auto fn = std::make_shared<function_object>();
            fn->name = n.name;
            fn->def = &n;
            fn->closure = sc;
            fn->anchor = prog_;
            for (const auto& p : n.params) {
                fn->defaults.push_back(p.default_value ? std::optional<value>{eval(*p.default_value, sc)} : std::nullopt);
            }
            closures_.try_emplace(sc.get(), sc);
            sc->vars.insert_or_assign(n.name, value{std::move(fn)});
            return flow::normal;
        }

        flow exec_node(const return_stmt& n, const scope_ptr& sc) {
            returning_ = n.value_expr ? eval(*n.value_expr, sc) : value{};
            return flow::ret;
        }

        flow exec_node(const pass_stmt&, const scope_ptr&) { return flow::normal; }
        flow exec_node(const break_stmt&, const scope_ptr&) { return flow::brk; }
        flow exec_node(const continue_stmt&, const scope_ptr&) { return flow::cont; }

        flow exec_node(const try_stmt& n, const scope_ptr& sc) {
            flow f = flow::normal;
            std::optional<script_error> pending{};
            try {
                f = exec_protected(n, sc);
            } catch (const script_error& e) {
                pending = e;
            }
            if (!n.finalbody.empty()) {
                auto saved = std::move(returning_);
                returning_.reset();
                // a return, break or continue inside finally discards the pending exception
                if (auto ff = exec_block(n.finalbody, sc); ff != flow::normal) {
                    return ff;
                }
                returning_ = std::move(saved);
            }
            if (pending) {
                throw *pending;
            }
            return f;
        }

        flow exec_protected(const try_stmt& n, const scope_ptr& sc) {
            std::optional<script_error> caught{};
            try {
                if (auto f = exec_block(n.body, sc); f != flow::normal) {
                    return f;
                }
            } catch (const script_error& e) {
                caught = e;
            }
            if (!caught) {
                return exec_block(n.orelse, sc);
            }

            for (const auto& handler : n.handlers) {
                bool matches = !handler.type || exception_matches(*caught->exception(), eval(*handler.type, sc));
                if (!matches) {
                    continue;
                }
                if (handler.name) {
                    sc->vars.insert_or_assign(*handler.name, value{caught->exception()});
                }
                detail::stack_guard<script_error> guard{handling_, *caught};
                return exec_block(handler.body, sc);
            }
            throw *caught;
        }

        flow exec_node(const raise_stmt& n, const scope_ptr& sc) {
            if (!n.exc) {
                if (handling_.empty()) {
                    detail::raise("RuntimeError", "No active exception to reraise");
                }
                throw handling_.back();
            }
            value v = eval(*n.exc, sc);
            if (auto* e = v.get_if<std::shared_ptr<exception_object>>()) {
                throw script_error{*e};
            }
            if (auto* t = v.get_if<exception_type>()) {
                throw script_error{t->name, ""};
            }
            detail::raise("TypeError", "exceptions must derive from BaseException");
        }

        flow exec_node(const assert_stmt& n, const scope_ptr& sc) {
            if (!keel::script::truthy(eval(*n.condition, sc))) {
                std::string message = n.message ? keel::script::str(eval(*n.message, sc)) : std::string{};
                detail::raise("AssertionError", std::move(message));
            }
            return flow::normal;
        }

        // ── assignment targets ──────────────────────────────────────

        void assign_to(const expr& target, const value& v, const scope_ptr& sc) {
            if (auto* name = std::get_if<name_expr>(&target.node)) {
                sc->vars.insert_or_assign(name->id, v);
                return;
            }
            const std::vector<expr_ptr>* elements = nullptr;
            if (auto* t = std::get_if<tuple_expr>(&target.node)) {
                elements = &t->items;
            }
            else if (auto* l = std::get_if<list_expr>(&target.node)) {
                elements = &l->items;
            }
            if (elements) {
                auto items = iterate(v);
                if (items.size() < elements->size()) {
                    detail::raise(
                            "ValueError",
                            "not enough values to unpack (expected {}, got {})"_format(elements->size(), items.size()));
                }
                if (items.size() > elements->size()) {
                    detail::raise("ValueError", "too many values to unpack (expected {})"_format(elements->size()));
                }
                for (std::size_t i = 0; i < items.size(); ++i) {
                    assign_to(*(*elements)[i], items[i], sc);
                }
                return;
            }
            if (auto* sub = std::get_if<subscript_expr>(&target.node)) {
                if (std::holds_alternative<slice_expr>(sub->index->node)) {
                    detail::raise("TypeError", "slice assignment is not supported");
                }
                value obj = eval(*sub->object, sc);
                setitem(obj, eval(*sub->index, sc), v);
                return;
            }
            if (auto* attr = std::get_if<attribute_expr>(&target.node)) {
                setattr(eval(*attr->object, sc), attr->attr, v);
                return;
            }
            detail::raise("TypeError", "cannot assign to expression");
        }

        // ── expressions ─────────────────────────────────────────────

        value eval(const expr& e, const scope_ptr& sc) {
            return std::visit([&](const auto& node) { return eval_node(node, sc); }, e.node);
        }

        value eval_node(const literal_expr& n, const scope_ptr&) { return n.constant; }

        value eval_node(const name_expr& n, const scope_ptr& sc) { return lookup(n.id, sc); }

        value eval_node(const fstring_expr& n, const scope_ptr& sc) {
            std::string out{};
            for (const auto& part : n.parts) {
                out += part.literal;
                if (!part.field) {
                    continue;
                }
                value v = eval(*part.field, sc);
                if (part.conversion == 'r') {
                    v = value{keel::script::repr(v)};
                }
                else if (part.conversion == 's') {
                    v = value{keel::script::str(v)};
                }
                out += format_value(v, part.spec, limits_.max_sequence_length);
                if (out.size() > limits_.max_sequence_length) {
                    detail::raise("RuntimeError", "result too large");
                }
            }
            return value{std::move(out)};
        }

        value eval_node(const list_expr& n, const scope_ptr& sc) {
            auto out = std::make_shared<list_object>();
            out->items.reserve(n.items.size());
            for (const auto& item : n.items) {
                out->items.push_back(eval(*item, sc));
            }
            return value{std::move(out)};
        }

        value eval_node(const tuple_expr& n, const scope_ptr& sc) {
            auto out = std::make_shared<tuple_object>();
            out->items.reserve(n.items.size());
            for (const auto& item : n.items) {
                out->items.push_back(eval(*item, sc));
            }
            return value{std::move(out)};
        }

        value eval_node(const dict_expr& n, const scope_ptr& sc) {
            auto out = std::make_shared<dict_object>();
            for (const auto& [k, v] : n.entries) {
                value key = eval(*k, sc);
                out->set(key, eval(*v, sc));
            }
            return value{std::move(out)};
        }

        value eval_node(const comprehension_expr& n, const scope_ptr& sc) {
            auto inner = std::make_shared<scope>();
            inner->parent = sc;
            if (n.kind == comp_kind::dict) {
                auto out = std::make_shared<dict_object>();
                comprehend(n, 0, inner, [&] {
                    value key = eval(*n.element, inner);
                    out->set(key, eval(*n.element_value, inner));
                });
                return value{std::move(out)};
            }
            auto out = std::make_shared<list_object>();
            comprehend(n, 0, inner, [&] {
                if (out->items.size() >= limits_.max_sequence_length) {
                    detail::raise("RuntimeError", "list too large");
                }
                out->items.push_back(eval(*n.element, inner));
            });
            return value{std::move(out)};
        }

        template <typename Emit>
        void comprehend(const comprehension_expr& n, std::size_t level, const scope_ptr& sc, Emit&& emit) {
            if (level == n.clauses.size()) {
                emit();
                return;
            }
            const auto& clause = n.clauses[level];
            for_each_item(eval(*clause.iter, sc), [&](value item) {
                assign_to(*clause.target, item, sc);
                for (const auto& condition : clause.conditions) {
                    if (!keel::script::truthy(eval(*condition, sc))) {
                        return true;
                    }
                }
                comprehend(n, level + 1, sc, emit);
                return true;
            });
        }

        value eval_node(const unary_expr& n, const scope_ptr& sc) {
            value v = eval(*n.operand, sc);
            if (n.op == unary_op::logical_not) {
                return value{!keel::script::truthy(v)};
            }
            if (auto* d = v.get_if<double>()) {
                return value{n.op == unary_op::neg ? -*d : *d};
            }
            std::optional<std::int64_t> i{};
            if (auto* b = v.get_if<bool>()) {
                i = *b ? 1 : 0;
            }
            else if (auto* p = v.get_if<std::int64_t>()) {
                i = *p;
            }
            if (!i) {
                detail::raise(
                        "TypeError",
                        "bad operand type for unary {}: '{}'"_format(
                                n.op == unary_op::neg ? '-' : '+', keel::script::type_name(v)));
            }
            if (n.op == unary_op::pos) {
                return value{*i};
            }
            if (*i == std::numeric_limits<std::int64_t>::min()) {
                detail::raise("RuntimeError", "integer overflow");
            }
            return value{-*i};
        }

        value eval_node(const binary_expr& n, const scope_ptr& sc) {
            value lhs = eval(*n.lhs, sc);
            value rhs = eval(*n.rhs, sc);
            return binary(n.op, lhs, rhs, limits_);
        }

        value eval_node(const bool_expr& n, const scope_ptr& sc) {
            value lhs = eval(*n.lhs, sc);
            bool t = keel::script::truthy(lhs);
            if (n.is_and ? !t : t) {
                return lhs;
            }
            return eval(*n.rhs, sc);
        }

        value eval_node(const compare_expr& n, const scope_ptr& sc) {
            value left = eval(*n.first, sc);
            for (const auto& [op, operand] : n.rest) {
                value right = eval(*operand, sc);
                if (!compare(op, left, right)) {
                    return value{false};
                }
                left = std::move(right);
            }
            return value{true};
        }

        value eval_node(const conditional_expr& n, const scope_ptr& sc) {
            return keel::script::truthy(eval(*n.condition, sc)) ? eval(*n.then, sc) : eval(*n.otherwise, sc);
        }

        value eval_node(const call_expr& n, const scope_ptr& sc) {
            value callee = eval(*n.callee, sc);
            std::vector<value> args{};
            args.reserve(n.args.size());
            for (const auto& a : n.args) {
                args.push_back(eval(*a, sc));
            }
            std::vector<std::pair<std::string, value>> kwargs{};
            for (const auto& [name, a] : n.kwargs) {
                kwargs.emplace_back(name, eval(*a, sc));
            }
            return call_value(callee, std::move(args), std::move(kwargs));
        }

        value eval_node(const slice_expr&, const scope_ptr&) {
            detail::raise("TypeError", "slices are only valid inside subscripts");
        }

        value eval_node(const subscript_expr& n, const scope_ptr& sc) {
            value obj = eval(*n.object, sc);
            if (auto* s = std::get_if<slice_expr>(&n.index->node)) {
                value lower = s->lower ? eval(*s->lower, sc) : value{};
                value upper = s->upper ? eval(*s->upper, sc) : value{};
                value step = s->step ? eval(*s->step, sc) : value{};
                return getslice(obj, lower, upper, step);
            }
            return getitem(obj, eval(*n.index, sc));
        }

        value eval_node(const attribute_expr& n, const scope_ptr& sc) {
            return getattr(eval(*n.object, sc), n.attr);
        }

        // ── calls ───────────────────────────────────────────────────

        value call_value(
                const value& fn, std::vector<value> args, std::vector<std::pair<std::string, value>> kwargs) {
            check_budget();
            if (auto* user = fn.get_if<std::shared_ptr<function_object>>()) {
                return call_user(**user, std::move(args), std::move(kwargs));
            }
            if (auto* t = fn.get_if<exception_type>()) {
                if (!kwargs.empty()) {
                    detail::raise("TypeError", "{}() takes no keyword arguments"_format(t->name));
                }
                return keel::script::make_exception(t->name, args.empty() ? std::string{} : keel::script::str(args[0]));
            }

            auto* native = fn.get_if<std::shared_ptr<builtin_function>>();
            auto* method = fn.get_if<std::shared_ptr<bound_method>>();
            if (!native && !method) {
                detail::raise("TypeError", "'{}' object is not callable"_format(keel::script::type_name(fn)));
            }

            keel::script::native_args na{std::move(args), std::move(kwargs), limits_.deadline, limits_.stop};
            try {
                if (native) {
                    return (*native)->fn(na);
                }
                return call_method(*this, (*method)->self, (*method)->name, na);
            } catch (const script_error&) {
                throw;
            } catch (const std::exception& e) {
                throw script_error{"RuntimeError", e.what()};
            }
        }

        value call_user(
                const function_object& fn,
                std::vector<value> args,
                std::vector<std::pair<std::string, value>> kwargs) {
            if (depth_ >= limits_.max_call_depth) {
                detail::raise("RuntimeError", "maximum recursion depth exceeded");
            }
            const auto& params = fn.def->params;
            if (args.size() > params.size()) {
                detail::raise(
                        "TypeError",
                        "{}() takes {} positional arguments but {} were given"_format(
                                fn.name, params.size(), args.size()));
            }

            auto local = std::make_shared<scope>();
            local->parent = fn.closure;
            std::vector<bool> bound(params.size(), false);
            for (std::size_t i = 0; i < args.size(); ++i) {
                local->vars.insert_or_assign(params[i].name, std::move(args[i]));
                bound[i] = true;
            }
            for (auto& [name, v] : kwargs) {
                auto it = std::ranges::find(params, name, &param::name);
                if (it == params.end()) {
                    detail::raise("TypeError", "{}() got an unexpected keyword argument '{}'"_format(fn.name, name));
                }
                auto i = static_cast<std::size_t>(it - params.begin());
                if (bound[i]) {
                    detail::raise("TypeError", "{}() got multiple values for argument '{}'"_format(fn.name, name));
                }
                local->vars.insert_or_assign(name, std::move(v));
                bound[i] = true;
            }
            for (std::size_t i = 0; i < params.size(); ++i) {
                if (bound[i]) {
                    continue;
                }
                if (!fn.defaults[i]) {
                    detail::raise(
                            "TypeError",
                            "{}() missing required positional argument: '{}'"_format(fn.name, params[i].name));
                }
                local->vars.insert_or_assign(params[i].name, *fn.defaults[i]);
            }

            detail::depth_guard guard{depth_};
            exec_block(fn.def->body, local);
            value out = returning_ ? std::move(*returning_) : value{};
            returning_.reset();
            return out;
        }
    };

}  // namespace keel::internal::script

namespace keel::script {

    run_outcome run(std::shared_ptr<const program> prog, std::map<std::string, value> globals, const run_limits& limits) {
        internal::script::evaluator ev{std::move(prog), limits};
        return ev.run(std::move(globals));
    }

}  // namespace keel::script
