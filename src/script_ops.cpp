#include "internal/script_runtime.hpp"

#include "keel/format.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

using namespace keel::literals;

namespace keel::internal::script {

    using keel::script::dict_object;
    using keel::script::exception_object;
    using keel::script::list_object;
    using keel::script::module_object;
    using keel::script::range_t;
    using keel::script::tuple_object;

    namespace detail {

        // upper bound on anything a single operation materializes
        inline constexpr std::size_t max_materialize = 10'000'000;

        using int_limits = std::numeric_limits<std::int64_t>;

        [[noreturn]] static void raise(std::string kind, std::string message) {
            throw script_error{std::move(kind), std::move(message)};
        }

        static std::optional<std::int64_t> as_int(const value& v) {
            if (auto* b = v.get_if<bool>()) {
                return *b ? 1 : 0;
            }
            if (auto* i = v.get_if<std::int64_t>()) {
                return *i;
            }
            return std::nullopt;
        }

        static std::optional<double> as_float(const value& v) {
            if (auto i = as_int(v)) {
                return static_cast<double>(*i);
            }
            if (auto* d = v.get_if<double>()) {
                return *d;
            }
            return std::nullopt;
        }

        static std::int64_t checked_add(std::int64_t a, std::int64_t b) {
            if ((b > 0 && a > int_limits::max() - b) || (b < 0 && a < int_limits::min() - b)) {
                raise("RuntimeError", "integer overflow");
            }
            return a + b;
        }

        static std::int64_t checked_sub(std::int64_t a, std::int64_t b) {
            if ((b < 0 && a > int_limits::max() + b) || (b > 0 && a < int_limits::min() + b)) {
                raise("RuntimeError", "integer overflow");
            }
            return a - b;
        }

        static std::int64_t checked_mul(std::int64_t a, std::int64_t b) {
            if (a == 0 || b == 0) {
                return 0;
            }
            bool overflow = a > 0 ? (b > 0 ? a > int_limits::max() / b : b < int_limits::min() / a)
                                  : (b > 0 ? a < int_limits::min() / b : b < int_limits::max() / a);
            if (overflow) {
                raise("RuntimeError", "integer overflow");
            }
            return a * b;
        }

        static std::int64_t floor_div(std::int64_t a, std::int64_t b) {
            if (a == int_limits::min() && b == -1) {
                raise("RuntimeError", "integer overflow");
            }
            std::int64_t q = a / b;
            if ((a % b != 0) && ((a < 0) != (b < 0))) {
                --q;
            }
            return q;
        }

        static std::int64_t floor_mod(std::int64_t a, std::int64_t b) {
            if (b == -1) {
                return 0;
            }
            std::int64_t r = a % b;
            if (r != 0 && ((r < 0) != (b < 0))) {
                r += b;
            }
            return r;
        }

        static std::int64_t int_pow(std::int64_t base, std::int64_t exp) {
            std::int64_t out = 1;
            while (exp > 0) {
                if (exp & 1) {
                    out = checked_mul(out, base);
                }
                exp >>= 1;
                if (exp > 0) {
                    base = checked_mul(base, base);
                }
            }
            return out;
        }

        static std::string_view op_symbol(binary_op op) {
            switch (op) {
                case binary_op::add:
                    return "+";
                case binary_op::sub:
                    return "-";
                case binary_op::mul:
                    return "*";
                case binary_op::div:
                    return "/";
                case binary_op::floordiv:
                    return "//";
                case binary_op::mod:
                    return "%";
                case binary_op::pow:
                    return "**";
            }
            return "?";
        }

        [[noreturn]] static void unsupported(binary_op op, const value& lhs, const value& rhs) {
            raise("TypeError",
                  "unsupported operand type(s) for {}: '{}' and '{}'"_format(
                          op_symbol(op), keel::script::type_name(lhs), keel::script::type_name(rhs)));
        }

        static std::size_t checked_repeat_size(std::size_t unit, std::int64_t count, const run_limits& limits) {
            if (count <= 0 || unit == 0) {
                return 0;
            }
            if (static_cast<std::uint64_t>(count) > limits.max_sequence_length / unit) {
                raise("RuntimeError", "result too large");
            }
            return unit * static_cast<std::size_t>(count);
        }

        template <typename Seq>
        value repeat_sequence(const std::vector<value>& items, std::int64_t count, const run_limits& limits) {
            std::size_t total = checked_repeat_size(items.size(), count, limits);
            auto out = std::make_shared<Seq>();
            out->items.reserve(total);
            for (std::int64_t i = 0; i < count && total > 0; ++i) {
                out->items.insert(out->items.end(), items.begin(), items.end());
            }
            return value{std::move(out)};
        }

        static value float_result(binary_op op, double a, double b) {
            switch (op) {
                case binary_op::add:
                    return value{a + b};
                case binary_op::sub:
                    return value{a - b};
                case binary_op::mul:
                    return value{a * b};
                case binary_op::div:
                    if (b == 0.0) {
                        raise("ZeroDivisionError", "float division by zero");
                    }
                    return value{a / b};
                case binary_op::floordiv:
                    if (b == 0.0) {
                        raise("ZeroDivisionError", "float floor division by zero");
                    }
                    return value{std::floor(a / b)};
                case binary_op::mod: {
                    if (b == 0.0) {
                        raise("ZeroDivisionError", "float modulo");
                    }
                    double r = std::fmod(a, b);
                    if (r != 0.0 && ((r < 0) != (b < 0))) {
                        r += b;
                    }
                    return value{r};
                }
                case binary_op::pow:
                    if (a == 0.0 && b < 0) {
                        raise("ZeroDivisionError", "0.0 cannot be raised to a negative power");
                    }
                    return value{std::pow(a, b)};
            }
            return value{};
        }

        static value int_result(binary_op op, std::int64_t a, std::int64_t b) {
            switch (op) {
                case binary_op::add:
                    return value{checked_add(a, b)};
                case binary_op::sub:
                    return value{checked_sub(a, b)};
                case binary_op::mul:
                    return value{checked_mul(a, b)};
                case binary_op::div:
                    if (b == 0) {
                        raise("ZeroDivisionError", "division by zero");
                    }
                    return value{static_cast<double>(a) / static_cast<double>(b)};
                case binary_op::floordiv:
                    if (b == 0) {
                        raise("ZeroDivisionError", "integer division or modulo by zero");
                    }
                    return value{floor_div(a, b)};
                case binary_op::mod:
                    if (b == 0) {
                        raise("ZeroDivisionError", "integer division or modulo by zero");
                    }
                    return value{floor_mod(a, b)};
                case binary_op::pow:
                    if (b < 0) {
                        if (a == 0) {
                            raise("ZeroDivisionError", "0 cannot be raised to a negative power");
                        }
                        return value{std::pow(static_cast<double>(a), static_cast<double>(b))};
                    }
                    return value{int_pow(a, b)};
            }
            return value{};
        }

        static std::int64_t normalize_index(std::int64_t i, std::int64_t size, std::string_view what) {
            if (i < 0) {
                i += size;
            }
            if (i < 0 || i >= size) {
                raise("IndexError", "{} index out of range"_format(what));
            }
            return i;
        }

        static std::vector<std::int64_t> slice_indices(
                std::int64_t size, const value& lower, const value& upper, const value& step_v) {
            std::int64_t step = step_v.is_none() ? 1 : to_index(step_v, "slice");
            if (step == 0) {
                raise("ValueError", "slice step cannot be zero");
            }
            auto clamp = [&](const value& v, std::int64_t def) -> std::int64_t {
                if (v.is_none()) {
                    return def;
                }
                std::int64_t i = to_index(v, "slice");
                if (i < 0) {
                    i += size;
                    if (i < 0) {
                        i = step < 0 ? -1 : 0;
                    }
                }
                else if (i >= size) {
                    i = step < 0 ? size - 1 : size;
                }
                return i;
            };
            std::int64_t start = clamp(lower, step < 0 ? size - 1 : 0);
            std::int64_t stop = clamp(upper, step < 0 ? -1 : size);

            std::vector<std::int64_t> out{};
            if (step > 0) {
                for (std::int64_t i = start; i < stop; i += step) {
                    out.push_back(i);
                }
            }
            else {
                for (std::int64_t i = start; i > stop; i += step) {
                    out.push_back(i);
                }
            }
            return out;
        }

        static std::string group_thousands(std::string digits, char sep) {
            std::size_t start = (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) ? 1 : 0;
            std::size_t end = digits.find('.');
            if (end == std::string::npos) {
                end = digits.size();
            }
            for (std::ptrdiff_t i = static_cast<std::ptrdiff_t>(end) - 3; i > static_cast<std::ptrdiff_t>(start);
                 i -= 3) {
                digits.insert(static_cast<std::size_t>(i), 1, sep);
            }
            return digits;
        }

    }  // namespace detail

    // ── utf-8 ───────────────────────────────────────────────────────

    bool is_ascii(std::string_view s) {
        return std::ranges::all_of(s, [](char c) { return static_cast<unsigned char>(c) < 0x80; });
    }

    std::vector<std::string> utf8_chars(std::string_view s) {
        std::vector<std::string> out{};
        out.reserve(s.size());
        for (std::size_t i = 0; i < s.size();) {
            auto lead = static_cast<unsigned char>(s[i]);
            std::size_t n = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3 : (lead >> 3) == 0x1E ? 4 : 1;
            n = std::min(n, s.size() - i);
            out.emplace_back(s.substr(i, n));
            i += n;
        }
        return out;
    }

    // ── arithmetic ──────────────────────────────────────────────────

    value binary(binary_op op, const value& lhs, const value& rhs, const run_limits& limits) {
        auto li = detail::as_int(lhs);
        auto ri = detail::as_int(rhs);
        if (li && ri) {
            return detail::int_result(op, *li, *ri);
        }
        auto lf = detail::as_float(lhs);
        auto rf = detail::as_float(rhs);
        if (lf && rf) {
            return detail::float_result(op, *lf, *rf);
        }

        if (op == binary_op::add) {
            if (auto* a = lhs.get_if<std::string>()) {
                if (auto* b = rhs.get_if<std::string>()) {
                    if (a->size() + b->size() > limits.max_sequence_length) {
                        detail::raise("RuntimeError", "result too large");
                    }
                    return value{*a + *b};
                }
            }
            if (auto* a = lhs.get_if<std::shared_ptr<list_object>>()) {
                if (auto* b = rhs.get_if<std::shared_ptr<list_object>>()) {
                    auto out = std::make_shared<list_object>((*a)->items);
                    out->items.insert(out->items.end(), (*b)->items.begin(), (*b)->items.end());
                    return value{std::move(out)};
                }
            }
            if (auto* a = lhs.get_if<std::shared_ptr<tuple_object>>()) {
                if (auto* b = rhs.get_if<std::shared_ptr<tuple_object>>()) {
                    auto out = std::make_shared<tuple_object>((*a)->items);
                    out->items.insert(out->items.end(), (*b)->items.begin(), (*b)->items.end());
                    return value{std::move(out)};
                }
            }
        }

        if (op == binary_op::mul) {
            const value* seq = ri ? &lhs : (li ? &rhs : nullptr);
            std::optional<std::int64_t> count = ri ? ri : li;
            if (seq && count) {
                if (auto* s = seq->get_if<std::string>()) {
                    std::size_t total = detail::checked_repeat_size(s->size(), *count, limits);
                    std::string out{};
                    out.reserve(total);
                    for (std::int64_t i = 0; i < *count && total > 0; ++i) {
                        out += *s;
                    }
                    return value{std::move(out)};
                }
                if (auto* l = seq->get_if<std::shared_ptr<list_object>>()) {
                    return detail::repeat_sequence<list_object>((*l)->items, *count, limits);
                }
                if (auto* t = seq->get_if<std::shared_ptr<tuple_object>>()) {
                    return detail::repeat_sequence<tuple_object>((*t)->items, *count, limits);
                }
            }
        }

        detail::unsupported(op, lhs, rhs);
    }

    // ── comparison ──────────────────────────────────────────────────

    namespace detail {
        static bool sequence_less(const std::vector<value>& a, const std::vector<value>& b) {
            std::size_t n = std::min(a.size(), b.size());
            for (std::size_t i = 0; i < n; ++i) {
                if (!keel::script::equals(a[i], b[i])) {
                    return less_than(a[i], b[i]);
                }
            }
            return a.size() < b.size();
        }

        static bool identical(const value& lhs, const value& rhs) {
            if (lhs.data.index() != rhs.data.index()) {
                return false;
            }
            return std::visit(
                    [&rhs](const auto& x) -> bool {
                        using T = std::decay_t<decltype(x)>;
                        const auto& y = std::get<T>(rhs.data);
                        if constexpr (std::is_same_v<T, range_t>) {
                            return x.start == y.start && x.stop == y.stop && x.step == y.step;
                        }
                        else if constexpr (std::is_same_v<T, keel::script::exception_type>) {
                            return x.name == y.name;
                        }
                        else {
                            return x == y;
                        }
                    },
                    lhs.data);
        }
    }  // namespace detail

    bool less_than(const value& lhs, const value& rhs) {
        auto lf = detail::as_float(lhs);
        auto rf = detail::as_float(rhs);
        if (lf && rf) {
            auto li = detail::as_int(lhs);
            auto ri = detail::as_int(rhs);
            if (li && ri) {
                return *li < *ri;
            }
            return *lf < *rf;
        }
        if (auto* a = lhs.get_if<std::string>()) {
            if (auto* b = rhs.get_if<std::string>()) {
                return *a < *b;
            }
        }
        if (auto* a = lhs.get_if<std::shared_ptr<list_object>>()) {
            if (auto* b = rhs.get_if<std::shared_ptr<list_object>>()) {
                return detail::sequence_less((*a)->items, (*b)->items);
            }
        }
        if (auto* a = lhs.get_if<std::shared_ptr<tuple_object>>()) {
            if (auto* b = rhs.get_if<std::shared_ptr<tuple_object>>()) {
                return detail::sequence_less((*a)->items, (*b)->items);
            }
        }
        detail::raise(
                "TypeError",
                "'<' not supported between instances of '{}' and '{}'"_format(
                        keel::script::type_name(lhs), keel::script::type_name(rhs)));
    }

    bool compare(compare_op op, const value& lhs, const value& rhs) {
        switch (op) {
            case compare_op::eq:
                return keel::script::equals(lhs, rhs);
            case compare_op::ne:
                return !keel::script::equals(lhs, rhs);
            case compare_op::lt:
                return less_than(lhs, rhs);
            case compare_op::gt:
                return less_than(rhs, lhs);
            case compare_op::le:
                return !less_than(rhs, lhs);
            case compare_op::ge:
                return !less_than(lhs, rhs);
            case compare_op::in:
                return contains(rhs, lhs);
            case compare_op::not_in:
                return !contains(rhs, lhs);
            case compare_op::is:
                return detail::identical(lhs, rhs);
            case compare_op::is_not:
                return !detail::identical(lhs, rhs);
        }
        return false;
    }

    // ── containers ──────────────────────────────────────────────────

    std::int64_t to_index(const value& v, std::string_view what) {
        if (auto i = detail::as_int(v)) {
            return *i;
        }
        detail::raise("TypeError", "{} indices must be integers, not {}"_format(what, keel::script::type_name(v)));
    }

    std::int64_t length(const value& v) {
        if (auto* s = v.get_if<std::string>()) {
            return is_ascii(*s) ? static_cast<std::int64_t>(s->size())
                                : static_cast<std::int64_t>(utf8_chars(*s).size());
        }
        if (auto* l = v.get_if<std::shared_ptr<list_object>>()) {
            return static_cast<std::int64_t>((*l)->items.size());
        }
        if (auto* t = v.get_if<std::shared_ptr<tuple_object>>()) {
            return static_cast<std::int64_t>((*t)->items.size());
        }
        if (auto* d = v.get_if<std::shared_ptr<dict_object>>()) {
            return static_cast<std::int64_t>((*d)->size());
        }
        if (auto* r = v.get_if<range_t>()) {
            return r->size();
        }
        detail::raise("TypeError", "object of type '{}' has no len()"_format(keel::script::type_name(v)));
    }

    bool contains(const value& container, const value& item) {
        if (auto* s = container.get_if<std::string>()) {
            auto* needle = item.get_if<std::string>();
            if (!needle) {
                detail::raise(
                        "TypeError",
                        "'in <string>' requires string as left operand, not {}"_format(keel::script::type_name(item)));
            }
            return s->find(*needle) != std::string::npos;
        }
        if (auto* l = container.get_if<std::shared_ptr<list_object>>()) {
            return std::ranges::any_of((*l)->items, [&](const value& v) { return keel::script::equals(v, item); });
        }
        if (auto* t = container.get_if<std::shared_ptr<tuple_object>>()) {
            return std::ranges::any_of((*t)->items, [&](const value& v) { return keel::script::equals(v, item); });
        }
        if (auto* d = container.get_if<std::shared_ptr<dict_object>>()) {
            return (*d)->find(item) != nullptr;
        }
        if (auto* r = container.get_if<range_t>()) {
            auto i = detail::as_int(item);
            if (!i) {
                return false;
            }
            if (r->step > 0 ? (*i < r->start || *i >= r->stop) : (*i > r->start || *i <= r->stop)) {
                return false;
            }
            return (*i - r->start) % r->step == 0;
        }
        detail::raise(
                "TypeError", "argument of type '{}' is not iterable"_format(keel::script::type_name(container)));
    }

    std::vector<value> iterate(const value& v) {
        if (auto* l = v.get_if<std::shared_ptr<list_object>>()) {
            return (*l)->items;
        }
        if (auto* t = v.get_if<std::shared_ptr<tuple_object>>()) {
            return (*t)->items;
        }
        if (auto* s = v.get_if<std::string>()) {
            std::vector<value> out{};
            for (auto& ch : utf8_chars(*s)) {
                out.emplace_back(std::move(ch));
            }
            return out;
        }
        if (auto* d = v.get_if<std::shared_ptr<dict_object>>()) {
            std::vector<value> out{};
            out.reserve((*d)->size());
            for (const auto& [k, _] : (*d)->entries) {
                out.push_back(k);
            }
            return out;
        }
        if (auto* r = v.get_if<range_t>()) {
            auto n = r->size();
            if (static_cast<std::uint64_t>(n) > detail::max_materialize) {
                detail::raise("RuntimeError", "range too large to materialize");
            }
            std::vector<value> out{};
            out.reserve(static_cast<std::size_t>(n));
            for (std::int64_t i = 0; i < n; ++i) {
                out.emplace_back(r->at(i));
            }
            return out;
        }
        detail::raise("TypeError", "'{}' object is not iterable"_format(keel::script::type_name(v)));
    }

    value getitem(const value& obj, const value& key) {
        if (auto* l = obj.get_if<std::shared_ptr<list_object>>()) {
            auto& items = (*l)->items;
            auto i = detail::normalize_index(to_index(key, "list"), static_cast<std::int64_t>(items.size()), "list");
            return items[static_cast<std::size_t>(i)];
        }
        if (auto* t = obj.get_if<std::shared_ptr<tuple_object>>()) {
            auto& items = (*t)->items;
            auto i = detail::normalize_index(to_index(key, "tuple"), static_cast<std::int64_t>(items.size()), "tuple");
            return items[static_cast<std::size_t>(i)];
        }
        if (auto* s = obj.get_if<std::string>()) {
            auto idx = to_index(key, "string");
            if (is_ascii(*s)) {
                auto i = detail::normalize_index(idx, static_cast<std::int64_t>(s->size()), "string");
                return value{std::string(1, (*s)[static_cast<std::size_t>(i)])};
            }
            auto chars = utf8_chars(*s);
            auto i = detail::normalize_index(idx, static_cast<std::int64_t>(chars.size()), "string");
            return value{std::move(chars[static_cast<std::size_t>(i)])};
        }
        if (auto* d = obj.get_if<std::shared_ptr<dict_object>>()) {
            if (auto* v = (*d)->find(key)) {
                return *v;
            }
            detail::raise("KeyError", keel::script::repr(key));
        }
        if (auto* r = obj.get_if<range_t>()) {
            auto i = detail::normalize_index(to_index(key, "range"), r->size(), "range object");
            return value{r->at(i)};
        }
        detail::raise("TypeError", "'{}' object is not subscriptable"_format(keel::script::type_name(obj)));
    }

    value getslice(const value& obj, const value& lower, const value& upper, const value& step) {
        if (auto* l = obj.get_if<std::shared_ptr<list_object>>()) {
            auto& items = (*l)->items;
            auto out = std::make_shared<list_object>();
            for (auto i : detail::slice_indices(static_cast<std::int64_t>(items.size()), lower, upper, step)) {
                out->items.push_back(items[static_cast<std::size_t>(i)]);
            }
            return value{std::move(out)};
        }
        if (auto* t = obj.get_if<std::shared_ptr<tuple_object>>()) {
            auto& items = (*t)->items;
            auto out = std::make_shared<tuple_object>();
            for (auto i : detail::slice_indices(static_cast<std::int64_t>(items.size()), lower, upper, step)) {
                out->items.push_back(items[static_cast<std::size_t>(i)]);
            }
            return value{std::move(out)};
        }
        if (auto* s = obj.get_if<std::string>()) {
            std::string out{};
            if (is_ascii(*s)) {
                for (auto i : detail::slice_indices(static_cast<std::int64_t>(s->size()), lower, upper, step)) {
                    out.push_back((*s)[static_cast<std::size_t>(i)]);
                }
                return value{std::move(out)};
            }
            auto chars = utf8_chars(*s);
            for (auto i : detail::slice_indices(static_cast<std::int64_t>(chars.size()), lower, upper, step)) {
                out += chars[static_cast<std::size_t>(i)];
            }
            return value{std::move(out)};
        }
        if (auto* r = obj.get_if<range_t>()) {
            auto out = std::make_shared<list_object>();
            for (auto i : detail::slice_indices(r->size(), lower, upper, step)) {
                out->items.emplace_back(r->at(i));
            }
            return value{std::move(out)};
        }
        detail::raise("TypeError", "'{}' object is not subscriptable"_format(keel::script::type_name(obj)));
    }

    void setitem(const value& obj, const value& key, value v) {
        if (auto* l = obj.get_if<std::shared_ptr<list_object>>()) {
            auto& items = (*l)->items;
            auto i = detail::normalize_index(
                    to_index(key, "list"), static_cast<std::int64_t>(items.size()), "list assignment");
            items[static_cast<std::size_t>(i)] = std::move(v);
            return;
        }
        if (auto* d = obj.get_if<std::shared_ptr<dict_object>>()) {
            (*d)->set(key, std::move(v));
            return;
        }
        detail::raise(
                "TypeError", "'{}' object does not support item assignment"_format(keel::script::type_name(obj)));
    }

    value getattr(const value& obj, const std::string& name) {
        if (auto* d = obj.get_if<std::shared_ptr<dict_object>>()) {
            if (auto* v = (*d)->find(value{name})) {
                return *v;
            }
        }
        if (auto* m = obj.get_if<std::shared_ptr<module_object>>()) {
            if (auto it = (*m)->attrs.find(name); it != (*m)->attrs.end()) {
                return it->second;
            }
            detail::raise("AttributeError", "module '{}' has no attribute '{}'"_format((*m)->name, name));
        }
        if (auto* e = obj.get_if<std::shared_ptr<exception_object>>()) {
            if (name == "args") {
                return keel::script::make_tuple({value{(*e)->message}});
            }
        }
        if (has_method(obj, name)) {
            return value{std::make_shared<keel::script::bound_method>(obj, name)};
        }
        detail::raise(
                "AttributeError", "'{}' object has no attribute '{}'"_format(keel::script::type_name(obj), name));
    }

    void setattr(const value& obj, const std::string& name, value v) {
        if (auto* d = obj.get_if<std::shared_ptr<dict_object>>()) {
            (*d)->set(value{name}, std::move(v));
            return;
        }
        detail::raise(
                "AttributeError",
                "'{}' object attribute '{}' is read-only"_format(keel::script::type_name(obj), name));
    }

    // ── formatting ──────────────────────────────────────────────────

    static constexpr std::size_t max_precision = static_cast<std::size_t>(std::numeric_limits<int>::max());

    std::string format_value(const value& v, std::string_view spec, std::size_t max_length) {
        if (spec.empty()) {
            return keel::script::str(v);
        }

        char fill = ' ';
        char align = 0;
        char sign = '-';
        bool zero_pad = false;
        std::size_t width = 0;
        char grouping = 0;
        std::optional<int> precision{};
        char type = 0;

        std::size_t i = 0;
        auto is_align = [](char c) { return c == '<' || c == '>' || c == '^' || c == '='; };
        if (spec.size() >= 2 && is_align(spec[1])) {
            fill = spec[0];
            align = spec[1];
            i = 2;
        }
        else if (is_align(spec[0])) {
            align = spec[0];
            i = 1;
        }
        if (i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' ')) {
            sign = spec[i++];
        }
        if (i < spec.size() && spec[i] == '0') {
            zero_pad = true;
            ++i;
        }
        auto too_big = []() { detail::raise("RuntimeError", "result too large"); };
        while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
            width = width * 10 + static_cast<std::size_t>(spec[i++] - '0');
            if (width > max_length) {
                too_big();
            }
        }
        if (i < spec.size() && (spec[i] == ',' || spec[i] == '_')) {
            grouping = spec[i++];
        }
        if (i < spec.size() && spec[i] == '.') {
            ++i;
            std::size_t p = 0;
            while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
                p = p * 10 + static_cast<std::size_t>(spec[i++] - '0');
                if (p > max_length || p > max_precision) {
                    too_big();
                }
            }
            precision = static_cast<int>(p);
        }
        if (i < spec.size()) {
            type = spec[i++];
        }
        if (i != spec.size()) {
            detail::raise("ValueError", "Invalid format specifier '{}'"_format(spec));
        }

        auto as_i = detail::as_int(v);
        auto as_f = detail::as_float(v);
        bool numeric = as_f.has_value() && !v.is<bool>();
        std::string body{};

        switch (type) {
            case 0:
            case 's':
                if (type == 0 && numeric && precision) {
                    body = std::format("{:.{}g}", *as_f, *precision);
                }
                else if (type == 0 && as_i && !v.is<bool>()) {
                    body = std::to_string(*as_i);
                }
                else {
                    body = keel::script::str(v);
                    if (precision && !numeric) {
                        auto chars = utf8_chars(body);
                        if (chars.size() > static_cast<std::size_t>(*precision)) {
                            chars.resize(static_cast<std::size_t>(*precision));
                            body.clear();
                            for (auto& c : chars) {
                                body += c;
                            }
                        }
                    }
                }
                break;
            case 'd':
                if (!as_i) {
                    detail::raise(
                            "ValueError",
                            "Unknown format code 'd' for object of type '{}'"_format(keel::script::type_name(v)));
                }
                body = std::to_string(*as_i);
                break;
            case 'x':
            case 'X':
            case 'o':
            case 'b':
                if (!as_i) {
                    detail::raise(
                            "ValueError",
                            "Unknown format code '{}' for object of type '{}'"_format(type, keel::script::type_name(v)));
                }
                body = type == 'x'   ? std::format("{:x}", *as_i)
                       : type == 'X' ? std::format("{:X}", *as_i)
                       : type == 'o' ? std::format("{:o}", *as_i)
                                     : std::format("{:b}", *as_i);
                break;
            case 'f':
            case 'F':
            case 'e':
            case 'E':
            case 'g':
            case 'G':
            case '%': {
                if (!as_f) {
                    detail::raise(
                            "ValueError",
                            "Unknown format code '{}' for object of type '{}'"_format(type, keel::script::type_name(v)));
                }
                int p = precision.value_or(6);
                double d = *as_f;
                switch (type) {
                    case 'e':
                        body = std::format("{:.{}e}", d, p);
                        break;
                    case 'E':
                        body = std::format("{:.{}E}", d, p);
                        break;
                    case 'g':
                        body = std::format("{:.{}g}", d, p);
                        break;
                    case 'G':
                        body = std::format("{:.{}G}", d, p);
                        break;
                    case '%':
                        body = std::format("{:.{}f}%", d * 100.0, p);
                        break;
                    default:
                        body = std::format("{:.{}f}", d, p);
                        break;
                }
                break;
            }
            default:
                detail::raise(
                        "ValueError",
                        "Unknown format code '{}' for object of type '{}'"_format(type, keel::script::type_name(v)));
        }

        if (numeric) {
            if (grouping) {
                body = detail::group_thousands(std::move(body), grouping);
            }
            if (sign != '-' && !body.starts_with('-')) {
                body.insert(body.begin(), sign);
            }
        }

        if (zero_pad && !align) {
            fill = '0';
            align = numeric ? '=' : '<';
        }
        if (!align) {
            align = numeric ? '>' : '<';
        }

        std::size_t len = is_ascii(body) ? body.size() : utf8_chars(body).size();
        if (len >= width) {
            return body;
        }
        std::size_t pad = width - len;
        switch (align) {
            case '<':
                return body + std::string(pad, fill);
            case '^':
                return std::string(pad / 2, fill) + body + std::string(pad - pad / 2, fill);
            case '=':
                if (!body.empty() && (body[0] == '-' || body[0] == '+' || body[0] == ' ')) {
                    return body.substr(0, 1) + std::string(pad, fill) + body.substr(1);
                }
                return std::string(pad, fill) + body;
            default:
                return std::string(pad, fill) + body;
        }
    }

}  // namespace keel::internal::script
