#include "internal/script_runtime.hpp"

#include "keel/format.hpp"
#include "keel/utils.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <unordered_set>

using namespace keel::literals;

namespace keel::internal::script {

    using keel::script::builtin_function;
    using keel::script::dict_object;
    using keel::script::exception_object;
    using keel::script::exception_type;
    using keel::script::list_object;
    using keel::script::module_object;
    using keel::script::range_t;
    using keel::script::tuple_object;

    namespace detail {

        [[noreturn]] static void raise(std::string kind, std::string message) {
            throw script_error{std::move(kind), std::move(message)};
        }

        static value make_fn(std::string name, keel::script::native_fn fn) {
            return value{std::make_shared<builtin_function>(std::move(name), std::move(fn))};
        }

        static void expect_args(const native_args& a, std::size_t min, std::size_t max, std::string_view fname) {
            if (a.args.size() < min || a.args.size() > max) {
                if (min == max) {
                    raise("TypeError", "{}() takes exactly {} argument(s) ({} given)"_format(fname, min, a.args.size()));
                }
                raise("TypeError",
                      "{}() takes from {} to {} arguments ({} given)"_format(fname, min, max, a.args.size()));
            }
        }

        static const std::string& expect_str(const value& v, std::string_view what) {
            if (auto* s = v.get_if<std::string>()) {
                return *s;
            }
            raise("TypeError", "{} must be str, not {}"_format(what, keel::script::type_name(v)));
        }

        static std::int64_t expect_int(const value& v, std::string_view what) {
            if (auto* b = v.get_if<bool>()) {
                return *b ? 1 : 0;
            }
            if (auto* i = v.get_if<std::int64_t>()) {
                return *i;
            }
            raise("TypeError", "{} must be int, not {}"_format(what, keel::script::type_name(v)));
        }

        static bool kw_flag(const native_args& a, std::string_view name) {
            auto* v = a.kwarg(name);
            return v && keel::script::truthy(*v);
        }

        static std::string_view trim_view(std::string_view s, std::string_view chars, bool left, bool right) {
            if (left) {
                auto p = s.find_first_not_of(chars);
                s.remove_prefix(p == std::string_view::npos ? s.size() : p);
            }
            if (right) {
                auto p = s.find_last_not_of(chars);
                s = p == std::string_view::npos ? std::string_view{} : s.substr(0, p + 1);
            }
            return s;
        }

        inline constexpr std::string_view whitespace = " \t\n\r\f\v";

        static std::int64_t parse_int_literal(const std::string& text, int base) {
            auto sv = trim_view(text, whitespace, true, true);
            std::string digits{};
            bool negative = false;
            if (!sv.empty() && (sv[0] == '+' || sv[0] == '-')) {
                negative = sv[0] == '-';
                sv.remove_prefix(1);
            }
            for (char c : sv) {
                if (c != '_') {
                    digits.push_back(c);
                }
            }
            auto parsed = utils::parse_arithmetic<std::int64_t>(digits, base);
            if (digits.empty() || !parsed) {
                raise("ValueError", "invalid literal for int() with base {}: {}"_format(base, keel::script::repr(text)));
            }
            return negative ? -*parsed : *parsed;
        }

        static double parse_float_literal(const std::string& text) {
            auto sv = trim_view(text, whitespace, true, true);
            std::string lowered{};
            for (char c : sv) {
                lowered.push_back(utils::char_tolower(c));
            }
            if (lowered == "inf" || lowered == "+inf" || lowered == "infinity") {
                return std::numeric_limits<double>::infinity();
            }
            if (lowered == "-inf" || lowered == "-infinity") {
                return -std::numeric_limits<double>::infinity();
            }
            if (lowered == "nan" || lowered == "+nan" || lowered == "-nan") {
                return std::numeric_limits<double>::quiet_NaN();
            }
            if (!sv.empty() && sv[0] == '+') {
                sv.remove_prefix(1);
            }
            auto parsed = utils::parse_arithmetic<double>(sv);
            if (sv.empty() || !parsed) {
                raise("ValueError", "could not convert string to float: {}"_format(keel::script::repr(text)));
            }
            return *parsed;
        }

        // round-half-even, like Python's round()
        static double round_half_even(double d) {
            return std::nearbyint(d);
        }

        static value to_int(const value& v) {
            if (auto* b = v.get_if<bool>()) {
                return value{static_cast<std::int64_t>(*b ? 1 : 0)};
            }
            if (v.is<std::int64_t>()) {
                return v;
            }
            if (auto* d = v.get_if<double>()) {
                if (!std::isfinite(*d)) {
                    raise("ValueError", "cannot convert float {} to integer"_format(keel::script::repr(v)));
                }
                double t = std::trunc(*d);
                if (t >= 9.2233720368547758e18 || t < -9.2233720368547758e18) {
                    raise("RuntimeError", "integer overflow");
                }
                return value{static_cast<std::int64_t>(t)};
            }
            if (auto* s = v.get_if<std::string>()) {
                return value{parse_int_literal(*s, 10)};
            }
            raise("TypeError",
                  "int() argument must be a string or a number, not '{}'"_format(keel::script::type_name(v)));
        }

        static value to_float(const value& v) {
            if (auto* b = v.get_if<bool>()) {
                return value{*b ? 1.0 : 0.0};
            }
            if (auto* i = v.get_if<std::int64_t>()) {
                return value{static_cast<double>(*i)};
            }
            if (v.is<double>()) {
                return v;
            }
            if (auto* s = v.get_if<std::string>()) {
                return value{parse_float_literal(*s)};
            }
            raise("TypeError",
                  "float() argument must be a string or a number, not '{}'"_format(keel::script::type_name(v)));
        }

        // min/max share argument handling: one iterable, or two or more positionals
        static value extreme(runtime& rt, native_args& a, std::string_view fname, bool want_max) {
            if (a.args.empty()) {
                raise("TypeError", "{} expected at least 1 argument, got 0"_format(fname));
            }
            std::vector<value> items = a.args.size() == 1 ? iterate(a.args[0]) : a.args;
            const value* key = a.kwarg("key");
            if (items.empty()) {
                if (auto* def = a.kwarg("default")) {
                    return *def;
                }
                raise("ValueError", "{}() arg is an empty sequence"_format(fname));
            }
            auto keyed = [&](const value& v) { return key && !key->is_none() ? rt.call(*key, {v}) : v; };
            value best = items[0];
            value best_key = keyed(best);
            for (std::size_t i = 1; i < items.size(); ++i) {
                value k = keyed(items[i]);
                bool better = want_max ? less_than(best_key, k) : less_than(k, best_key);
                if (better) {
                    best = items[i];
                    best_key = std::move(k);
                }
            }
            return best;
        }

        static void sort_values(runtime& rt, std::vector<value>& items, const value* key, bool reverse) {
            if (key && !key->is_none()) {
                std::vector<std::pair<value, value>> decorated{};
                decorated.reserve(items.size());
                for (auto& item : items) {
                    decorated.emplace_back(rt.call(*key, {item}), std::move(item));
                }
                std::ranges::stable_sort(decorated, [reverse](const auto& l, const auto& r) {
                    return reverse ? less_than(r.first, l.first) : less_than(l.first, r.first);
                });
                items.clear();
                for (auto& [_, item] : decorated) {
                    items.push_back(std::move(item));
                }
                return;
            }
            std::ranges::stable_sort(items, [reverse](const value& l, const value& r) {
                return reverse ? less_than(r, l) : less_than(l, r);
            });
        }

        static bool isinstance_one(const value& obj, const value& cls) {
            if (cls.is<exception_type>()) {
                auto* e = obj.get_if<std::shared_ptr<exception_object>>();
                return e && exception_matches(**e, cls);
            }
            if (auto* fn = cls.get_if<std::shared_ptr<builtin_function>>()) {
                const auto& name = (*fn)->name;
                auto tn = keel::script::type_name(obj);
                if (name == "int") {
                    return tn == "int" || tn == "bool";
                }
                if (name == "str" || name == "float" || name == "bool" || name == "list" || name == "dict" ||
                    name == "range") {
                    return tn == name;
                }
            }
            raise("TypeError", "isinstance() arg 2 must be a type or tuple of types");
        }

        // ── json module ─────────────────────────────────────────────

        static value json_loads(native_args& a) {
            return keel::script::from_json(expect_str(a.required(0, "s", "loads"), "the JSON object"));
        }

        static value json_dumps(native_args& a) {
            auto out = keel::script::to_json(a.required(0, "obj", "dumps"));
            const value* indent = a.kwarg("indent");
            if (!indent && a.args.size() > 1) {
                indent = &a.args[1];
            }
            if (indent && !indent->is_none()) {
                return value{glz::prettify_json(out)};
            }
            return value{std::move(out)};
        }

        static value make_json_module() {
            auto mod = std::make_shared<module_object>();
            mod->name = "json";
            mod->attrs.emplace("loads", make_fn("loads", json_loads));
            mod->attrs.emplace("dumps", make_fn("dumps", json_dumps));
            return value{std::move(mod)};
        }

    }  // namespace detail

    bool exception_matches(const exception_object& exc, const value& handler) {
        if (auto* t = handler.get_if<std::shared_ptr<tuple_object>>()) {
            return std::ranges::any_of((*t)->items, [&](const value& h) { return exception_matches(exc, h); });
        }
        auto* type = handler.get_if<exception_type>();
        if (!type) {
            detail::raise("TypeError", "catching classes that do not inherit from BaseException is not allowed");
        }
        return type->name == "Exception" || type->name == exc.kind;
    }

    std::map<std::string, value> make_builtins(runtime& rt) {
        std::map<std::string, value> b{};
        auto add = [&b](std::string name, keel::script::native_fn fn) {
            auto v = detail::make_fn(name, std::move(fn));
            b.emplace(std::move(name), std::move(v));
        };

        add("print", [&rt](native_args& a) -> value {
            std::string sep = " ";
            std::string end = "\n";
            if (auto* s = a.kwarg("sep"); s && !s->is_none()) {
                sep = detail::expect_str(*s, "sep");
            }
            if (auto* e = a.kwarg("end"); e && !e->is_none()) {
                end = detail::expect_str(*e, "end");
            }
            std::string line{};
            for (std::size_t i = 0; i < a.args.size(); ++i) {
                if (i > 0) {
                    line += sep;
                }
                line += keel::script::str(a.args[i]);
            }
            line += end;
            rt.write_output(line);
            return value{};
        });

        add("len", [](native_args& a) -> value {
            detail::expect_args(a, 1, 1, "len");
            return value{length(a.args[0])};
        });

        add("str", [](native_args& a) -> value {
            detail::expect_args(a, 0, 1, "str");
            return a.args.empty() ? value{std::string{}} : value{keel::script::str(a.args[0])};
        });

        add("repr", [](native_args& a) -> value {
            detail::expect_args(a, 1, 1, "repr");
            return value{keel::script::repr(a.args[0])};
        });

        add("int", [](native_args& a) -> value {
            detail::expect_args(a, 0, 2, "int");
            if (a.args.empty()) {
                return value{std::int64_t{0}};
            }
            if (a.args.size() == 2 || a.kwarg("base")) {
                const value& base_v = a.args.size() == 2 ? a.args[1] : *a.kwarg("base");
                auto base = detail::expect_int(base_v, "base");
                if (base < 2 || base > 36) {
                    detail::raise("ValueError", "int() base must be >= 2 and <= 36");
                }
                return value{detail::parse_int_literal(
                        detail::expect_str(a.args[0], "int() with explicit base argument"), static_cast<int>(base))};
            }
            return detail::to_int(a.args[0]);
        });

        add("float", [](native_args& a) -> value {
            detail::expect_args(a, 0, 1, "float");
            return a.args.empty() ? value{0.0} : detail::to_float(a.args[0]);
        });

        add("bool", [](native_args& a) -> value {
            detail::expect_args(a, 0, 1, "bool");
            return value{!a.args.empty() && keel::script::truthy(a.args[0])};
        });

        add("list", [](native_args& a) -> value {
            detail::expect_args(a, 0, 1, "list");
            return a.args.empty() ? keel::script::make_list() : keel::script::make_list(iterate(a.args[0]));
        });

        add("dict", [](native_args& a) -> value {
            detail::expect_args(a, 0, 1, "dict");
            auto out = std::make_shared<dict_object>();
            if (!a.args.empty()) {
                if (auto* d = a.args[0].get_if<std::shared_ptr<dict_object>>()) {
                    for (const auto& [k, v] : (*d)->entries) {
                        out->set(k, v);
                    }
                }
                else {
                    for (const auto& item : iterate(a.args[0])) {
                        auto pair = iterate(item);
                        if (pair.size() != 2) {
                            detail::raise(
                                    "ValueError",
                                    "dictionary update sequence element has length {}; 2 is required"_format(
                                            pair.size()));
                        }
                        out->set(pair[0], pair[1]);
                    }
                }
            }
            for (const auto& [k, v] : a.kwargs) {
                out->set(value{k}, v);
            }
            return value{std::move(out)};
        });

        add("range", [](native_args& a) -> value {
            detail::expect_args(a, 1, 3, "range");
            range_t r{};
            if (a.args.size() == 1) {
                r.stop = detail::expect_int(a.args[0], "range() argument");
            }
            else {
                r.start = detail::expect_int(a.args[0], "range() argument");
                r.stop = detail::expect_int(a.args[1], "range() argument");
                if (a.args.size() == 3) {
                    r.step = detail::expect_int(a.args[2], "range() argument");
                }
            }
            if (r.step == 0) {
                detail::raise("ValueError", "range() arg 3 must not be zero");
            }
            return value{r};
        });

        add("enumerate", [](native_args& a) -> value {
            detail::expect_args(a, 1, 2, "enumerate");
            std::int64_t n = 0;
            if (auto* s = a.find(1, "start")) {
                n = detail::expect_int(*s, "start");
            }
            auto out = std::make_shared<list_object>();
            for (auto& item : iterate(a.args[0])) {
                out->items.push_back(keel::script::make_tuple({value{n++}, std::move(item)}));
            }
            return value{std::move(out)};
        });

        add("zip", [](native_args& a) -> value {
            std::vector<std::vector<value>> columns{};
            for (const auto& arg : a.args) {
                columns.push_back(iterate(arg));
            }
            auto out = std::make_shared<list_object>();
            if (columns.empty()) {
                return value{std::move(out)};
            }
            std::size_t n = columns[0].size();
            for (const auto& col : columns) {
                n = std::min(n, col.size());
            }
            for (std::size_t i = 0; i < n; ++i) {
                std::vector<value> row{};
                for (auto& col : columns) {
                    row.push_back(col[i]);
                }
                out->items.push_back(keel::script::make_tuple(std::move(row)));
            }
            return value{std::move(out)};
        });

        add("sorted", [&rt](native_args& a) -> value {
            detail::expect_args(a, 1, 1, "sorted");
            auto items = iterate(a.args[0]);
            detail::sort_values(rt, items, a.kwarg("key"), detail::kw_flag(a, "reverse"));
            return keel::script::make_list(std::move(items));
        });

        add("reversed", [](native_args& a) -> value {
            detail::expect_args(a, 1, 1, "reversed");
            if (a.args[0].is<std::shared_ptr<dict_object>>()) {
                detail::raise("TypeError", "'dict' object is not reversible");
            }
            auto items = iterate(a.args[0]);
            std::ranges::reverse(items);
            return keel::script::make_list(std::move(items));
        });

        add("min", [&rt](native_args& a) -> value { return detail::extreme(rt, a, "min", false); });
        add("max", [&rt](native_args& a) -> value { return detail::extreme(rt, a, "max", true); });

        add("sum", [&rt](native_args& a) -> value {
            detail::expect_args(a, 1, 2, "sum");
            value total{std::int64_t{0}};
            if (auto* s = a.find(1, "start")) {
                if (s->is<std::string>()) {
                    detail::raise("TypeError", "sum() can't sum strings [use ''.join(seq) instead]");
                }
                total = *s;
            }
            for (const auto& item : iterate(a.args[0])) {
                total = binary(binary_op::add, total, item, rt.limits());
            }
            return total;
        });

        add("abs", [](native_args& a) -> value {
            detail::expect_args(a, 1, 1, "abs");
            const auto& v = a.args[0];
            if (auto* d = v.get_if<double>()) {
                return value{std::fabs(*d)};
            }
            if (v.is<std::int64_t>() || v.is<bool>()) {
                auto i = detail::expect_int(v, "abs");
                if (i == std::numeric_limits<std::int64_t>::min()) {
                    detail::raise("RuntimeError", "integer overflow");
                }
                return value{i < 0 ? -i : i};
            }
            detail::raise("TypeError", "bad operand type for abs(): '{}'"_format(keel::script::type_name(v)));
        });

        add("round", [](native_args& a) -> value {
            detail::expect_args(a, 1, 2, "round");
            const auto& v = a.args[0];
            const value* nd = a.find(1, "ndigits");
            if (v.is<std::int64_t>() || v.is<bool>()) {
                return detail::to_int(v);
            }
            auto* d = v.get_if<double>();
            if (!d) {
                detail::raise(
                        "TypeError",
                        "type {} doesn't define __round__ method"_format(keel::script::type_name(v)));
            }
            if (!nd || nd->is_none()) {
                return detail::to_int(value{detail::round_half_even(*d)});
            }
            auto digits = detail::expect_int(*nd, "ndigits");
            double scale = std::pow(10.0, static_cast<double>(digits));
            double scaled = *d * scale;
            if (!std::isfinite(scaled)) {
                return value{*d};
            }
            return value{detail::round_half_even(scaled) / scale};
        });

        add("any", [](native_args& a) -> value {
            detail::expect_args(a, 1, 1, "any");
            return value{std::ranges::any_of(iterate(a.args[0]), keel::script::truthy)};
        });

        add("all", [](native_args& a) -> value {
            detail::expect_args(a, 1, 1, "all");
            return value{std::ranges::all_of(iterate(a.args[0]), keel::script::truthy)};
        });

        add("isinstance", [](native_args& a) -> value {
            detail::expect_args(a, 2, 2, "isinstance");
            if (auto* t = a.args[1].get_if<std::shared_ptr<tuple_object>>()) {
                return value{std::ranges::any_of(
                        (*t)->items, [&](const value& cls) { return detail::isinstance_one(a.args[0], cls); })};
            }
            return value{detail::isinstance_one(a.args[0], a.args[1])};
        });

        for (auto kind : keel::script::exception_kinds) {
            b.emplace(std::string{kind}, value{exception_type{std::string{kind}}});
        }

        b.emplace("json", detail::make_json_module());
        return b;
    }

    // ── methods ─────────────────────────────────────────────────────

    namespace detail {

        static const std::unordered_set<std::string_view> string_methods{
                "upper",      "lower",   "capitalize", "strip",   "lstrip",  "rstrip",  "split",
                "splitlines", "join",    "replace",    "startswith", "endswith", "find", "rfind",
                "index",      "count",   "isdigit",    "isalpha", "isalnum", "isspace", "format",
                "zfill"};

        static const std::unordered_set<std::string_view> list_methods{
                "append", "extend", "pop", "insert", "remove", "index", "count", "sort", "reverse", "copy", "clear"};

        static const std::unordered_set<std::string_view> dict_methods{
                "get", "keys", "values", "items", "pop", "setdefault", "update", "copy", "clear"};

        static bool affix_match(const std::string& s, const value& affix, bool prefix) {
            auto test = [&](const value& v) {
                const auto& a = expect_str(v, prefix ? "startswith arg" : "endswith arg");
                return prefix ? s.starts_with(a) : s.ends_with(a);
            };
            if (auto* t = affix.get_if<std::shared_ptr<tuple_object>>()) {
                return std::ranges::any_of((*t)->items, test);
            }
            return test(affix);
        }

        // byte offset of a match converted to a code point index
        static std::int64_t char_index(const std::string& s, std::size_t byte_pos) {
            if (is_ascii(s)) {
                return static_cast<std::int64_t>(byte_pos);
            }
            return static_cast<std::int64_t>(utf8_chars(std::string_view{s}.substr(0, byte_pos)).size());
        }

        static std::vector<value> split_string(const std::string& s, const value* sep_v, std::int64_t maxsplit) {
            std::vector<value> out{};
            if (!sep_v || sep_v->is_none()) {
                std::size_t i = 0;
                while (i < s.size()) {
                    while (i < s.size() && whitespace.find(s[i]) != std::string_view::npos) {
                        ++i;
                    }
                    if (i >= s.size()) {
                        break;
                    }
                    if (maxsplit >= 0 && static_cast<std::int64_t>(out.size()) >= maxsplit) {
                        out.emplace_back(std::string{trim_view(std::string_view{s}.substr(i), whitespace, false, true)});
                        return out;
                    }
                    auto j = s.find_first_of(whitespace, i);
                    if (j == std::string::npos) {
                        j = s.size();
                    }
                    out.emplace_back(s.substr(i, j - i));
                    i = j;
                }
                return out;
            }
            const auto& sep = expect_str(*sep_v, "separator");
            if (sep.empty()) {
                raise("ValueError", "empty separator");
            }
            std::size_t start = 0;
            while (true) {
                if (maxsplit >= 0 && static_cast<std::int64_t>(out.size()) >= maxsplit) {
                    break;
                }
                auto p = s.find(sep, start);
                if (p == std::string::npos) {
                    break;
                }
                out.emplace_back(s.substr(start, p - start));
                start = p + sep.size();
            }
            out.emplace_back(s.substr(start));
            return out;
        }

        static std::string format_string(runtime& rt, const std::string& fmt, native_args& a) {
            std::string out{};
            std::size_t auto_index = 0;
            for (std::size_t i = 0; i < fmt.size(); ++i) {
                char c = fmt[i];
                if (c == '}') {
                    if (i + 1 < fmt.size() && fmt[i + 1] == '}') {
                        out.push_back('}');
                        ++i;
                        continue;
                    }
                    raise("ValueError", "Single '}' encountered in format string");
                }
                if (c != '{') {
                    out.push_back(c);
                    continue;
                }
                if (i + 1 < fmt.size() && fmt[i + 1] == '{') {
                    out.push_back('{');
                    ++i;
                    continue;
                }
                auto close = fmt.find('}', i);
                if (close == std::string::npos) {
                    raise("ValueError", "Single '{' encountered in format string");
                }
                std::string_view field{fmt.data() + i + 1, close - i - 1};
                i = close;

                std::string_view spec{};
                if (auto colon = field.find(':'); colon != std::string_view::npos) {
                    spec = field.substr(colon + 1);
                    field = field.substr(0, colon);
                }
                char conversion = 0;
                if (auto bang = field.find('!'); bang != std::string_view::npos) {
                    if (bang + 2 != field.size()) {
                        raise("ValueError", "invalid conversion in format string");
                    }
                    conversion = field[bang + 1];
                    field = field.substr(0, bang);
                }

                const value* arg = nullptr;
                if (field.empty()) {
                    if (auto_index >= a.args.size()) {
                        raise("IndexError", "Replacement index {} out of range"_format(auto_index));
                    }
                    arg = &a.args[auto_index++];
                }
                else if (auto idx = utils::parse_arithmetic<std::size_t>(field)) {
                    if (*idx >= a.args.size()) {
                        raise("IndexError", "Replacement index {} out of range"_format(*idx));
                    }
                    arg = &a.args[*idx];
                }
                else {
                    arg = a.kwarg(field);
                    if (!arg) {
                        raise("KeyError", keel::script::repr(value{field}));
                    }
                }

                value v = *arg;
                if (conversion == 'r') {
                    v = value{keel::script::repr(v)};
                }
                else if (conversion == 's') {
                    v = value{keel::script::str(v)};
                }
                else if (conversion != 0) {
                    raise("ValueError", "Unknown conversion specifier {}"_format(conversion));
                }
                out += format_value(v, spec, rt.limits().max_sequence_length);
                if (out.size() > rt.limits().max_sequence_length) {
                    raise("RuntimeError", "result too large");
                }
            }
            return out;
        }

        static value string_method(
                runtime& rt, const std::string& s, const std::string& name, native_args& a) {
            if (name == "upper" || name == "lower") {
                std::string out{s};
                for (auto& c : out) {
                    if (name == "upper" && c >= 'a' && c <= 'z') {
                        c = static_cast<char>(c - ('a' - 'A'));
                    }
                    else if (name == "lower") {
                        c = utils::char_tolower(c);
                    }
                }
                return value{std::move(out)};
            }
            if (name == "capitalize") {
                std::string out{s};
                for (std::size_t i = 0; i < out.size(); ++i) {
                    char c = out[i];
                    if (i == 0 && c >= 'a' && c <= 'z') {
                        out[i] = static_cast<char>(c - ('a' - 'A'));
                    }
                    else if (i > 0) {
                        out[i] = utils::char_tolower(c);
                    }
                }
                return value{std::move(out)};
            }
            if (name == "strip" || name == "lstrip" || name == "rstrip") {
                expect_args(a, 0, 1, name);
                std::string_view chars = whitespace;
                if (!a.args.empty() && !a.args[0].is_none()) {
                    chars = expect_str(a.args[0], "strip arg");
                }
                return value{std::string{trim_view(s, chars, name != "rstrip", name != "lstrip")}};
            }
            if (name == "split") {
                expect_args(a, 0, 2, name);
                std::int64_t maxsplit = -1;
                if (auto* m = a.find(1, "maxsplit")) {
                    maxsplit = expect_int(*m, "maxsplit");
                }
                return keel::script::make_list(split_string(s, a.find(0, "sep"), maxsplit));
            }
            if (name == "splitlines") {
                std::vector<value> out{};
                std::size_t start = 0;
                for (std::size_t i = 0; i < s.size(); ++i) {
                    if (s[i] == '\n' || s[i] == '\r') {
                        out.emplace_back(s.substr(start, i - start));
                        if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') {
                            ++i;
                        }
                        start = i + 1;
                    }
                }
                if (start < s.size()) {
                    out.emplace_back(s.substr(start));
                }
                return keel::script::make_list(std::move(out));
            }
            if (name == "join") {
                expect_args(a, 1, 1, name);
                std::string out{};
                bool first = true;
                for (const auto& item : iterate(a.args[0])) {
                    auto* piece = item.get_if<std::string>();
                    if (!piece) {
                        raise("TypeError",
                              "sequence item: expected str instance, {} found"_format(keel::script::type_name(item)));
                    }
                    if (!first) {
                        out += s;
                    }
                    first = false;
                    out += *piece;
                    if (out.size() > rt.limits().max_sequence_length) {
                        raise("RuntimeError", "result too large");
                    }
                }
                return value{std::move(out)};
            }
            if (name == "replace") {
                expect_args(a, 2, 3, name);
                const auto& from = expect_str(a.args[0], "replace arg 1");
                const auto& to = expect_str(a.args[1], "replace arg 2");
                std::int64_t limit = a.args.size() == 3 ? expect_int(a.args[2], "count") : -1;
                std::string out{};
                std::size_t pos = 0;
                std::int64_t done = 0;
                if (from.empty()) {
                    // Python inserts `to` between every character
                    auto chars = utf8_chars(s);
                    for (std::size_t i = 0; i <= chars.size(); ++i) {
                        if (limit < 0 || done < limit) {
                            out += to;
                            ++done;
                        }
                        if (i < chars.size()) {
                            out += chars[i];
                        }
                        if (out.size() > rt.limits().max_sequence_length) {
                            raise("RuntimeError", "result too large");
                        }
                    }
                    return value{std::move(out)};
                }
                while (limit < 0 || done < limit) {
                    auto p = s.find(from, pos);
                    if (p == std::string::npos) {
                        break;
                    }
                    out.append(s, pos, p - pos);
                    out += to;
                    pos = p + from.size();
                    ++done;
                    if (out.size() > rt.limits().max_sequence_length) {
                        raise("RuntimeError", "result too large");
                    }
                }
                out.append(s, pos);
                return value{std::move(out)};
            }
            if (name == "startswith" || name == "endswith") {
                expect_args(a, 1, 1, name);
                return value{affix_match(s, a.args[0], name == "startswith")};
            }
            if (name == "find" || name == "rfind" || name == "index") {
                expect_args(a, 1, 1, name);
                const auto& sub = expect_str(a.args[0], "substring");
                auto p = name == "rfind" ? s.rfind(sub) : s.find(sub);
                if (p == std::string::npos) {
                    if (name == "index") {
                        raise("ValueError", "substring not found");
                    }
                    return value{std::int64_t{-1}};
                }
                return value{char_index(s, p)};
            }
            if (name == "count") {
                expect_args(a, 1, 1, name);
                const auto& sub = expect_str(a.args[0], "substring");
                if (sub.empty()) {
                    return value{length(value{s}) + 1};
                }
                std::int64_t n = 0;
                for (auto p = s.find(sub); p != std::string::npos; p = s.find(sub, p + sub.size())) {
                    ++n;
                }
                return value{n};
            }
            if (name == "isdigit" || name == "isalpha" || name == "isalnum" || name == "isspace") {
                if (s.empty()) {
                    return value{false};
                }
                return value{std::ranges::all_of(s, [&name](char ch) {
                    auto c = static_cast<unsigned char>(ch);
                    if (name == "isdigit") {
                        return std::isdigit(c) != 0;
                    }
                    if (name == "isalpha") {
                        return std::isalpha(c) != 0;
                    }
                    if (name == "isalnum") {
                        return std::isalnum(c) != 0;
                    }
                    return std::isspace(c) != 0;
                })};
            }
            if (name == "format") {
                return value{format_string(rt, s, a)};
            }
            if (name == "zfill") {
                expect_args(a, 1, 1, name);
                auto width = expect_int(a.args[0], "width");
                auto len = length(value{s});
                if (width <= len) {
                    return value{s};
                }
                if (static_cast<std::uint64_t>(width) > rt.limits().max_sequence_length) {
                    raise("RuntimeError", "result too large");
                }
                auto pad = static_cast<std::size_t>(width - len);
                if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
                    return value{s.substr(0, 1) + std::string(pad, '0') + s.substr(1)};
                }
                return value{std::string(pad, '0') + s};
            }
            raise("AttributeError", "'str' object has no attribute '{}'"_format(name));
        }

        static value list_method(runtime& rt, list_object& l, const std::string& name, native_args& a) {
            auto& items = l.items;
            if (name == "append") {
                expect_args(a, 1, 1, name);
                if (items.size() >= rt.limits().max_sequence_length) {
                    raise("RuntimeError", "list too large");
                }
                items.push_back(a.args[0]);
                return value{};
            }
            if (name == "extend") {
                expect_args(a, 1, 1, name);
                auto more = iterate(a.args[0]);
                if (items.size() + more.size() > rt.limits().max_sequence_length) {
                    raise("RuntimeError", "list too large");
                }
                items.insert(items.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
                return value{};
            }
            if (name == "pop") {
                expect_args(a, 0, 1, name);
                if (items.empty()) {
                    raise("IndexError", "pop from empty list");
                }
                auto size = static_cast<std::int64_t>(items.size());
                std::int64_t i = a.args.empty() ? size - 1 : to_index(a.args[0], "list");
                if (i < 0) {
                    i += size;
                }
                if (i < 0 || i >= size) {
                    raise("IndexError", "pop index out of range");
                }
                value out = std::move(items[static_cast<std::size_t>(i)]);
                items.erase(items.begin() + i);
                return out;
            }
            if (name == "insert") {
                expect_args(a, 2, 2, name);
                auto size = static_cast<std::int64_t>(items.size());
                auto i = to_index(a.args[0], "list");
                if (i < 0) {
                    i = std::max<std::int64_t>(0, i + size);
                }
                i = std::min(i, size);
                items.insert(items.begin() + i, a.args[1]);
                return value{};
            }
            if (name == "remove" || name == "index") {
                expect_args(a, 1, 1, name);
                auto it = std::ranges::find_if(items, [&](const value& v) { return keel::script::equals(v, a.args[0]); });
                if (it == items.end()) {
                    raise("ValueError",
                          name == "remove" ? std::string{"list.remove(x): x not in list"}
                                           : "{} is not in list"_format(keel::script::repr(a.args[0])));
                }
                if (name == "index") {
                    return value{static_cast<std::int64_t>(it - items.begin())};
                }
                items.erase(it);
                return value{};
            }
            if (name == "count") {
                expect_args(a, 1, 1, name);
                return value{static_cast<std::int64_t>(std::ranges::count_if(
                        items, [&](const value& v) { return keel::script::equals(v, a.args[0]); }))};
            }
            if (name == "sort") {
                expect_args(a, 0, 0, name);
                sort_values(rt, items, a.kwarg("key"), kw_flag(a, "reverse"));
                return value{};
            }
            if (name == "reverse") {
                std::ranges::reverse(items);
                return value{};
            }
            if (name == "copy") {
                return keel::script::make_list(items);
            }
            if (name == "clear") {
                items.clear();
                return value{};
            }
            raise("AttributeError", "'list' object has no attribute '{}'"_format(name));
        }

        static value dict_method(dict_object& d, const std::string& name, native_args& a) {
            if (name == "get") {
                expect_args(a, 1, 2, name);
                if (auto* v = d.find(a.args[0])) {
                    return *v;
                }
                return a.args.size() == 2 ? a.args[1] : value{};
            }
            if (name == "keys" || name == "values" || name == "items") {
                std::vector<value> out{};
                out.reserve(d.size());
                for (const auto& [k, v] : d.entries) {
                    if (name == "keys") {
                        out.push_back(k);
                    }
                    else if (name == "values") {
                        out.push_back(v);
                    }
                    else {
                        out.push_back(keel::script::make_tuple({k, v}));
                    }
                }
                return keel::script::make_list(std::move(out));
            }
            if (name == "pop") {
                expect_args(a, 1, 2, name);
                if (auto v = d.erase(a.args[0])) {
                    return std::move(*v);
                }
                if (a.args.size() == 2) {
                    return a.args[1];
                }
                raise("KeyError", keel::script::repr(a.args[0]));
            }
            if (name == "setdefault") {
                expect_args(a, 1, 2, name);
                if (auto* v = d.find(a.args[0])) {
                    return *v;
                }
                value def = a.args.size() == 2 ? a.args[1] : value{};
                d.set(a.args[0], def);
                return def;
            }
            if (name == "update") {
                expect_args(a, 0, 1, name);
                if (!a.args.empty()) {
                    if (auto* other = a.args[0].get_if<std::shared_ptr<dict_object>>()) {
                        auto entries = (*other)->entries;
                        for (auto& [k, v] : entries) {
                            d.set(k, std::move(v));
                        }
                    }
                    else {
                        for (const auto& item : iterate(a.args[0])) {
                            auto pair = iterate(item);
                            if (pair.size() != 2) {
                                raise("ValueError", "dictionary update sequence element must have length 2");
                            }
                            d.set(pair[0], pair[1]);
                        }
                    }
                }
                for (const auto& [k, v] : a.kwargs) {
                    d.set(value{k}, v);
                }
                return value{};
            }
            if (name == "copy") {
                auto out = std::make_shared<dict_object>(d);
                return value{std::move(out)};
            }
            if (name == "clear") {
                d.clear();
                return value{};
            }
            raise("AttributeError", "'dict' object has no attribute '{}'"_format(name));
        }

    }  // namespace detail

    bool has_method(const value& self, std::string_view name) {
        if (self.is<std::string>()) {
            return detail::string_methods.contains(name);
        }
        if (self.is<std::shared_ptr<list_object>>()) {
            return detail::list_methods.contains(name);
        }
        if (self.is<std::shared_ptr<dict_object>>()) {
            return detail::dict_methods.contains(name);
        }
        return false;
    }

    value call_method(runtime& rt, const value& self, const std::string& name, native_args& args) {
        if (auto* s = self.get_if<std::string>()) {
            return detail::string_method(rt, *s, name, args);
        }
        if (auto* l = self.get_if<std::shared_ptr<list_object>>()) {
            return detail::list_method(rt, **l, name, args);
        }
        if (auto* d = self.get_if<std::shared_ptr<dict_object>>()) {
            return detail::dict_method(**d, name, args);
        }
        detail::raise(
                "AttributeError", "'{}' object has no attribute '{}'"_format(keel::script::type_name(self), name));
    }

}  // namespace keel::internal::script
