#include "keel/script.hpp"

#include "keel/format.hpp"
#include "keel/utils.hpp"

#include <glaze/glaze.hpp>

#include <charconv>
#include <cmath>
#include <limits>
#include <type_traits>
#include <utility>

using namespace keel::literals;

namespace keel::script {

    namespace detail {

        // repr of self-referencing containers stops here
        inline constexpr int max_repr_depth = 64;

        static std::string float_repr(double d) {
            if (std::isnan(d)) {
                return "nan";
            }
            if (std::isinf(d)) {
                return d > 0 ? "inf" : "-inf";
            }
            char buf[64]{};
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            std::string out{buf, ptr};
            if (out.find_first_of(".en") == std::string::npos) {
                out += ".0";
            }
            return out;
        }

        static std::string string_repr(std::string_view s) {
            char quote = (s.find('\'') != std::string_view::npos && s.find('"') == std::string_view::npos) ? '"' : '\'';
            std::string out{quote};
            for (char c : s) {
                switch (c) {
                    case '\\':
                        out += "\\\\";
                        break;
                    case '\n':
                        out += "\\n";
                        break;
                    case '\r':
                        out += "\\r";
                        break;
                    case '\t':
                        out += "\\t";
                        break;
                    default:
                        if (c == quote) {
                            out.push_back('\\');
                            out.push_back(c);
                        }
                        else if (static_cast<unsigned char>(c) < 0x20) {
                            out += "\\x{:02x}"_format(static_cast<unsigned>(static_cast<unsigned char>(c)));
                        }
                        else {
                            out.push_back(c);
                        }
                }
            }
            out.push_back(quote);
            return out;
        }

        static std::string repr_impl(const value& v, int depth);

        static std::string sequence_repr(const std::vector<value>& items, char open, char close, int depth, bool tuple) {
            if (depth > max_repr_depth) {
                return "...";
            }
            std::string out{open};
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += repr_impl(items[i], depth + 1);
            }
            if (tuple && items.size() == 1) {
                out.push_back(',');
            }
            out.push_back(close);
            return out;
        }

        static std::string repr_impl(const value& v, int depth) {
            return std::visit(
                    [depth](const auto& x) -> std::string {
                        using T = std::decay_t<decltype(x)>;
                        if constexpr (std::is_same_v<T, none_t>) {
                            return "None";
                        }
                        else if constexpr (std::is_same_v<T, bool>) {
                            return x ? "True" : "False";
                        }
                        else if constexpr (std::is_same_v<T, std::int64_t>) {
                            return std::to_string(x);
                        }
                        else if constexpr (std::is_same_v<T, double>) {
                            return float_repr(x);
                        }
                        else if constexpr (std::is_same_v<T, std::string>) {
                            return string_repr(x);
                        }
                        else if constexpr (std::is_same_v<T, std::shared_ptr<list_object>>) {
                            return sequence_repr(x->items, '[', ']', depth, false);
                        }
                        else if constexpr (std::is_same_v<T, std::shared_ptr<tuple_object>>) {
                            return sequence_repr(x->items, '(', ')', depth, true);
                        }
                        else if constexpr (std::is_same_v<T, std::shared_ptr<dict_object>>) {
                            if (depth > max_repr_depth) {
                                return "{...}";
                            }
                            std::string out{"{"};
                            bool first = true;
                            for (const auto& [k, val] : x->entries) {
                                if (!first) {
                                    out += ", ";
                                }
                                first = false;
                                out += repr_impl(k, depth + 1);
                                out += ": ";
                                out += repr_impl(val, depth + 1);
                            }
                            out.push_back('}');
                            return out;
                        }
                        else if constexpr (std::is_same_v<T, range_t>) {
                            if (x.step == 1) {
                                return "range({}, {})"_format(x.start, x.stop);
                            }
                            return "range({}, {}, {})"_format(x.start, x.stop, x.step);
                        }
                        else if constexpr (std::is_same_v<T, std::shared_ptr<builtin_function>>) {
                            return "<built-in function {}>"_format(x->name);
                        }
                        else if constexpr (std::is_same_v<T, std::shared_ptr<function_object>>) {
                            return "<function>";
                        }
                        else if constexpr (std::is_same_v<T, std::shared_ptr<bound_method>>) {
                            return "<bound method {} of {}>"_format(x->name, type_name(x->self));
                        }
                        else if constexpr (std::is_same_v<T, std::shared_ptr<exception_object>>) {
                            return "{}({})"_format(x->kind, string_repr(x->message));
                        }
                        else if constexpr (std::is_same_v<T, exception_type>) {
                            return "<class '{}'>"_format(x.name);
                        }
                        else {
                            return "<module '{}'>"_format(x->name);
                        }
                    },
                    v.data);
        }

    }  // namespace detail

    // ── errors ──────────────────────────────────────────────────────

    script_error::script_error(std::string kind, std::string message)
        : script_error{std::make_shared<exception_object>(std::move(kind), std::move(message))} {}

    script_error::script_error(std::shared_ptr<exception_object> exc) : exc_{std::move(exc)} {
        what_ = exc_->message.empty() ? exc_->kind : "{}: {}"_format(exc_->kind, exc_->message);
    }

    // ── native args ─────────────────────────────────────────────────

    const value* native_args::kwarg(std::string_view name) const {
        for (const auto& [k, v] : kwargs) {
            if (k == name) {
                return &v;
            }
        }
        return nullptr;
    }

    const value* native_args::find(std::size_t i, std::string_view name) const {
        if (i < args.size()) {
            return &args[i];
        }
        return kwarg(name);
    }

    const value& native_args::required(std::size_t i, std::string_view name, std::string_view fname) const {
        if (auto* v = find(i, name)) {
            return *v;
        }
        throw script_error{"TypeError", "{}() missing required argument '{}'"_format(fname, name)};
    }

    // ── dict ────────────────────────────────────────────────────────

    value* dict_object::find(const value& key) {
        auto it = index.find(hash_key(key));
        return it == index.end() ? nullptr : &entries[it->second].second;
    }

    const value* dict_object::find(const value& key) const {
        auto it = index.find(hash_key(key));
        return it == index.end() ? nullptr : &entries[it->second].second;
    }

    void dict_object::set(const value& key, value v) {
        auto hk = hash_key(key);
        if (auto it = index.find(hk); it != index.end()) {
            entries[it->second].second = std::move(v);
            return;
        }
        index.emplace(std::move(hk), entries.size());
        entries.emplace_back(key, std::move(v));
    }

    std::optional<value> dict_object::erase(const value& key) {
        auto it = index.find(hash_key(key));
        if (it == index.end()) {
            return std::nullopt;
        }
        auto pos = it->second;
        value out = std::move(entries[pos].second);
        entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(pos));
        index.erase(it);
        for (auto& [k, p] : index) {
            if (p > pos) {
                --p;
            }
        }
        return out;
    }

    // ── constructors ────────────────────────────────────────────────

    value make_list(std::vector<value> items) {
        return value{std::make_shared<list_object>(std::move(items))};
    }

    value make_tuple(std::vector<value> items) {
        return value{std::make_shared<tuple_object>(std::move(items))};
    }

    value make_dict() {
        return value{std::make_shared<dict_object>()};
    }

    value make_exception(std::string kind, std::string message) {
        return value{std::make_shared<exception_object>(std::move(kind), std::move(message))};
    }

    // ── inspection ──────────────────────────────────────────────────

    std::string type_name(const value& v) {
        return std::visit(
                [](const auto& x) -> std::string {
                    using T = std::decay_t<decltype(x)>;
                    if constexpr (std::is_same_v<T, none_t>) {
                        return "NoneType";
                    }
                    else if constexpr (std::is_same_v<T, bool>) {
                        return "bool";
                    }
                    else if constexpr (std::is_same_v<T, std::int64_t>) {
                        return "int";
                    }
                    else if constexpr (std::is_same_v<T, double>) {
                        return "float";
                    }
                    else if constexpr (std::is_same_v<T, std::string>) {
                        return "str";
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<list_object>>) {
                        return "list";
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<tuple_object>>) {
                        return "tuple";
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<dict_object>>) {
                        return "dict";
                    }
                    else if constexpr (std::is_same_v<T, range_t>) {
                        return "range";
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<builtin_function>>) {
                        return "builtin_function_or_method";
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<function_object>>) {
                        return "function";
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<bound_method>>) {
                        return "method";
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<exception_object>>) {
                        return x->kind;
                    }
                    else if constexpr (std::is_same_v<T, exception_type>) {
                        return "type";
                    }
                    else {
                        return "module";
                    }
                },
                v.data);
    }

    bool truthy(const value& v) {
        return std::visit(
                [](const auto& x) -> bool {
                    using T = std::decay_t<decltype(x)>;
                    if constexpr (std::is_same_v<T, none_t>) {
                        return false;
                    }
                    else if constexpr (std::is_same_v<T, bool>) {
                        return x;
                    }
                    else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
                        return x != 0;
                    }
                    else if constexpr (std::is_same_v<T, std::string>) {
                        return !x.empty();
                    }
                    else if constexpr (
                            std::is_same_v<T, std::shared_ptr<list_object>> ||
                            std::is_same_v<T, std::shared_ptr<tuple_object>>) {
                        return !x->items.empty();
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<dict_object>>) {
                        return x->size() > 0;
                    }
                    else if constexpr (std::is_same_v<T, range_t>) {
                        return x.size() > 0;
                    }
                    else {
                        return true;
                    }
                },
                v.data);
    }

    namespace detail {
        static std::optional<double> as_number(const value& v) {
            if (auto* b = v.get_if<bool>()) {
                return *b ? 1.0 : 0.0;
            }
            if (auto* i = v.get_if<std::int64_t>()) {
                return static_cast<double>(*i);
            }
            if (auto* d = v.get_if<double>()) {
                return *d;
            }
            return std::nullopt;
        }

        static std::optional<std::int64_t> as_exact_int(const value& v) {
            if (auto* b = v.get_if<bool>()) {
                return *b ? 1 : 0;
            }
            if (auto* i = v.get_if<std::int64_t>()) {
                return *i;
            }
            return std::nullopt;
        }
    }  // namespace detail

    bool equals(const value& lhs, const value& rhs) {
        if (auto li = detail::as_exact_int(lhs), ri = detail::as_exact_int(rhs); li && ri) {
            return *li == *ri;
        }
        if (auto ln = detail::as_number(lhs), rn = detail::as_number(rhs); ln && rn) {
            return *ln == *rn;
        }
        if (lhs.data.index() != rhs.data.index()) {
            return false;
        }
        return std::visit(
                [&rhs](const auto& x) -> bool {
                    using T = std::decay_t<decltype(x)>;
                    const auto& y = std::get<T>(rhs.data);
                    if constexpr (std::is_same_v<T, none_t>) {
                        return true;
                    }
                    else if constexpr (std::is_same_v<T, std::string>) {
                        return x == y;
                    }
                    else if constexpr (
                            std::is_same_v<T, std::shared_ptr<list_object>> ||
                            std::is_same_v<T, std::shared_ptr<tuple_object>>) {
                        if (x == y) {
                            return true;
                        }
                        if (x->items.size() != y->items.size()) {
                            return false;
                        }
                        for (std::size_t i = 0; i < x->items.size(); ++i) {
                            if (!equals(x->items[i], y->items[i])) {
                                return false;
                            }
                        }
                        return true;
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<dict_object>>) {
                        if (x == y) {
                            return true;
                        }
                        if (x->size() != y->size()) {
                            return false;
                        }
                        for (const auto& [k, v] : x->entries) {
                            auto* other = y->find(k);
                            if (!other || !equals(v, *other)) {
                                return false;
                            }
                        }
                        return true;
                    }
                    else if constexpr (std::is_same_v<T, range_t>) {
                        return x.start == y.start && x.stop == y.stop && x.step == y.step;
                    }
                    else if constexpr (std::is_same_v<T, exception_type>) {
                        return x.name == y.name;
                    }
                    else {
                        return x == y;
                    }
                },
                lhs.data);
    }

    std::string repr(const value& v) {
        return detail::repr_impl(v, 0);
    }

    std::string str(const value& v) {
        if (auto* s = v.get_if<std::string>()) {
            return *s;
        }
        if (auto* e = v.get_if<std::shared_ptr<exception_object>>()) {
            return (*e)->message;
        }
        return repr(v);
    }

    std::string hash_key(const value& v) {
        if (v.is_none()) {
            return "N";
        }
        if (auto i = detail::as_exact_int(v)) {
            return "i:{}"_format(*i);
        }
        if (auto* d = v.get_if<double>()) {
            if (std::isfinite(*d) && std::trunc(*d) == *d && std::fabs(*d) < 9.2e18) {
                return "i:{}"_format(static_cast<std::int64_t>(*d));
            }
            return "f:" + detail::float_repr(*d);
        }
        if (auto* s = v.get_if<std::string>()) {
            return "s:" + *s;
        }
        if (auto* t = v.get_if<std::shared_ptr<tuple_object>>()) {
            std::string out{"t("};
            for (const auto& item : (*t)->items) {
                auto k = hash_key(item);
                out += "{}:{},"_format(k.size(), k);
            }
            out.push_back(')');
            return out;
        }
        if (auto* e = v.get_if<exception_type>()) {
            return "T:" + e->name;
        }
        throw script_error{"TypeError", "unhashable type: '{}'"_format(type_name(v))};
    }

    // ── JSON boundary ───────────────────────────────────────────────

    namespace detail {

        inline constexpr int max_json_depth = 256;

        static std::string_view trim_json(std::string_view text) {
            auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }

        template <typename T>
        static T read_json_part(std::string_view text) {
            T out{};
            // glaze expects a null-terminated buffer
            std::string buffer{text};
            if (auto ec = glz::read_json(out, buffer)) {
                throw script_error{"ValueError", "invalid JSON: {}"_format(glz::format_error(ec, buffer))};
            }
            return out;
        }

        // Integers stay int unless they leave the int64 range; anything with a fraction or exponent is a float.
        static value number_from_json(std::string_view lexeme) {
            if (lexeme.find_first_of(".eE") == std::string_view::npos) {
                if (auto n = utils::parse_arithmetic<std::int64_t>(lexeme)) {
                    return value{*n};
                }
            }
            return value{read_json_part<double>(lexeme)};
        }

        static value from_json_impl(std::string_view text, int depth) {
            if (depth > max_json_depth) {
                throw script_error{"ValueError", "JSON nested too deeply"};
            }
            text = trim_json(text);
            if (text.empty()) {
                throw script_error{"ValueError", "invalid JSON: empty document"};
            }
            switch (text.front()) {
                case '{': {
                    auto members = read_json_part<std::map<std::string, glz::raw_json>>(text);
                    auto out = std::make_shared<dict_object>();
                    for (const auto& [k, v] : members) {
                        out->set(value{k}, from_json_impl(v.str, depth + 1));
                    }
                    return value{std::move(out)};
                }
                case '[': {
                    auto items = read_json_part<std::vector<glz::raw_json>>(text);
                    auto out = std::make_shared<list_object>();
                    out->items.reserve(items.size());
                    for (const auto& item : items) {
                        out->items.push_back(from_json_impl(item.str, depth + 1));
                    }
                    return value{std::move(out)};
                }
                case '"':
                    return value{read_json_part<std::string>(text)};
                case 't':
                case 'f':
                    return value{read_json_part<bool>(text)};
                case 'n':
                    read_json_part<std::nullptr_t>(text);
                    return value{};
                default:
                    return number_from_json(text);
            }
        }

        static std::string json_key(const value& k) {
            if (k.is_none()) {
                return "null";
            }
            if (k.is<bool>()) {
                return truthy(k) ? "true" : "false";
            }
            if (k.is<std::string>() || k.is<std::int64_t>() || k.is<double>()) {
                return str(k);
            }
            throw script_error{"TypeError", "keys must be str, int, float, bool or None, not {}"_format(type_name(k))};
        }

        static void write_json_string(const std::string& s, std::string& out) {
            std::string quoted{};
            if (auto ec = glz::write_json(s, quoted)) {
                throw script_error{"ValueError", "cannot serialize string: {}"_format(glz::format_error(ec, quoted))};
            }
            out += quoted;
        }

        static void to_json_impl(const value& v, std::string& out, int depth) {
            if (depth > max_json_depth) {
                throw script_error{"ValueError", "Circular reference detected"};
            }
            std::visit(
                    [&out, depth](const auto& x) {
                        using T = std::decay_t<decltype(x)>;
                        if constexpr (std::is_same_v<T, none_t>) {
                            out += "null";
                        }
                        else if constexpr (std::is_same_v<T, bool>) {
                            out += x ? "true" : "false";
                        }
                        else if constexpr (std::is_same_v<T, std::int64_t>) {
                            out += std::to_string(x);
                        }
                        else if constexpr (std::is_same_v<T, double>) {
                            if (!std::isfinite(x)) {
                                throw script_error{"ValueError", "Out of range float values are not JSON compliant"};
                            }
                            // repr keeps a trailing ".0" so whole floats read back as floats
                            out += float_repr(x);
                        }
                        else if constexpr (std::is_same_v<T, std::string>) {
                            write_json_string(x, out);
                        }
                        else if constexpr (
                                std::is_same_v<T, std::shared_ptr<list_object>> ||
                                std::is_same_v<T, std::shared_ptr<tuple_object>>) {
                            out += '[';
                            bool first = true;
                            for (const auto& item : x->items) {
                                if (!std::exchange(first, false)) {
                                    out += ',';
                                }
                                to_json_impl(item, out, depth + 1);
                            }
                            out += ']';
                        }
                        else if constexpr (std::is_same_v<T, std::shared_ptr<dict_object>>) {
                            out += '{';
                            bool first = true;
                            for (const auto& [k, val] : x->entries) {
                                if (!std::exchange(first, false)) {
                                    out += ',';
                                }
                                write_json_string(json_key(k), out);
                                out += ':';
                                to_json_impl(val, out, depth + 1);
                            }
                            out += '}';
                        }
                        else {
                            throw script_error{
                                    "TypeError",
                                    "Object of type {} is not JSON serializable"_format(type_name(value{x}))};
                        }
                    },
                    v.data);
        }

    }  // namespace detail

    value from_json(std::string_view json) {
        return detail::from_json_impl(json, 0);
    }

    std::string to_json(const value& v) {
        std::string out{};
        detail::to_json_impl(v, out, 0);
        return out;
    }

}  // namespace keel::script
