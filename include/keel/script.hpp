#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

// Restricted interpreter for an indentation-structured Python subset. A program is parsed once, then run with an
// explicit namespace: the fixed builtin allowlist, a json module, and whatever the caller passes in.
namespace keel::script {

    struct value;
    struct list_object;
    struct tuple_object;
    struct dict_object;
    struct builtin_function;
    struct function_object;
    struct bound_method;
    struct exception_object;
    struct module_object;

    struct none_t {
        constexpr bool operator==(const none_t&) const = default;
    };

    inline constexpr none_t none{};

    struct range_t {
        std::int64_t start{};
        std::int64_t stop{};
        std::int64_t step{1};

        std::int64_t size() const {
            if (step > 0) {
                return start < stop ? (stop - start + step - 1) / step : 0;
            }
            return start > stop ? (start - stop - step - 1) / -step : 0;
        }
        std::int64_t at(std::int64_t i) const { return start + i * step; }
    };

    // Exception classes are values: `except KeyError` and `raise KeyError("k")` both evaluate the name.
    struct exception_type {
        std::string name{};
    };

    struct value {
        using variant_t = std::variant<
                none_t,
                bool,
                std::int64_t,
                double,
                std::string,
                std::shared_ptr<list_object>,
                std::shared_ptr<tuple_object>,
                std::shared_ptr<dict_object>,
                range_t,
                std::shared_ptr<builtin_function>,
                std::shared_ptr<function_object>,
                std::shared_ptr<bound_method>,
                std::shared_ptr<exception_object>,
                exception_type,
                std::shared_ptr<module_object>>;

        variant_t data{};

        value() = default;
        value(none_t) {}
        value(bool b) : data{b} {}
        value(int i) : data{static_cast<std::int64_t>(i)} {}
        value(std::int64_t i) : data{i} {}
        value(double d) : data{d} {}
        value(std::string s) : data{std::move(s)} {}
        value(std::string_view s) : data{std::string{s}} {}
        value(const char* s) : data{std::string{s}} {}
        value(std::shared_ptr<list_object> p) : data{std::move(p)} {}
        value(std::shared_ptr<tuple_object> p) : data{std::move(p)} {}
        value(std::shared_ptr<dict_object> p) : data{std::move(p)} {}
        value(range_t r) : data{r} {}
        value(std::shared_ptr<builtin_function> p) : data{std::move(p)} {}
        value(std::shared_ptr<function_object> p) : data{std::move(p)} {}
        value(std::shared_ptr<bound_method> p) : data{std::move(p)} {}
        value(std::shared_ptr<exception_object> p) : data{std::move(p)} {}
        value(exception_type t) : data{std::move(t)} {}
        value(std::shared_ptr<module_object> p) : data{std::move(p)} {}

        template <typename T>
        bool is() const {
            return std::holds_alternative<T>(data);
        }
        template <typename T>
        const T* get_if() const {
            return std::get_if<T>(&data);
        }
        template <typename T>
        T* get_if() {
            return std::get_if<T>(&data);
        }

        bool is_none() const { return is<none_t>(); }
    };

    struct list_object {
        std::vector<value> items{};
    };

    struct tuple_object {
        std::vector<value> items{};
    };

    // Insertion-ordered mapping. Keys are indexed by their hash key (see hash_key), so 1, 1.0 and True collide
    // the way they do in Python.
    struct dict_object {
        std::vector<std::pair<value, value>> entries{};
        std::unordered_map<std::string, std::size_t> index{};

        value* find(const value& key);
        const value* find(const value& key) const;
        void set(const value& key, value v);
        std::optional<value> erase(const value& key);
        void clear() {
            entries.clear();
            index.clear();
        }
        std::size_t size() const { return entries.size(); }
    };

    struct exception_object {
        std::string kind{};
        std::string message{};
    };

    struct module_object {
        std::string name{};
        std::map<std::string, value> attrs{};
    };

    struct bound_method {
        value self{};
        std::string name{};
    };

    // Arguments of a call into native code, plus the budget of the running program so long-running host calls
    // can bound themselves.
    struct native_args {
        std::vector<value> args{};
        std::vector<std::pair<std::string, value>> kwargs{};
        std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};
        std::stop_token stop{};

        const value* kwarg(std::string_view name) const;

        // Positional argument `i`, or the keyword `name`; raises TypeError when neither was passed.
        const value& required(std::size_t i, std::string_view name, std::string_view fname) const;
        const value* find(std::size_t i, std::string_view name) const;
    };

    using native_fn = std::function<value(native_args&)>;

    struct builtin_function {
        std::string name{};
        native_fn fn{};
    };

    // A Python-level exception in flight. Native callables throw it to raise inside the program.
    class script_error : public std::exception {
      public:
        script_error(std::string kind, std::string message);
        explicit script_error(std::shared_ptr<exception_object> exc);

        const char* what() const noexcept override { return what_.c_str(); }

        const std::shared_ptr<exception_object>& exception() const { return exc_; }
        const std::string& kind() const { return exc_->kind; }
        const std::string& message() const { return exc_->message; }

        std::optional<int> line() const { return line_; }
        // first location wins; re-raising keeps the original line
        void set_line(int line) {
            if (!line_) {
                line_ = line;
            }
        }

      private:
        std::shared_ptr<exception_object> exc_;
        std::string what_;
        std::optional<int> line_{};
    };

    // Exception kinds a program can raise or catch by name.
    inline constexpr std::string_view exception_kinds[] = {
            "Exception",
            "ZeroDivisionError",
            "NameError",
            "TypeError",
            "ValueError",
            "KeyError",
            "IndexError",
            "AttributeError",
            "TimeoutError",
            "HostError",
            "RuntimeError",
            "AssertionError"};

    // ── value helpers ───────────────────────────────────────────────

    value make_list(std::vector<value> items = {});
    value make_tuple(std::vector<value> items = {});
    value make_dict();
    value make_exception(std::string kind, std::string message);

    std::string type_name(const value& v);
    bool truthy(const value& v);
    bool equals(const value& lhs, const value& rhs);
    std::string repr(const value& v);
    std::string str(const value& v);

    // Identity used for dict keys; raises TypeError for unhashable values.
    std::string hash_key(const value& v);

    // JSON text crosses the host boundary; functions, ranges and modules do not. Numbers keep their int or float
    // identity both ways. from_json raises ValueError on malformed input; to_json raises TypeError for values
    // without a JSON form and ValueError for NaN or infinity.
    value from_json(std::string_view json);
    std::string to_json(const value& v);

    // ── parsing and running ─────────────────────────────────────────

    struct program;

    struct syntax_failure {
        std::string message{};
        int line{};
        int column{};
    };

    std::expected<std::shared_ptr<const program>, syntax_failure> parse(std::string_view source);

    struct run_limits {
        std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};
        std::stop_token stop{};
        std::size_t max_output_bytes{1U << 20U};
        std::size_t max_call_depth{200};
        // caps single allocations such as "x" * n
        std::size_t max_sequence_length{10'000'000};
    };

    enum class failure_kind { runtime_error, execution_timeout, cancelled };

    struct run_failure {
        failure_kind kind{failure_kind::runtime_error};
        std::string exception_kind{};
        std::string message{};
        std::optional<int> line{};
    };

    struct run_outcome {
        std::string output{};
        bool output_truncated{false};
        std::optional<run_failure> failure{};
        // module globals after the run; functions, classes and modules are left out
        std::map<std::string, value> globals{};
    };

    // Runs on the calling thread until completion, an uncaught exception, the deadline, or a stop request.
    run_outcome run(std::shared_ptr<const program> prog, std::map<std::string, value> globals, const run_limits& limits);

}  // namespace keel::script
