#include "utils.hpp"

namespace keel::test {

    namespace detail {
        inline script::run_outcome run_source(std::string_view src, script::run_limits limits = {}) {
            auto prog = script::parse(src);
            if (!prog) {
                FAIL("parse failed at line " << prog.error().line << ": " << prog.error().message);
            }
            return script::run(*prog, {}, limits);
        }

        // Output of a program expected to finish cleanly.
        inline std::string output_of(std::string_view src) {
            auto out = run_source(src);
            if (out.failure) {
                FAIL(out.failure->exception_kind << ": " << out.failure->message);
            }
            return out.output;
        }
    }  // namespace detail

    TEST_CASE("005: arithmetic follows python semantics", "[005][script]") {
        CHECK(detail::output_of("print(7 // 2, -7 // 2, 7 % 3, -7 % 3)") == "3 -4 1 2\n");
        CHECK(detail::output_of("print(7 / 2, 2 ** 10, 2 ** -1)") == "3.5 1024 0.5\n");
        CHECK(detail::output_of("print(1 + 2 * 3, (1 + 2) * 3)") == "7 9\n");
        CHECK(detail::output_of("print(0.1 + 0.2 == 0.3, 1 == 1.0, True + True)") == "False True 2\n");
        CHECK(detail::output_of("print('ab' * 3, [0] * 2, 'a' + 'b')") == "ababab [0, 0] ab\n");
        CHECK(detail::output_of("print(1 < 2 < 3, 3 > 2 > 2, 'a' in 'cat', 4 not in [1, 2])") == "True False True True\n");
    }

    TEST_CASE("005: control flow", "[005][script]") {
        auto src = R"(
total = 0
for i in range(10):
    if i % 2 == 0:
        continue
    if i > 7:
        break
    total += i
else:
    total = -1
print(total)

n = 0
while n < 3:
    n += 1
else:
    print("done", n)

x = 5
print("big" if x > 3 else "small")
)";
        CHECK(detail::output_of(src) == "16\ndone 3\nbig\n");
    }

    TEST_CASE("005: functions, defaults, keywords and closures", "[005][script]") {
        auto src = R"(
def greet(name, greeting="hello"):
    return f"{greeting}, {name}!"

print(greet("ada"))
print(greet("bob", greeting="hi"))

def counter():
    counts = {"n": 0}
    def bump():
        counts["n"] += 1
        return counts["n"]
    return bump

c = counter()
c()
c()
print(c())

def fact(n):
    if n <= 1:
        return 1
    return n * fact(n - 1)
print(fact(20))
)";
        CHECK(detail::output_of(src) == "hello, ada!\nhi, bob!\n3\n2432902008176640000\n");
    }

    TEST_CASE("005: unpacking, slicing and comprehensions", "[005][script]") {
        auto src = R"(
a, b = 1, 2
a, b = b, a
print(a, b)
xs = [3, 1, 4, 1, 5, 9, 2, 6]
print(xs[1:4], xs[::-1][:2], xs[-1])
squares = [x * x for x in range(5) if x % 2 == 0]
print(squares)
pairs = {k: v for k, v in zip("abc", [1, 2, 3])}
print(pairs)
for i, ch in enumerate("xy"):
    print(i, ch)
)";
        CHECK(detail::output_of(src) == "2 1\n[1, 4, 1] [6, 2]\n9\n[0, 4, 16]\n{'a': 1, 'b': 2, 'c': 3}\n0 x\n1 y\n");
    }

    TEST_CASE("005: exceptions can be raised, caught and re-raised", "[005][script]") {
        auto ok = R"(
try:
    {}["missing"]
except KeyError as e:
    print("key", e)

try:
    try:
        1 / 0
    finally:
        print("cleanup")
except ZeroDivisionError:
    print("caught")

def check(v):
    if v < 0:
        raise ValueError("negative")
    return v

try:
    check(-1)
except (TypeError, ValueError) as e:
    print(isinstance(e, ValueError), e)

try:
    raise RuntimeError("boom")
except Exception as e:
    print("generic", e)
)";
        CHECK(detail::output_of(ok) == "key 'missing'\ncleanup\ncaught\nTrue negative\ngeneric boom\n");
    }

    TEST_CASE("005: uncaught exceptions report kind and line", "[005][script]") {
        auto out = detail::run_source("x = 1\ny = 2\nprint('before')\nz = x / 0\nprint('after')\n");
        REQUIRE(out.failure);
        CHECK(out.failure->kind == script::failure_kind::runtime_error);
        CHECK(out.failure->exception_kind == "ZeroDivisionError");
        CHECK(out.failure->line == 4);
        CHECK(out.output == "before\n");

        auto name = detail::run_source("print(undefined_name)");
        REQUIRE(name.failure);
        CHECK(name.failure->exception_kind == "NameError");
        CHECK(name.failure->message == "name 'undefined_name' is not defined");

        auto assertion = detail::run_source("assert 1 == 2, 'math broke'");
        REQUIRE(assertion.failure);
        CHECK(assertion.failure->exception_kind == "AssertionError");
        CHECK(assertion.failure->message == "math broke");
    }

    TEST_CASE("005: unsafe constructs are rejected at parse time", "[005][script]") {
        for (auto src :
             {"import os",
              "from os import path",
              "class A:\n    pass",
              "def f():\n    global x",
              "lambda x: x",
              "with open('f') as fh:\n    pass",
              "del x",
              "x.__class__",
              "__import__('os')",
              "break",
              "return 1"}) {
            auto prog = script::parse(src);
            CHECK_FALSE(prog);
            if (!prog) {
                CHECK(prog.error().line >= 1);
            }
        }
        CHECK(script::parse("x = 1\n"));
        CHECK(script::parse(""));
    }

    TEST_CASE("005: deadline and stop interrupt busy loops", "[005][script]") {
        script::run_limits limits{};
        limits.deadline = std::chrono::steady_clock::now() + 100ms;
        auto timed = detail::run_source("while True:\n    pass\n", limits);
        REQUIRE(timed.failure);
        CHECK(timed.failure->kind == script::failure_kind::execution_timeout);

        // the interrupt is not catchable from the program
        limits.deadline = std::chrono::steady_clock::now() + 100ms;
        auto uncatchable = detail::run_source(
                "try:\n    while True:\n        pass\nexcept Exception:\n    print('caught')\n", limits);
        REQUIRE(uncatchable.failure);
        CHECK(uncatchable.failure->kind == script::failure_kind::execution_timeout);
        CHECK(uncatchable.output.empty());

        std::stop_source stop{};
        stop.request_stop();
        script::run_limits cancelled{};
        cancelled.stop = stop.get_token();
        auto out = detail::run_source("for i in range(10**9):\n    pass\n", cancelled);
        REQUIRE(out.failure);
        CHECK(out.failure->kind == script::failure_kind::cancelled);
    }

    TEST_CASE("005: output is capped", "[005][script]") {
        script::run_limits limits{};
        limits.max_output_bytes = 10;
        auto out = detail::run_source("for i in range(100):\n    print('xxxxxxxx')\n", limits);
        CHECK_FALSE(out.failure);
        CHECK(out.output_truncated);
        CHECK(out.output.size() == 10U);
    }

    TEST_CASE("005: recursion depth is bounded", "[005][script]") {
        auto out = detail::run_source("def f(n):\n    return f(n + 1)\nf(0)\n");
        REQUIRE(out.failure);
        CHECK(out.failure->exception_kind == "RuntimeError");
    }

    TEST_CASE("005: module globals are exported after a run", "[005][script]") {
        auto out = detail::run_source("answer = 6 * 7\nname = 'keel'\ndef helper():\n    pass\n");
        REQUIRE_FALSE(out.failure);
        REQUIRE(out.globals.contains("answer"));
        CHECK(*out.globals["answer"].get_if<std::int64_t>() == 42);
        CHECK(*out.globals["name"].get_if<std::string>() == "keel");
        CHECK_FALSE(out.globals.contains("helper"));
        CHECK_FALSE(out.globals.contains("print"));
    }

}  // namespace keel::test
