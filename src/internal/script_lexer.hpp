#pragma once

#include "keel/script.hpp"
#include "keel/utils.hpp"

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keel::internal::script {

    using keel::script::syntax_failure;

    enum class token_kind : uint8_t {
        end_of_file,
        newline,
        indent,
        dedent,
        name,
        keyword,
        integer,
        floating,
        string,
        fstring,
        op,
    };

    struct token {
        token_kind kind{token_kind::end_of_file};
        // decoded contents for string tokens, raw body for fstring tokens, spelling otherwise
        std::string text{};
        int line{1};
        int column{1};
    };

    inline constexpr std::string_view keywords[] = {
            "False", "None",   "True",  "and",    "as",     "assert", "async",  "await",
            "break", "class",  "continue", "def", "del",    "elif",   "else",   "except",
            "finally", "for",  "from",  "global", "if",     "import", "in",     "is",
            "lambda", "nonlocal", "not", "or",    "pass",   "raise",  "return", "try",
            "while", "with",   "yield"};

    inline bool is_keyword(std::string_view text) {
        for (auto kw : keywords) {
            if (kw == text) {
                return true;
            }
        }
        return false;
    }

    inline bool is_dunder(std::string_view name) {
        return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
    }

    // Appends the UTF-8 encoding of a code point.
    inline void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    inline std::optional<uint32_t> parse_hex(std::string_view digits) {
        uint32_t out = 0;
        for (char c : digits) {
            out <<= 4;
            if (c >= '0' && c <= '9') {
                out |= static_cast<uint32_t>(c - '0');
            }
            else if (c >= 'a' && c <= 'f') {
                out |= static_cast<uint32_t>(c - 'a' + 10);
            }
            else if (c >= 'A' && c <= 'F') {
                out |= static_cast<uint32_t>(c - 'A' + 10);
            }
            else {
                return std::nullopt;
            }
        }
        return out;
    }

    // Decodes backslash escapes. Returns the offending offset on a malformed escape.
    inline std::optional<std::size_t> decode_escapes(std::string_view body, std::string& out) {
        for (std::size_t i = 0; i < body.size(); ++i) {
            char c = body[i];
            if (c != '\\' || i + 1 >= body.size()) {
                out.push_back(c);
                continue;
            }
            char e = body[++i];
            switch (e) {
                case 'n':
                    out.push_back('\n');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case '0':
                    out.push_back('\0');
                    break;
                case '\\':
                case '\'':
                case '"':
                    out.push_back(e);
                    break;
                case '\n':
                    break;
                case 'x':
                case 'u':
                case 'U': {
                    std::size_t width = e == 'x' ? 2 : (e == 'u' ? 4 : 8);
                    if (i + width >= body.size()) {
                        return i;
                    }
                    auto cp = parse_hex(body.substr(i + 1, width));
                    if (!cp) {
                        return i;
                    }
                    append_utf8(out, *cp);
                    i += width;
                    break;
                }
                default:
                    // unknown escapes are kept verbatim
                    out.push_back('\\');
                    out.push_back(e);
                    break;
            }
        }
        return std::nullopt;
    }

    /*
     * Converts program text into tokens, synthesizing newline/indent/dedent tokens from line structure. Newlines
     * inside brackets are not significant. Stops at the first error.
     */
    class lexer {
      public:
        explicit lexer(std::string_view text) : text_{text} {}

        std::optional<syntax_failure> run() {
            while (!error_ && !at_end()) {
                if (at_line_start_ && depth_ == 0) {
                    if (!lex_indentation()) {
                        continue;
                    }
                }
                lex_token();
            }
            if (error_) {
                return error_;
            }
            if (!tokens_.empty() && tokens_.back().kind != token_kind::newline) {
                emit(token_kind::newline, "", line_, column_);
            }
            while (indents_.size() > 1) {
                indents_.pop_back();
                emit(token_kind::dedent, "", line_, column_);
            }
            emit(token_kind::end_of_file, "", line_, column_);
            return std::nullopt;
        }

        std::vector<token>& tokens() { return tokens_; }

      private:
        bool at_end() const { return index_ >= text_.size(); }

        char peek(std::size_t lookahead = 0) const {
            std::size_t i = index_ + lookahead;
            return i < text_.size() ? text_[i] : '\0';
        }

        char advance() {
            if (at_end()) {
                return '\0';
            }
            char c = text_[index_++];
            if (c == '\n') {
                ++line_;
                column_ = 1;
                at_line_start_ = depth_ == 0;
            }
            else {
                ++column_;
            }
            return c;
        }

        void emit(token_kind kind, std::string text, int line, int column) {
            tokens_.push_back(token{kind, std::move(text), line, column});
        }

        void fail(std::string message, int line, int column) {
            if (!error_) {
                error_ = syntax_failure{.message = std::move(message), .line = line, .column = column};
            }
        }

        // Returns false when the line was blank (already consumed).
        bool lex_indentation() {
            int width = 0;
            while (peek() == ' ' || peek() == '\t') {
                width = peek() == '\t' ? (width / 8 + 1) * 8 : width + 1;
                advance();
            }
            if (peek() == '#') {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
            }
            if (peek() == '\r' && peek(1) == '\n') {
                advance();
            }
            if (peek() == '\n') {
                advance();
                return false;
            }
            if (at_end()) {
                return false;
            }

            at_line_start_ = false;
            if (width > indents_.back()) {
                indents_.push_back(width);
                emit(token_kind::indent, "", line_, column_);
            }
            else {
                while (width < indents_.back()) {
                    indents_.pop_back();
                    emit(token_kind::dedent, "", line_, column_);
                }
                if (width != indents_.back()) {
                    fail("unindent does not match any outer indentation level", line_, column_);
                }
            }
            return true;
        }

        void lex_token() {
            char c = peek();
            int line = line_;
            int column = column_;

            if (c == ' ' || c == '\t' || c == '\r') {
                advance();
                return;
            }
            if (c == '#') {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
                return;
            }
            if (c == '\\' && (peek(1) == '\n' || (peek(1) == '\r' && peek(2) == '\n'))) {
                advance();
                if (peek() == '\r') {
                    advance();
                }
                advance();
                at_line_start_ = false;
                return;
            }
            if (c == '\n') {
                advance();
                if (depth_ > 0) {
                    at_line_start_ = false;
                    return;
                }
                if (!tokens_.empty() && tokens_.back().kind != token_kind::newline &&
                    tokens_.back().kind != token_kind::indent && tokens_.back().kind != token_kind::dedent) {
                    emit(token_kind::newline, "", line, column);
                }
                return;
            }
            if (std::isalpha(static_cast<unsigned char>(c)) || c == '_' || static_cast<unsigned char>(c) >= 0x80) {
                lex_name_or_string(line, column);
                return;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
                lex_number(line, column);
                return;
            }
            if (c == '"' || c == '\'') {
                lex_string(line, column, false, false);
                return;
            }
            lex_operator(line, column);
        }

        void lex_name_or_string(int line, int column) {
            std::string text{};
            while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                   static_cast<unsigned char>(peek()) >= 0x80) {
                text.push_back(advance());
            }

            if ((peek() == '"' || peek() == '\'') && text.size() <= 2) {
                std::string prefix{};
                for (char p : text) {
                    prefix.push_back(utils::char_tolower(p));
                }
                if (prefix == "r" || prefix == "f" || prefix == "rf" || prefix == "fr") {
                    lex_string(line, column, prefix.contains('r'), prefix.contains('f'));
                    return;
                }
                if (prefix == "b" || prefix == "rb" || prefix == "br") {
                    fail("bytes literals are not supported", line, column);
                    return;
                }
            }

            emit(is_keyword(text) ? token_kind::keyword : token_kind::name, std::move(text), line, column);
        }

        void lex_number(int line, int column) {
            std::string text{};
            bool is_float = false;

            if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'o' || peek(1) == 'O' ||
                                  peek(1) == 'b' || peek(1) == 'B')) {
                text.push_back(advance());
                text.push_back(advance());
                while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') {
                    text.push_back(advance());
                }
                emit(token_kind::integer, std::move(text), line, column);
                return;
            }

            while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') {
                text.push_back(advance());
            }
            if (peek() == '.' && peek(1) != '.') {
                is_float = true;
                text.push_back(advance());
                while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') {
                    text.push_back(advance());
                }
            }
            if (peek() == 'e' || peek() == 'E') {
                std::size_t sign = (peek(1) == '+' || peek(1) == '-') ? 1 : 0;
                if (std::isdigit(static_cast<unsigned char>(peek(1 + sign)))) {
                    is_float = true;
                    text.push_back(advance());
                    if (sign) {
                        text.push_back(advance());
                    }
                    while (std::isdigit(static_cast<unsigned char>(peek()))) {
                        text.push_back(advance());
                    }
                }
            }
            if (std::isalpha(static_cast<unsigned char>(peek())) || peek() == '_') {
                fail("invalid numeric literal", line, column);
                return;
            }
            emit(is_float ? token_kind::floating : token_kind::integer, std::move(text), line, column);
        }

        void lex_string(int line, int column, bool raw, bool formatted) {
            char quote = advance();
            bool triple = peek() == quote && peek(1) == quote;
            if (triple) {
                advance();
                advance();
            }

            std::string body{};
            for (;;) {
                if (at_end()) {
                    fail("unterminated string literal", line, column);
                    return;
                }
                char c = peek();
                if (c == '\\') {
                    body.push_back(advance());
                    if (!at_end()) {
                        body.push_back(advance());
                    }
                    continue;
                }
                if (c == '\n' && !triple) {
                    fail("unterminated string literal", line, column);
                    return;
                }
                if (c == quote) {
                    if (!triple) {
                        advance();
                        break;
                    }
                    if (peek(1) == quote && peek(2) == quote) {
                        advance();
                        advance();
                        advance();
                        break;
                    }
                }
                body.push_back(advance());
            }
            // a newline inside a triple-quoted literal is not a logical line start
            at_line_start_ = false;

            if (formatted) {
                // escapes are decoded per literal segment once the fields are split out
                emit(token_kind::fstring, raw ? "r" + body : "e" + body, line, column);
                return;
            }
            if (raw) {
                emit(token_kind::string, std::move(body), line, column);
                return;
            }
            std::string decoded{};
            if (auto bad = decode_escapes(body, decoded)) {
                fail("invalid escape sequence", line, column);
                return;
            }
            emit(token_kind::string, std::move(decoded), line, column);
        }

        void lex_operator(int line, int column) {
            static constexpr std::string_view three[] = {"**=", "//=", "...", ">>=", "<<="};
            static constexpr std::string_view two[] = {
                    "**", "//", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=", "->", ":=", "<<", ">>"};
            static constexpr std::string_view one = "+-*/%()[]{}:,.;<>=@|&^~";

            auto rest = text_.substr(index_);
            for (auto op : three) {
                if (rest.starts_with(op)) {
                    take_operator(op, line, column);
                    return;
                }
            }
            for (auto op : two) {
                if (rest.starts_with(op)) {
                    take_operator(op, line, column);
                    return;
                }
            }
            if (one.find(peek()) != std::string_view::npos) {
                take_operator(rest.substr(0, 1), line, column);
                return;
            }
            std::string message = "unexpected character '";
            message.push_back(peek());
            message.push_back('\'');
            fail(std::move(message), line, column);
        }

        void take_operator(std::string_view op, int line, int column) {
            for (std::size_t i = 0; i < op.size(); ++i) {
                advance();
            }
            char first = op.front();
            if (op.size() == 1) {
                if (first == '(' || first == '[' || first == '{') {
                    ++depth_;
                }
                else if ((first == ')' || first == ']' || first == '}') && depth_ > 0) {
                    --depth_;
                }
            }
            emit(token_kind::op, std::string{op}, line, column);
        }

        std::string_view text_;
        std::size_t index_{0};
        int line_{1};
        int column_{1};
        int depth_{0};
        bool at_line_start_{true};
        std::vector<int> indents_{0};
        std::vector<token> tokens_{};
        std::optional<syntax_failure> error_{};
    };

}  // namespace keel::internal::script
