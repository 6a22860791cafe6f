#pragma once

/// @file reader.hpp
/// @brief Strict RFC 8259 reader: encoded text -> Value.
///
/// One recursive-descent pass over the input. Every failure is a
/// DecodeError carrying the line and column where reading stopped, and
/// nothing is returned unless the whole document was consumed.

#include "config.hpp"
#include "decode_options.hpp"
#include "detail/number.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "value.hpp"

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace ordmap {
namespace detail {

class Reader {
public:
    Reader(std::string_view text, const DecodeOptions& opts) noexcept
        : text_(text)
        , allow_duplicate_fields_(opts.allow_duplicate_fields)
        , depth_limit_(opts.max_depth > 0 ? opts.max_depth : ORDMAP_MAX_DEPTH) {}

    /// @brief The single value that makes up the whole text.
    Value document() {
        Value v = value();
        skip_space();
        if (ORDMAP_UNLIKELY(!at_end())) fail(errc::trailing_content, "unexpected trailing content");
        return v;
    }

private:
    std::string_view text_;
    size_t pos_ = 0;
    bool allow_duplicate_fields_;
    size_t depth_limit_;
    size_t depth_ = 0;

    // ─── Cursor ───────────────────────────────────────────────────────────

    bool at_end() const noexcept { return pos_ >= text_.size(); }
    char peek() const noexcept { return text_[pos_]; }

    void skip_space() noexcept {
        while (!at_end()) {
            const char c = peek();
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return;
            ++pos_;
        }
    }

    /// Consume c if it is next; otherwise leave the cursor alone.
    bool eat(char c) noexcept {
        if (!at_end() && peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    // ─── Failure ──────────────────────────────────────────────────────────

    [[noreturn]] ORDMAP_NOINLINE void fail(errc code, const std::string& what) const {
        SourceLocation loc;
        loc.offset = pos_;
        for (size_t i = 0; i < pos_; ++i) {
            if (text_[i] == '\n') {
                ++loc.line;
                loc.column = 1;
            } else {
                ++loc.column;
            }
        }
        throw DecodeError(what, loc, code);
    }

    [[noreturn]] void fail_here() const {
        if (at_end()) fail(errc::unexpected_end_of_input, "unexpected end of input");
        fail(errc::unexpected_character, std::string("unexpected character '") + peek() + "'");
    }

    /// Tracks one level of array/object nesting for the lifetime of the guard.
    class Nesting {
    public:
        explicit Nesting(Reader& r) : r_(r) {
            if (ORDMAP_UNLIKELY(++r_.depth_ > r_.depth_limit_)) {
                r_.fail(errc::max_depth_exceeded, "maximum nesting depth exceeded");
            }
        }
        ~Nesting() { --r_.depth_; }
        Nesting(const Nesting&) = delete;
        Nesting& operator=(const Nesting&) = delete;

    private:
        Reader& r_;
    };

    // ─── Values ───────────────────────────────────────────────────────────

    Value value() {
        skip_space();
        if (ORDMAP_UNLIKELY(at_end())) fail_here();
        const char c = peek();
        if (c == '{') return object();
        if (c == '[') return array();
        if (c == '"') return Value(string());
        if (c == '-' || (c >= '0' && c <= '9')) return number();
        if (literal("null"))  return Value(nullptr);
        if (literal("true"))  return Value(true);
        if (literal("false")) return Value(false);
        if (c == 'n' || c == 't' || c == 'f') fail(errc::invalid_literal, "invalid literal");
        fail_here();
    }

    bool literal(std::string_view word) noexcept {
        if (text_.compare(pos_, word.size(), word) != 0) return false;
        pos_ += word.size();
        return true;
    }

    Value array() {
        Nesting guard(*this);
        ++pos_;  // '['
        Array items;
        skip_space();
        if (eat(']')) return Value(std::move(items));
        for (;;) {
            items.push_back(value());
            skip_space();
            if (eat(',')) continue;
            if (eat(']')) return Value(std::move(items));
            if (at_end()) fail(errc::unterminated_array, "unterminated array");
            fail(errc::unexpected_character, "expected ',' or ']' in array");
        }
    }

    Value object() {
        Nesting guard(*this);
        ++pos_;  // '{'
        Object fields;
        skip_space();
        if (eat('}')) return Value(std::move(fields));
        for (;;) {
            skip_space();
            if (ORDMAP_UNLIKELY(at_end() || peek() != '"')) {
                fail(errc::unterminated_object, "expected string key in object");
            }
            std::string name = string();
            skip_space();
            if (ORDMAP_UNLIKELY(!eat(':'))) {
                if (at_end()) fail(errc::unterminated_object, "unterminated object");
                fail(errc::unexpected_character, "expected ':' after field name");
            }
            Value field = value();

            if (Value* seen = fields.find(name)) {
                if (!allow_duplicate_fields_) {
                    fail(errc::duplicate_field, "duplicate field: \"" + name + "\"");
                }
                // The later value replaces the earlier one in place.
                *seen = std::move(field);
            } else {
                fields.emplace_back(std::move(name), std::move(field));
            }

            skip_space();
            if (eat(',')) continue;
            if (eat('}')) return Value(std::move(fields));
            if (at_end()) fail(errc::unterminated_object, "unterminated object");
            fail(errc::unexpected_character, "expected ',' or '}' in object");
        }
    }

    // ─── Strings ──────────────────────────────────────────────────────────

    std::string string() {
        ++pos_;  // opening quote
        std::string out;
        for (;;) {
            const size_t run = pos_;
            while (!at_end()) {
                const auto c = static_cast<unsigned char>(peek());
                if (c == '"' || c == '\\' || c < 0x20) break;
                ++pos_;
            }
            out.append(text_, run, pos_ - run);
            if (ORDMAP_UNLIKELY(at_end())) fail(errc::unterminated_string, "unterminated string");

            const char c = text_[pos_++];
            if (c == '"') return out;
            if (c == '\\') {
                escape(out);
                continue;
            }
            --pos_;
            fail(errc::unexpected_character, "unescaped control character in string");
        }
    }

    void escape(std::string& out) {
        if (ORDMAP_UNLIKELY(at_end())) fail(errc::invalid_escape, "unterminated escape sequence");
        const char c = text_[pos_++];
        switch (c) {
            case '"':  out += '"';  break;
            case '\\': out += '\\'; break;
            case '/':  out += '/';  break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u':  unicode_escape(out); break;
            default:
                fail(errc::invalid_escape, std::string("invalid escape '\\") + c + "'");
        }
    }

    uint32_t hex4() {
        if (ORDMAP_UNLIKELY(text_.size() - pos_ < 4)) {
            fail(errc::invalid_unicode_escape, "incomplete unicode escape");
        }
        uint32_t v = 0;
        const char* first = text_.data() + pos_;
        auto [last, ec] = std::from_chars(first, first + 4, v, 16);
        if (ORDMAP_UNLIKELY(ec != std::errc{} || last != first + 4)) {
            fail(errc::invalid_unicode_escape, "invalid hex digit in unicode escape");
        }
        pos_ += 4;
        return v;
    }

    void unicode_escape(std::string& out) {
        uint32_t cp = hex4();
        if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail(errc::invalid_unicode_escape, "unexpected low surrogate");
        }
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (ORDMAP_UNLIKELY(text_.compare(pos_, 2, "\\u") != 0)) {
                fail(errc::invalid_unicode_escape, "missing low surrogate");
            }
            pos_ += 2;
            const uint32_t low = hex4();
            if (ORDMAP_UNLIKELY(low < 0xDC00 || low > 0xDFFF)) {
                fail(errc::invalid_unicode_escape, "invalid low surrogate value");
            }
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
        }
        utf8::append(out, cp);
    }

    // ─── Numbers ──────────────────────────────────────────────────────────

    void digits(const char* what) {
        if (ORDMAP_UNLIKELY(at_end() || peek() < '0' || peek() > '9')) {
            fail(errc::invalid_number, what);
        }
        while (!at_end() && peek() >= '0' && peek() <= '9') ++pos_;
    }

    /// Integers that fit int64_t or uint64_t stay exact; everything else
    /// (fractions, exponents, wider integers) becomes a double.
    Value number() {
        const size_t start = pos_;
        const bool negative = eat('-');
        if (!at_end() && peek() == '0') {
            ++pos_;
            if (ORDMAP_UNLIKELY(!at_end() && peek() >= '0' && peek() <= '9')) {
                fail(errc::invalid_number, "leading zeros are not allowed");
            }
        } else {
            digits("invalid number");
        }
        bool integral = true;
        if (eat('.')) {
            integral = false;
            digits("expected digit after decimal point");
        }
        if (eat('e') || eat('E')) {
            integral = false;
            if (!eat('+')) eat('-');
            digits("expected digit in exponent");
        }

        const char* first = text_.data() + start;
        const char* last = text_.data() + pos_;
        if (integral) {
            if (negative) {
                int64_t i = 0;
                auto [p, ec] = std::from_chars(first, last, i);
                if (ec == std::errc{} && p == last) return Value(i);
            } else {
                uint64_t u = 0;
                auto [p, ec] = std::from_chars(first, last, u);
                if (ec == std::errc{} && p == last) {
                    if (u <= static_cast<uint64_t>(INT64_MAX)) return Value(static_cast<int64_t>(u));
                    return Value(u);
                }
            }
        }
        auto d = read_double(first, last);
        if (ORDMAP_UNLIKELY(!d)) fail(errc::invalid_number, "number out of range");
        return Value(*d);
    }
};

} // namespace detail

/// @brief Read an encoded document into a Value.
/// @throws DecodeError on malformed input.
[[nodiscard]] inline Value read(std::string_view input, const DecodeOptions& opts = {}) {
    return detail::Reader(input, opts).document();
}

} // namespace ordmap
