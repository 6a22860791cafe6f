#pragma once

/// @file writer.hpp
/// @brief Writer: Value -> encoded text, to a string or an std::ostream.
///
/// Output is always valid RFC 8259 text:
///   - Object fields in stored order, so records come out as Key then Value
///   - Control characters, '"' and '\' escaped; other bytes written as is
///   - Malformed UTF-8 replaced by U+FFFD
///   - NaN and infinity have no encoding and raise EncodeError
///
/// EncodeOptions::indent >= 0 switches to one element per line.

#include "config.hpp"
#include "detail/number.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "value.hpp"

#include <cmath>
#include <ostream>
#include <string>
#include <string_view>

namespace ordmap {

/// @brief Writer options.
struct EncodeOptions {
    int indent = -1;  ///< Spaces per level (-1 = compact, >= 0 = one element per line)
};

namespace detail {

/// @brief Output sink: append to a std::string.
class StringSink {
public:
    explicit StringSink(std::string& out) noexcept : out_(out) {}

    void put(char c) { out_ += c; }
    void put(std::string_view s) { out_.append(s.data(), s.size()); }

private:
    std::string& out_;
};

/// @brief Output sink: an std::ostream behind a 4 KiB staging buffer.
class StreamSink {
public:
    explicit StreamSink(std::ostream& os) : os_(os) { buf_.reserve(kFlushAt); }
    ~StreamSink() { flush(); }

    StreamSink(const StreamSink&) = delete;
    StreamSink& operator=(const StreamSink&) = delete;

    void put(char c) {
        buf_ += c;
        if (ORDMAP_UNLIKELY(buf_.size() >= kFlushAt)) flush();
    }
    void put(std::string_view s) {
        buf_.append(s.data(), s.size());
        if (buf_.size() >= kFlushAt) flush();
    }

    void flush() {
        if (buf_.empty()) return;
        os_.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        buf_.clear();
    }

private:
    static constexpr size_t kFlushAt = 4096;

    std::ostream& os_;
    std::string buf_;
};

template <typename Sink>
class Writer {
public:
    Writer(Sink& sink, const EncodeOptions& opts) noexcept
        : sink_(sink), indent_(opts.indent) {}

    void value(const Value& v) {
        switch (v.type()) {
            case Type::Null:     sink_.put("null"); break;
            case Type::Bool:     sink_.put(v.as_bool() ? "true" : "false"); break;
            case Type::Integer:  integer(v.as_integer()); break;
            case Type::UInteger: uinteger(v.as_uinteger()); break;
            case Type::Float:    floating(v.as_float()); break;
            case Type::String:   string(v.as_string_view()); break;
            case Type::Array:    array(v.as_array()); break;
            case Type::Object:   object(v.as_object()); break;
        }
    }

private:
    Sink& sink_;
    int indent_;
    int level_ = 0;

    bool pretty() const noexcept { return indent_ >= 0; }

    /// Line break plus indentation for the current level (pretty mode only).
    void newline() {
        if (!pretty()) return;
        sink_.put('\n');
        for (int i = 0; i < level_ * indent_; ++i) sink_.put(' ');
    }

    void integer(int64_t i) {
        char buf[24];
        sink_.put(std::string_view(buf, static_cast<size_t>(write_i64(buf, i) - buf)));
    }

    void uinteger(uint64_t u) {
        char buf[24];
        sink_.put(std::string_view(buf, static_cast<size_t>(write_u64(buf, u) - buf)));
    }

    void floating(double d) {
        if (ORDMAP_UNLIKELY(!std::isfinite(d))) {
            throw EncodeError(std::isnan(d) ? "NaN has no encoding"
                                            : "infinity has no encoding");
        }
        char buf[32];
        sink_.put(std::string_view(buf, write_double(buf, d)));
    }

    void string(std::string_view s) {
        static constexpr char kHex[] = "0123456789abcdef";
        sink_.put('"');
        const char* p = s.data();
        const char* const end = p + s.size();
        const char* run = p;
        auto flush_run = [&] {
            if (p > run) sink_.put(std::string_view(run, static_cast<size_t>(p - run)));
        };
        while (p < end) {
            const auto c = static_cast<unsigned char>(*p);
            if (c >= 0x20 && c < 0x80 && c != '"' && c != '\\') {
                ++p;
                continue;
            }
            if (c >= 0x80) {
                const size_t len = utf8::valid_length(p, end);
                if (len > 0) {
                    p += len;
                    continue;
                }
                flush_run();
                sink_.put(utf8::kReplacement);
                run = ++p;
                continue;
            }
            flush_run();
            switch (c) {
                case '"':  sink_.put("\\\""); break;
                case '\\': sink_.put("\\\\"); break;
                case '\b': sink_.put("\\b"); break;
                case '\f': sink_.put("\\f"); break;
                case '\n': sink_.put("\\n"); break;
                case '\r': sink_.put("\\r"); break;
                case '\t': sink_.put("\\t"); break;
                default: {
                    const char esc[6] = {'\\', 'u', '0', '0', kHex[c >> 4], kHex[c & 0xF]};
                    sink_.put(std::string_view(esc, 6));
                }
            }
            run = ++p;
        }
        flush_run();
        sink_.put('"');
    }

    void array(const Array& items) {
        if (items.empty()) {
            sink_.put("[]");
            return;
        }
        sink_.put('[');
        ++level_;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) sink_.put(',');
            newline();
            value(items[i]);
        }
        --level_;
        newline();
        sink_.put(']');
    }

    void object(const Object& fields) {
        if (fields.empty()) {
            sink_.put("{}");
            return;
        }
        sink_.put('{');
        ++level_;
        bool first = true;
        for (const auto& [name, field] : fields) {
            if (!first) sink_.put(',');
            first = false;
            newline();
            string(name);
            sink_.put(pretty() ? std::string_view(": ") : std::string_view(":"));
            value(field);
        }
        --level_;
        newline();
        sink_.put('}');
    }
};

} // namespace detail

/// @brief Encode a Value to a string.
/// @throws EncodeError if the value holds NaN or infinity.
[[nodiscard]] inline std::string write(const Value& value, const EncodeOptions& opts = {}) {
    std::string text;
    detail::StringSink sink(text);
    detail::Writer<detail::StringSink>(sink, opts).value(value);
    return text;
}

/// @brief Encode a Value to an ostream.
///
/// On EncodeError the text written before the failing number has already
/// reached the stream.
inline void write(std::ostream& os, const Value& value, const EncodeOptions& opts = {}) {
    detail::StreamSink sink(os);
    detail::Writer<detail::StreamSink>(sink, opts).value(value);
}

inline std::ostream& operator<<(std::ostream& os, const Value& value) {
    write(os, value);
    return os;
}

inline std::string Value::dump(int indent) const {
    EncodeOptions opts;
    opts.indent = indent;
    return write(*this, opts);
}

} // namespace ordmap
