#pragma once

/// @file error.hpp
/// @brief Error types for ordmap: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: KeyAlreadyExists, DecodeError, EncodeError, TypeError,
///     OutOfRangeError
///   - Via error_code: ordmap::errc enum + ordmap_category() (exception-free)
///
/// Use try_set() / try_decode() for exception-free operation.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace ordmap {

// =====================================================================
// Source position for decode errors
// =====================================================================

/// @brief Position in the encoded text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief ordmap error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Decode errors: malformed text (1-49)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    invalid_escape          = 3,
    invalid_unicode_escape  = 4,
    invalid_number          = 5,
    unterminated_string     = 6,
    unterminated_array      = 7,
    unterminated_object     = 8,
    trailing_content        = 9,
    max_depth_exceeded      = 10,
    invalid_literal         = 11,
    duplicate_field         = 12,

    // Value access and record shape errors (50-59)
    type_mismatch           = 50,
    out_of_range            = 51,
    key_not_found           = 52,
    integer_overflow        = 53,
    conversion_failed       = 54,

    // Container errors (60-69)
    key_already_exists      = 60,

    // Encode errors (70-79)
    non_finite_number       = 70,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class ordmap_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "ordmap";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::unexpected_character:    return "unexpected character";
            case errc::invalid_escape:          return "invalid escape sequence";
            case errc::invalid_unicode_escape:  return "invalid unicode escape";
            case errc::invalid_number:          return "invalid number";
            case errc::unterminated_string:     return "unterminated string";
            case errc::unterminated_array:      return "unterminated array";
            case errc::unterminated_object:     return "unterminated object";
            case errc::trailing_content:        return "trailing content after document";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::invalid_literal:         return "invalid literal";
            case errc::duplicate_field:         return "duplicate field in record";
            case errc::type_mismatch:           return "type mismatch";
            case errc::out_of_range:            return "index out of range";
            case errc::key_not_found:           return "key not found";
            case errc::integer_overflow:        return "integer overflow";
            case errc::conversion_failed:       return "value conversion failed";
            case errc::key_already_exists:      return "key already exists";
            case errc::non_finite_number:       return "NaN or infinity cannot be encoded";
            default:                            return "unknown ordmap error";
        }
    }
};

} // namespace detail

/// @brief Get the ordmap error category singleton.
inline const std::error_category& ordmap_category() noexcept {
    static const detail::ordmap_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from ordmap::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), ordmap_category()};
}

/// @brief Create an error_condition from ordmap::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), ordmap_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Insertion of a key that is already present.
///
/// Thrown by OrderedMap::set() and by decoding when two records share a key.
/// code() compares equal to errc::key_already_exists.
class KeyAlreadyExists : public std::system_error {
public:
    explicit KeyAlreadyExists(std::string key)
        : std::system_error(make_error_code(errc::key_already_exists),
                            "key \"" + key + "\" already exists")
        , key_(std::move(key)) {}

    /// @brief The offending key, rendered as text.
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

    // std::system_error appends ": <category message>"; keep the bare form.
    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string key_;
    std::string message_ = "key \"" + key_ + "\" already exists";
};

/// @brief Malformed encoded input or a record of the wrong shape.
class DecodeError : public std::system_error {
public:
    DecodeError(const std::string& message, SourceLocation loc,
                errc code = errc::unexpected_character)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Record-level error (no text position available).
    DecodeError(const std::string& message, errc code)
        : std::system_error(make_error_code(code), "decode error: " + message) {}

    /// @brief Error position in the source text (defaults for record-level errors).
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "decode error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + ": " + msg;
    }

    SourceLocation location_;
};

/// @brief A value has no representation in the encoded text (NaN, infinity).
class EncodeError : public std::system_error {
public:
    explicit EncodeError(const std::string& msg, errc code = errc::non_finite_number)
        : std::system_error(make_error_code(code), "encode error: " + msg) {}
};

/// @brief Type mismatch error when accessing a wire value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg, errc code = errc::type_mismatch)
        : std::system_error(make_error_code(code), msg) {}
};

/// @brief Out-of-range error (array index or missing key).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg, errc code = errc::out_of_range)
        : std::system_error(make_error_code(code), msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [map, ec] = m.try_set(k, v);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace ordmap

// Register ordmap::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<ordmap::errc> : true_type {};
} // namespace std
