#pragma once

/// @file decode_options.hpp
/// @brief Reader configuration for encoded containers.
///
/// The reader always accepts RFC 8259 text only. The options cover what
/// the records format leaves open: a field repeated inside one record, and
/// how deep a value may nest.

#include <cstddef>

namespace ordmap {

struct DecodeOptions {
    /// Allow the same field twice inside one object (last value wins).
    /// Duplicate container keys across records are always rejected.
    bool allow_duplicate_fields = true;

    /// Maximum nesting depth (0 = use ORDMAP_MAX_DEPTH)
    size_t max_depth = 0;

    /// Repeated fields inside an object are an error.
    static constexpr DecodeOptions strict() noexcept {
        DecodeOptions opts;
        opts.allow_duplicate_fields = false;
        return opts;
    }
};

} // namespace ordmap
