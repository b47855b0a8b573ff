#pragma once

/// @file parse_options.hpp
/// @brief Run-time configuration of the decode/scan/lex/parse pipeline.

#include <cstddef>
#include <cstdint>

namespace quarry {

/// @brief Character encoding of the byte source.
enum class Encoding : uint8_t {
    Utf8,   ///< UTF-8, 1-4 bytes per character (default)
    Ascii   ///< Strict 7-bit ASCII; any byte >= 0x80 is a decode fault
};

/// @brief When number tokens are converted to numeric values.
enum class NumericMode : uint8_t {
    Eager,  ///< Convert at lex time; malformed/out-of-range text faults immediately
    Lazy    ///< Keep the raw text; convert and cache on first read
};

/// @brief Pipeline configuration.
struct ParseOptions {
    // ─── Input ───────────────────────────────────────────────────────────

    /// Encoding used to decode the byte source.
    Encoding encoding = Encoding::Utf8;

    // ─── Lexing ──────────────────────────────────────────────────────────

    /// Number conversion strategy.
    NumericMode numerics = NumericMode::Eager;

    // ─── Grammar ─────────────────────────────────────────────────────────

    /// Allow duplicate keys in objects (last value wins).
    /// When false, a repeated key is a syntax fault at the repeated key.
    bool allow_duplicate_keys = true;

    /// Require the root value to be an object or an array.
    bool require_container_root = false;

    // ─── Limits ──────────────────────────────────────────────────────────

    /// Maximum nesting depth (0 = use the value from config.hpp)
    size_t max_depth = 0;

    // ─── Factory methods ─────────────────────────────────────────────────

    /// Strict JSON over UTF-8 with eager numbers.
    static constexpr ParseOptions strict() noexcept {
        return {};
    }

    /// Deferred number conversion.
    static constexpr ParseOptions lazy() noexcept {
        ParseOptions opts;
        opts.numerics = NumericMode::Lazy;
        return opts;
    }

    /// 7-bit ASCII input.
    static constexpr ParseOptions ascii() noexcept {
        ParseOptions opts;
        opts.encoding = Encoding::Ascii;
        return opts;
    }
};

} // namespace quarry
