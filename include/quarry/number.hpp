#pragma once

/// @file number.hpp
/// @brief Numeric payload of number tokens and document values.
///
/// A Number is either already converted (integer or float) or lazy: it
/// keeps the raw token text and converts it on first read, caching the
/// result. A lazy conversion failure is reported as a LexError at the
/// coordinate of the original token.

#include "config.hpp"
#include "error.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace quarry {

class Number;

namespace detail {

/// @brief Convert number token text to a Number.
///
/// Integers (no fraction, no exponent) become int64_t when they fit and
/// fall back to double otherwise. Everything else becomes double.
/// @throws LexError (invalid_number, number_out_of_range).
Number convert_number(std::string_view text, Coordinate where);

} // namespace detail

class Number {
public:
    enum class Repr : uint8_t { Integer, Float, Lazy };

    Number() noexcept : repr_(Repr::Integer) { u_.i = 0; }
    explicit Number(int v) noexcept : repr_(Repr::Integer) { u_.i = v; }
    explicit Number(int64_t v) noexcept : repr_(Repr::Integer) { u_.i = v; }
    explicit Number(double v) noexcept : repr_(Repr::Float) { u_.d = v; }

    /// @brief Deferred number; text is converted on first read.
    [[nodiscard]] static Number lazy(std::string text, Coordinate where) {
        Number n;
        n.repr_ = Repr::Lazy;
        n.raw_ = std::move(text);
        n.where_ = where;
        return n;
    }

    /// @brief True while the raw text has not been converted yet.
    [[nodiscard]] bool is_lazy() const noexcept { return repr_ == Repr::Lazy; }

    /// @brief Raw token text of a lazy number (kept after conversion).
    [[nodiscard]] std::string_view raw() const noexcept { return raw_; }

    [[nodiscard]] bool is_integer() const {
        resolve();
        return repr_ == Repr::Integer;
    }

    [[nodiscard]] bool is_float() const {
        resolve();
        return repr_ == Repr::Float;
    }

    /// @throws TypeError if the number has a fractional/exponent form.
    [[nodiscard]] int64_t as_integer() const {
        resolve();
        if (repr_ != Repr::Integer) throw TypeError("number is not an integer");
        return u_.i;
    }

    [[nodiscard]] double as_float() const {
        resolve();
        return repr_ == Repr::Integer ? static_cast<double>(u_.i) : u_.d;
    }

    /// @brief Compares numeric values; integers compare exactly.
    bool operator==(const Number& o) const {
        resolve();
        o.resolve();
        if (repr_ == Repr::Integer && o.repr_ == Repr::Integer) return u_.i == o.u_.i;
        return as_float() == o.as_float();
    }
    bool operator!=(const Number& o) const { return !(*this == o); }

private:
    void resolve() const {
        if (QUARRY_LIKELY(repr_ != Repr::Lazy)) return;
        Number converted = detail::convert_number(raw_, where_);
        repr_ = converted.repr_;
        u_ = converted.u_;
    }

    mutable Repr repr_;
    mutable union {
        int64_t i;
        double d;
    } u_;
    std::string raw_;
    Coordinate where_;
};

namespace detail {

/// @brief Decimal exponent of the leading significant digit of number
/// token text, i.e. floor(log10(|x|)). The exponent part saturates so
/// arbitrarily long exponents cannot overflow. Zero yields INT64_MIN.
inline int64_t decimal_magnitude(std::string_view text) noexcept {
    constexpr int64_t kSaturate = int64_t{1} << 40;
    const auto digit = [&](size_t i) { return i < text.size() && text[i] >= '0' && text[i] <= '9'; };

    size_t i = (!text.empty() && text[0] == '-') ? 1 : 0;
    int64_t significant = 0;   // integer digits from the first nonzero one
    for (; digit(i); ++i) {
        if (significant > 0 || text[i] != '0') ++significant;
    }

    int64_t lead = std::numeric_limits<int64_t>::min();
    if (significant > 0) {
        lead = significant - 1;
    }
    if (i < text.size() && text[i] == '.') {
        int64_t pos = 0;
        for (++i; digit(i); ++i) {
            ++pos;
            if (significant == 0 && lead == std::numeric_limits<int64_t>::min() && text[i] != '0') {
                lead = -pos;
            }
        }
    }
    if (lead == std::numeric_limits<int64_t>::min()) return lead;

    int64_t exponent = 0;
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        bool negative = false;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) negative = text[i++] == '-';
        for (; digit(i); ++i) {
            if (exponent < kSaturate) exponent = exponent * 10 + (text[i] - '0');
        }
        if (negative) exponent = -exponent;
    }
    return lead + exponent;
}

inline Number convert_number(std::string_view text, Coordinate where) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (QUARRY_UNLIKELY(text.empty())) {
        throw LexError("empty number", where, errc::invalid_number);
    }

    const bool integral = text.find_first_of(".eE") == std::string_view::npos;
    if (integral) {
        int64_t iv = 0;
        auto [p, ec] = std::from_chars(first, last, iv);
        if (QUARRY_LIKELY(ec == std::errc{} && p == last)) return Number(iv);
        if (ec != std::errc::result_out_of_range) {
            throw LexError("invalid number '" + std::string(text) + "'", where,
                           errc::invalid_number);
        }
        // Too large for int64_t: fall through to double.
    }

    double dv = 0.0;
    auto [p, ec] = std::from_chars(first, last, dv);
    if (QUARRY_UNLIKELY(ec == std::errc::result_out_of_range)) {
        // Underflow towards zero is representable; overflow is not.
        if (decimal_magnitude(text) < 0) {
            return Number(text[0] == '-' ? -0.0 : 0.0);
        }
        throw LexError("number '" + std::string(text) + "' is out of range", where,
                       errc::number_out_of_range);
    }
    if (QUARRY_UNLIKELY(ec != std::errc{} || p != last)) {
        throw LexError("invalid number '" + std::string(text) + "'", where,
                       errc::invalid_number);
    }
    return Number(dv);
}

} // namespace detail

} // namespace quarry
