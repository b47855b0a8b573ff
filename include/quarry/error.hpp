#pragma once

/// @file error.hpp
/// @brief Fault types for quarry: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: DecodeError, ScanError, LexError, SyntaxError (default)
///   - Via error_code: quarry::errc enum + quarry_category() (exception-free)
///
/// Every pipeline fault carries the Coordinate at which it was detected.
/// Faults propagate upward unchanged: no stage wraps or recovers a fault
/// raised by the stage below it.

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace quarry {

// =====================================================================
// Source coordinates
// =====================================================================

/// @brief Position in the source input.
///
/// line and column are 1-based and derive from newline tracking; offset is
/// the authoritative 0-based count of characters (bytes for decode faults).
struct Coordinate {
    size_t line   = 1;
    size_t column = 1;
    size_t offset = 0;

    [[nodiscard]] std::string to_string() const {
        return "line " + std::to_string(line) + ", column " +
               std::to_string(column) + " (offset " + std::to_string(offset) + ")";
    }

    bool operator==(const Coordinate& o) const noexcept {
        return line == o.line && column == o.column && offset == o.offset;
    }
    bool operator!=(const Coordinate& o) const noexcept { return !(*this == o); }

    /// Coordinates are ordered by offset alone.
    bool operator<(const Coordinate& o) const noexcept { return offset < o.offset; }
};

inline std::ostream& operator<<(std::ostream& os, const Coordinate& c) {
    return os << c.line << ':' << c.column << '@' << c.offset;
}

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief quarry error codes for std::error_code integration.
///
/// Ranges identify the pipeline stage that raised the fault.
enum class errc : int {
    ok = 0,

    // Decode faults (1-19)
    invalid_utf8             = 1,
    invalid_continuation     = 2,
    truncated_sequence       = 3,
    non_ascii_byte           = 4,
    stream_failure           = 5,
    invalid_file             = 6,

    // Scan faults (20-39)
    end_of_input             = 20,
    pushback_underflow       = 21,

    // Lexical faults (40-59)
    unexpected_character     = 40,
    unterminated_string      = 41,
    invalid_escape           = 42,
    invalid_unicode_escape   = 43,
    invalid_number           = 44,
    number_out_of_range      = 45,
    invalid_literal          = 46,
    control_character        = 47,

    // Syntax faults (60-79)
    unexpected_token         = 60,
    unexpected_end_of_input  = 61,
    trailing_content         = 62,
    max_depth_exceeded       = 63,
    duplicate_key            = 64,
    invalid_root             = 65,

    // Value access errors (80-99)
    type_mismatch            = 80,
    out_of_range             = 81,
    key_not_found            = 82,
    invalid_pointer          = 83,
};

/// @brief Pipeline stage that raised a fault.
enum class FaultKind : uint8_t {
    Decode,
    Scan,
    Lexical,
    Syntax,
    Value
};

inline const char* fault_kind_name(FaultKind k) noexcept {
    switch (k) {
        case FaultKind::Decode:  return "decode";
        case FaultKind::Scan:    return "scan";
        case FaultKind::Lexical: return "lexical";
        case FaultKind::Syntax:  return "syntax";
        case FaultKind::Value:   return "value";
    }
    return "unknown";
}

/// @brief Map an error code to the stage that owns it.
inline FaultKind fault_kind_of(errc e) noexcept {
    const int v = static_cast<int>(e);
    if (v < 20) return FaultKind::Decode;
    if (v < 40) return FaultKind::Scan;
    if (v < 60) return FaultKind::Lexical;
    if (v < 80) return FaultKind::Syntax;
    return FaultKind::Value;
}

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class quarry_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "quarry";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::invalid_utf8:            return "invalid UTF-8 encoding";
            case errc::invalid_continuation:    return "malformed UTF-8 continuation byte";
            case errc::truncated_sequence:      return "truncated UTF-8 sequence";
            case errc::non_ascii_byte:          return "byte outside the ASCII range";
            case errc::stream_failure:          return "failure in the underlying byte source";
            case errc::invalid_file:            return "cannot open input file";
            case errc::end_of_input:            return "end of input reached";
            case errc::pushback_underflow:      return "nothing to push back";
            case errc::unexpected_character:    return "unexpected character";
            case errc::unterminated_string:     return "unterminated string";
            case errc::invalid_escape:          return "invalid escape sequence";
            case errc::invalid_unicode_escape:  return "invalid unicode escape";
            case errc::invalid_number:          return "invalid number";
            case errc::number_out_of_range:     return "number out of representable range";
            case errc::invalid_literal:         return "invalid literal";
            case errc::control_character:       return "unescaped control character in string";
            case errc::unexpected_token:        return "unexpected token";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::trailing_content:        return "trailing content after root value";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::duplicate_key:           return "duplicate key";
            case errc::invalid_root:            return "root value must be an object or an array";
            case errc::type_mismatch:           return "type mismatch";
            case errc::out_of_range:            return "index out of range";
            case errc::key_not_found:           return "key not found";
            case errc::invalid_pointer:         return "invalid JSON pointer";
            default:                            return "unknown quarry error";
        }
    }
};

} // namespace detail

/// @brief Get the quarry error category singleton.
inline const std::error_category& quarry_category() noexcept {
    static const detail::quarry_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from quarry::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), quarry_category()};
}

/// @brief Create an error_condition from quarry::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), quarry_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Base of every pipeline fault: { kind, coordinate, message }.
class Fault : public std::system_error {
public:
    Fault(const std::string& message, Coordinate coord, errc code)
        : std::system_error(make_error_code(code), format_message(message, coord, code))
        , message_(message)
        , coordinate_(coord)
        , code_(code) {}

    [[nodiscard]] FaultKind kind() const noexcept { return fault_kind_of(code_); }

    /// @brief Position at which the fault was detected.
    [[nodiscard]] const Coordinate& coordinate() const noexcept { return coordinate_; }

    /// @brief Message without the coordinate prefix.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] errc error() const noexcept { return code_; }

private:
    static std::string format_message(const std::string& msg,
                                      const Coordinate& coord, errc code) {
        return std::string(fault_kind_name(fault_kind_of(code))) + " fault at line " +
               std::to_string(coord.line) + ", column " +
               std::to_string(coord.column) + ": " + msg;
    }

    std::string message_;
    Coordinate coordinate_;
    errc code_;
};

/// @brief Malformed byte sequence, unsupported byte or byte source failure.
class DecodeError : public Fault {
public:
    DecodeError(const std::string& message, Coordinate coord,
                errc code = errc::invalid_utf8)
        : Fault(message, coord, code) {}
};

/// @brief Scanner misuse or exhaustion in the middle of an operation.
class ScanError : public Fault {
public:
    ScanError(const std::string& message, Coordinate coord,
              errc code = errc::end_of_input)
        : Fault(message, coord, code) {}
};

/// @brief Token-level fault: bad string, number, escape or keyword.
class LexError : public Fault {
public:
    LexError(const std::string& message, Coordinate coord,
             errc code = errc::unexpected_character)
        : Fault(message, coord, code) {}
};

/// @brief Token class the parser was waiting for when it failed.
enum class Expectation : uint8_t {
    Value,
    KeyOrObjectEnd,
    Key,
    Colon,
    CommaOrObjectEnd,
    ValueOrArrayEnd,
    CommaOrArrayEnd,
    EndOfInput
};

inline const char* expectation_name(Expectation e) noexcept {
    switch (e) {
        case Expectation::Value:            return "value";
        case Expectation::KeyOrObjectEnd:   return "string key or '}'";
        case Expectation::Key:              return "string key";
        case Expectation::Colon:            return "':'";
        case Expectation::CommaOrObjectEnd: return "',' or '}'";
        case Expectation::ValueOrArrayEnd:  return "value or ']'";
        case Expectation::CommaOrArrayEnd:  return "',' or ']'";
        case Expectation::EndOfInput:       return "end of input";
    }
    return "unknown";
}

/// @brief Grammar violation at a token.
class SyntaxError : public Fault {
public:
    SyntaxError(const std::string& message, Coordinate coord,
                Expectation expected, errc code = errc::unexpected_token)
        : Fault(message, coord, code)
        , expected_(expected) {}

    /// @brief What the parser state machine would have accepted.
    [[nodiscard]] Expectation expected() const noexcept { return expected_; }

private:
    Expectation expected_;
};

/// @brief Type mismatch error when accessing a value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Out-of-range error (array index, missing key or bad pointer).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg,
                             errc code = errc::out_of_range)
        : std::system_error(make_error_code(code), msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code + fault coordinate.
/// Usage: auto [val, ec, where] = quarry::try_parse(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;
    Coordinate coordinate;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace quarry

// Register quarry::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<quarry::errc> : true_type {};
} // namespace std
