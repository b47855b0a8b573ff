#pragma once

/// @file decoder.hpp
/// @brief Byte-to-character decoders (UTF-8 and strict ASCII).
///
/// A decoder turns a ByteSource into a lazy, finite, non-restartable
/// sequence of characters. Each character is assembled in place from the
/// raw byte values (no intermediate string buffer). The decoder never
/// reads further ahead than the bytes of the character it is producing.

#include "byte_source.hpp"
#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "parse_options.hpp"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>

namespace quarry {

/// @brief Lazy character sequence over a byte source.
class Decoder {
public:
    explicit Decoder(ByteSource& source) noexcept : source_(source) {}
    virtual ~Decoder() = default;

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    /// @brief Produce the next character.
    /// @return false at end of input (and on every call after it).
    /// @throws DecodeError on a malformed sequence or byte source failure;
    ///         later calls rethrow the same fault.
    bool next(char32_t& out) {
        if (QUARRY_UNLIKELY(fault_)) std::rethrow_exception(fault_);
        if (QUARRY_UNLIKELY(finished_)) return false;
        try {
            if (!decode(out)) {
                finished_ = true;
                return false;
            }
        } catch (const DecodeError&) {
            fault_ = std::current_exception();
            throw;
        }
        track(out);
        return true;
    }

    /// @brief Bytes consumed from the source so far.
    [[nodiscard]] size_t bytes_consumed() const noexcept { return source_.consumed(); }

    /// @brief Number of characters produced so far.
    [[nodiscard]] size_t chars_produced() const noexcept { return produced_; }

    [[nodiscard]] virtual Encoding encoding() const noexcept = 0;

protected:
    /// @return false on clean end of input.
    virtual bool decode(char32_t& out) = 0;

    /// Pull a raw byte; fails on source failure. Returns false at end.
    bool pull(uint8_t& byte) {
        switch (source_.next(byte)) {
            case ReadStatus::Byte:    return true;
            case ReadStatus::End:     return false;
            case ReadStatus::Failure: break;
        }
        fail("byte source failure", source_.consumed(), errc::stream_failure);
    }

    /// Raise a decode fault at a byte offset, on the line/column of the
    /// character currently being decoded.
    [[noreturn]] QUARRY_NOINLINE void fail(const std::string& msg, size_t byte_offset,
                                           errc code) const {
        Coordinate c = position_;
        c.offset = byte_offset;
        throw DecodeError(msg, c, code);
    }

    static std::string hex(uint8_t byte) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(byte));
        return buf;
    }

private:
    void track(char32_t ch) noexcept {
        ++produced_;
        if (ch == U'\n') {
            ++position_.line;
            position_.column = 1;
        } else {
            ++position_.column;
        }
    }

    ByteSource& source_;
    Coordinate position_;
    size_t produced_ = 0;
    bool finished_ = false;
    std::exception_ptr fault_;
};

// =====================================================================
// UTF-8
// =====================================================================

/// @brief UTF-8 decoder: lead byte pattern selects 1-4 byte sequences,
/// continuation payloads are shifted in six bits at a time.
class Utf8Decoder final : public Decoder {
public:
    using Decoder::Decoder;

    [[nodiscard]] Encoding encoding() const noexcept override { return Encoding::Utf8; }

protected:
    bool decode(char32_t& out) override {
        uint8_t lead = 0;
        if (!pull(lead)) return false;
        const size_t at = bytes_consumed() - 1;

        if (QUARRY_LIKELY(lead < 0x80)) {
            out = static_cast<char32_t>(lead);
            return true;
        }

        const unsigned len = detail::utf8::sequence_length(lead);
        if (QUARRY_UNLIKELY(len == 0)) {
            if (detail::utf8::is_continuation(lead)) {
                fail("unexpected continuation byte " + hex(lead), at,
                     errc::invalid_continuation);
            }
            fail("invalid UTF-8 lead byte " + hex(lead), at, errc::invalid_utf8);
        }

        uint32_t cp = detail::utf8::lead_payload(lead, len);
        for (unsigned i = 1; i < len; ++i) {
            uint8_t byte = 0;
            if (QUARRY_UNLIKELY(!pull(byte))) {
                fail("truncated UTF-8 sequence at end of input", at,
                     errc::truncated_sequence);
            }
            if (QUARRY_UNLIKELY(!detail::utf8::is_continuation(byte))) {
                fail("malformed continuation byte " + hex(byte), at,
                     errc::invalid_continuation);
            }
            cp = detail::utf8::append_continuation(cp, byte);
        }

        if (QUARRY_UNLIKELY(cp < detail::utf8::min_for_length(len))) {
            fail("overlong UTF-8 encoding", at, errc::invalid_utf8);
        }
        if (QUARRY_UNLIKELY(detail::utf8::is_surrogate(cp))) {
            fail("UTF-8 encoded surrogate code point", at, errc::invalid_utf8);
        }
        if (QUARRY_UNLIKELY(cp > 0x10FFFF)) {
            fail("code point beyond U+10FFFF", at, errc::invalid_utf8);
        }
        out = static_cast<char32_t>(cp);
        return true;
    }
};

// =====================================================================
// ASCII
// =====================================================================

/// @brief Strict 7-bit ASCII decoder.
class AsciiDecoder final : public Decoder {
public:
    using Decoder::Decoder;

    [[nodiscard]] Encoding encoding() const noexcept override { return Encoding::Ascii; }

protected:
    bool decode(char32_t& out) override {
        uint8_t byte = 0;
        if (!pull(byte)) return false;
        if (QUARRY_UNLIKELY(byte & 0x80)) {
            fail("non-ASCII byte " + hex(byte), bytes_consumed() - 1,
                 errc::non_ascii_byte);
        }
        out = static_cast<char32_t>(byte);
        return true;
    }
};

/// @brief Create a decoder for the requested encoding.
[[nodiscard]] inline std::unique_ptr<Decoder> make_decoder(ByteSource& source,
                                                           Encoding encoding = Encoding::Utf8) {
    switch (encoding) {
        case Encoding::Ascii: return std::make_unique<AsciiDecoder>(source);
        case Encoding::Utf8:  break;
    }
    return std::make_unique<Utf8Decoder>(source);
}

} // namespace quarry
