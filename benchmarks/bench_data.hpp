#pragma once

/// @file bench_data.hpp
/// @brief Seeded synthetic documents shared by the benchmark executables.
///
/// Every generator is deterministic for a given seed, so repeated runs and
/// competing libraries see identical bytes. The documents are shaped to
/// stress one pipeline stage each: escapes and multibyte text for the
/// decoder, long digit runs for number conversion, newlines for coordinate
/// tracking, nesting for the grammar stack and event paths.

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace corpus {

/// splitmix64 generator.
class Rng {
public:
    explicit Rng(uint64_t seed) : state_(seed) {}

    uint64_t next() {
        uint64_t z = (state_ += 0x9E3779B97F4A7C15ull);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
        return z ^ (z >> 31);
    }

    uint64_t below(uint64_t n) { return next() % n; }

    /// Uniform in [0, 1).
    double unit() { return static_cast<double>(next() >> 11) * 0x1.0p-53; }

private:
    uint64_t state_;
};

namespace detail {

inline void put_double(std::string& out, double v, int digits) {
    char buf[40];
    const int n = std::snprintf(buf, sizeof(buf), "%.*g", digits, v);
    if (n > 0) out.append(buf, static_cast<size_t>(n));
}

inline void put_hex(std::string& out, uint64_t v, int width) {
    static const char kHex[] = "0123456789abcdef";
    for (int shift = (width - 1) * 4; shift >= 0; shift -= 4) out += kHex[(v >> shift) & 0xF];
}

} // namespace detail

// ─── Documents ──────────────────────────────────────────────────────────────

/// Warehouse stock records: mixed scalars, short arrays, escaped notes.
inline std::string inventory(size_t records, uint64_t seed = 7) {
    static const char* const kNotes[] = {
        "stack max 4 high",
        "fragile \\\"glass\\\" shelving",
        "ships with \\u00e9tag\\u00e8re brackets",
        "line 1\\nline 2\\ttabbed",
        "C:\\\\stock\\\\north",
    };
    Rng rng(seed);
    std::string s = "{\"warehouse\":\"north-7\",\"records\":[";
    for (size_t i = 0; i < records; ++i) {
        if (i) s += ',';
        s += "{\"sku\":\"Q-";
        detail::put_hex(s, rng.next(), 6);
        s += "\",\"bin\":[" + std::to_string(rng.below(40)) + ',' +
             std::to_string(rng.below(200)) + ',' + std::to_string(rng.below(6)) + ']';
        s += ",\"on_hand\":" + std::to_string(rng.below(5000));
        s += ",\"unit_cost\":";
        detail::put_double(s, 0.25 + rng.unit() * 400.0, 6);
        s += ",\"hazard\":";
        s += rng.below(9) == 0 ? "true" : "false";
        s += ",\"note\":\"";
        s += kNotes[rng.below(sizeof(kNotes) / sizeof(kNotes[0]))];
        s += "\",\"supplier\":";
        s += rng.below(4) == 0 ? std::string("null")
                               : "\"vendor-" + std::to_string(rng.below(90)) + "\"";
        s += '}';
    }
    s += "],\"count\":" + std::to_string(records) + '}';
    return s;
}

/// Sensor samples dominated by full-precision floats and large integers.
inline std::string telemetry(size_t samples, uint64_t seed = 11) {
    Rng rng(seed);
    std::string s = "[";
    int64_t ts = 1760000000000;
    for (size_t i = 0; i < samples; ++i) {
        if (i) s += ',';
        ts += static_cast<int64_t>(250 + rng.below(20));
        s += "{\"ts\":" + std::to_string(ts) + ",\"seq\":" + std::to_string(i);
        s += ",\"lat\":";
        detail::put_double(s, 51.0 + rng.unit(), 17);
        s += ",\"lon\":";
        detail::put_double(s, -0.5 + rng.unit(), 17);
        s += ",\"alt\":";
        detail::put_double(s, rng.unit() * 1.0e3, 4);
        s += ",\"temps\":[";
        for (int k = 0; k < 6; ++k) {
            if (k) s += ',';
            detail::put_double(s, -20.0 + rng.unit() * 60.0, 17);
        }
        s += "]}";
    }
    return s + ']';
}

/// Labels in several scripts, raw UTF-8 and \u escapes with surrogate pairs.
inline std::string multilingual(size_t entries, uint64_t seed = 13) {
    static const char* const kPhrases[] = {
        "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82, \xD0\xBC\xD0\xB8\xD1\x80",
        "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E\xE3\x81\xAE\xE3\x83\x86\xE3\x82\xAD\xE3\x82\xB9\xE3\x83\x88",
        "\xCE\x9A\xCE\xB1\xCE\xBB\xCE\xB7\xCE\xBC\xCE\xAD\xCF\x81\xCE\xB1",
        "caf\xC3\xA9 cr\xC3\xA8me br\xC3\xBBl\xC3\xA9" "e",
        "emoji \xF0\x9F\x9A\x80 \xF0\x9F\x8C\x8D",
        "escaped \\u0416\\u0443\\u043a \\ud83d\\ude00",
    };
    static const char* const kLangs[] = {"ru", "ja", "el", "fr", "xx", "mixed"};
    Rng rng(seed);
    std::string s = "[";
    for (size_t i = 0; i < entries; ++i) {
        if (i) s += ',';
        const auto pick = rng.below(6);
        s += "{\"lang\":\"";
        s += kLangs[pick];
        s += "\",\"text\":\"";
        s += kPhrases[pick];
        s += "\"}";
    }
    return s + ']';
}

/// Alternating object/array nesting, `levels` containers deep.
inline std::string nesting(int levels) {
    std::string s;
    for (int i = 0; i < levels; ++i) s += (i % 2 == 0) ? "{\"d\":" : "[";
    s += "0";
    for (int i = levels - 1; i >= 0; --i) s += (i % 2 == 0) ? "}" : "]";
    return s;
}

/// One object with `fields` members under scattered hex keys.
inline std::string wide_object(size_t fields, uint64_t seed = 17) {
    Rng rng(seed);
    std::string s = "{";
    for (size_t i = 0; i < fields; ++i) {
        if (i) s += ',';
        s += "\"f";
        detail::put_hex(s, rng.next(), 8);
        s += '_' + std::to_string(i) + "\":" + std::to_string(i);
    }
    return s + '}';
}

/// Key of member `index` in wide_object(fields, seed).
inline std::string wide_object_key(size_t index, uint64_t seed = 17) {
    Rng rng(seed);
    uint64_t v = 0;
    for (size_t i = 0; i <= index; ++i) v = rng.next();
    std::string k = "f";
    detail::put_hex(k, v, 8);
    return k + '_' + std::to_string(index);
}

/// Re-indent a compact document: newline plus two spaces per level after
/// every '{', '[' and ','. String contents are left untouched.
inline std::string spread(const std::string& compact) {
    std::string out;
    out.reserve(compact.size() * 2);
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    const auto newline = [&] {
        out += '\n';
        out.append(static_cast<size_t>(depth) * 2, ' ');
    };
    for (char c : compact) {
        if (in_string) {
            out += c;
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') in_string = false;
            continue;
        }
        switch (c) {
            case '"': in_string = true; out += c; break;
            case '{': case '[': out += c; ++depth; newline(); break;
            case '}': case ']': --depth; newline(); out += c; break;
            case ',': out += c; newline(); break;
            case ':': out += ": "; break;
            default: out += c;
        }
    }
    return out;
}

// ─── Message batches ────────────────────────────────────────────────────────

/// Small request messages, as read one per line from a socket.
inline std::vector<std::string> requests(size_t count, uint64_t seed = 19) {
    static const char* const kMethods[] = {"sensor.report", "sensor.config", "node.ping"};
    Rng rng(seed);
    std::vector<std::string> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::string m = "{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(i) + ",\"method\":\"";
        m += kMethods[rng.below(3)];
        m += "\",\"params\":{\"node\":\"n";
        detail::put_hex(m, rng.next(), 4);
        m += "\",\"value\":";
        detail::put_double(m, rng.unit() * 100.0, 5);
        m += ",\"ok\":";
        m += rng.below(2) ? "true" : "false";
        m += "}}";
        out.push_back(std::move(m));
    }
    return out;
}

/// The same batch with every third message cut short.
inline std::vector<std::string> damaged(std::vector<std::string> batch) {
    for (size_t i = 0; i < batch.size(); i += 3) batch[i].resize(batch[i].size() * 2 / 3);
    return batch;
}

inline size_t byte_count(const std::vector<std::string>& batch) {
    size_t n = 0;
    for (const auto& m : batch) n += m.size();
    return n;
}

} // namespace corpus
