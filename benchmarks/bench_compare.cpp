/// @file bench_compare.cpp
/// @brief quarry against Boost.JSON, RapidJSON, nlohmann/json and simdjson,
///        restricted to the three things quarry does differently.
///
/// Scenarios:
///   1. Event stream vs SAX readers (quarry, RapidJSON, nlohmann/json)
///   2. Eager vs deferred number conversion (quarry, RapidJSON, simdjson)
///   3. Chunked stream input (quarry, Boost.JSON, RapidJSON, nlohmann/json)
///
/// Every library reads the same corpus:: documents and does the same amount
/// of work with the result, so the numbers are comparable within a section.

#include <benchmark/benchmark.h>

// ─── quarry ──────────────────────────────────────────────────────────────────
#include <quarry/quarry.hpp>

// ─── Boost.JSON ──────────────────────────────────────────────────────────────
#include <boost/json.hpp>

// ─── RapidJSON ───────────────────────────────────────────────────────────────
#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/reader.h>

// ─── nlohmann/json ───────────────────────────────────────────────────────────
#include <nlohmann/json.hpp>

// ─── simdjson ────────────────────────────────────────────────────────────────
#include <simdjson.h>

#include "bench_data.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <string>
#include <system_error>

// ═══════════════════════════════════════════════════════════════════════════════
// 1. EVENT STREAM VS SAX READERS
// ═══════════════════════════════════════════════════════════════════════════════
//
// Each reader counts scalars and keys; no tree is built.

namespace {

struct Tally {
    size_t keys = 0;
    size_t scalars = 0;
};

struct RapidTally : rapidjson::BaseReaderHandler<rapidjson::UTF8<>, RapidTally> {
    Tally t;
    bool Key(const char*, rapidjson::SizeType, bool) { ++t.keys; return true; }
    bool StartObject() { return true; }
    bool EndObject(rapidjson::SizeType) { return true; }
    bool StartArray() { return true; }
    bool EndArray(rapidjson::SizeType) { return true; }
    bool Default() { ++t.scalars; return true; }
};

struct NlohmannTally : nlohmann::json_sax<nlohmann::json> {
    Tally t;
    bool null() override { ++t.scalars; return true; }
    bool boolean(bool) override { ++t.scalars; return true; }
    bool number_integer(number_integer_t) override { ++t.scalars; return true; }
    bool number_unsigned(number_unsigned_t) override { ++t.scalars; return true; }
    bool number_float(number_float_t, const string_t&) override { ++t.scalars; return true; }
    bool string(string_t&) override { ++t.scalars; return true; }
    bool binary(binary_t&) override { ++t.scalars; return true; }
    bool key(string_t&) override { ++t.keys; return true; }
    bool start_object(std::size_t) override { return true; }
    bool end_object() override { return true; }
    bool start_array(std::size_t) override { return true; }
    bool end_array() override { return true; }
    bool parse_error(std::size_t, const std::string&, const nlohmann::detail::exception&) override {
        return false;
    }
};

void tally_bytes(benchmark::State& st, size_t bytes, const Tally& t) {
    st.SetBytesProcessed(st.iterations() * static_cast<int64_t>(bytes));
    st.counters["keys"] = static_cast<double>(t.keys);
    st.counters["scalars"] = static_cast<double>(t.scalars);
}

} // namespace

static void BM_Events_QuarryPush(benchmark::State& st, const std::string& in) {
    Tally t;
    for (auto _ : st) {
        t = Tally{};
        quarry::parse_events(in, [&t](const quarry::Event& e) {
            if (e.kind == quarry::EventKind::Key) ++t.keys;
            else if (e.kind == quarry::EventKind::Scalar) ++t.scalars;
        });
        benchmark::DoNotOptimize(t);
    }
    tally_bytes(st, in.size(), t);
}
BENCHMARK_CAPTURE(BM_Events_QuarryPush, inventory, corpus::inventory(2000));
BENCHMARK_CAPTURE(BM_Events_QuarryPush, multilingual, corpus::multilingual(4000));

static void BM_Events_QuarryPull(benchmark::State& st, const std::string& in) {
    Tally t;
    for (auto _ : st) {
        t = Tally{};
        quarry::EventReader reader(in);
        while (const quarry::Event* e = reader.next()) {
            if (e->kind == quarry::EventKind::Key) ++t.keys;
            else if (e->kind == quarry::EventKind::Scalar) ++t.scalars;
        }
        benchmark::DoNotOptimize(t);
    }
    tally_bytes(st, in.size(), t);
}
BENCHMARK_CAPTURE(BM_Events_QuarryPull, inventory, corpus::inventory(2000));
BENCHMARK_CAPTURE(BM_Events_QuarryPull, multilingual, corpus::multilingual(4000));

static void BM_Events_RapidReader(benchmark::State& st, const std::string& in) {
    Tally t;
    for (auto _ : st) {
        RapidTally handler;
        rapidjson::Reader reader;
        rapidjson::StringStream ss(in.c_str());
        if (reader.Parse(ss, handler).IsError()) st.SkipWithError("rapidjson parse error");
        t = handler.t;
        benchmark::DoNotOptimize(t);
    }
    tally_bytes(st, in.size(), t);
}
BENCHMARK_CAPTURE(BM_Events_RapidReader, inventory, corpus::inventory(2000));
BENCHMARK_CAPTURE(BM_Events_RapidReader, multilingual, corpus::multilingual(4000));

static void BM_Events_NlohmannSax(benchmark::State& st, const std::string& in) {
    Tally t;
    for (auto _ : st) {
        NlohmannTally handler;
        if (!nlohmann::json::sax_parse(in, &handler)) st.SkipWithError("nlohmann parse error");
        t = handler.t;
        benchmark::DoNotOptimize(t);
    }
    tally_bytes(st, in.size(), t);
}
BENCHMARK_CAPTURE(BM_Events_NlohmannSax, inventory, corpus::inventory(2000));
BENCHMARK_CAPTURE(BM_Events_NlohmannSax, multilingual, corpus::multilingual(4000));

// ═══════════════════════════════════════════════════════════════════════════════
// 2. EAGER VS DEFERRED NUMBERS
// ═══════════════════════════════════════════════════════════════════════════════
//
// Every benchmark reads the "ts" field of each sample and nothing else,
// leaving the full-precision floats unread.

namespace {

const std::string& telemetry_doc() {
    static const std::string doc = corpus::telemetry(4000);
    return doc;
}

} // namespace

static void BM_Numbers_QuarryEager(benchmark::State& st) {
    const auto& in = telemetry_doc();
    for (auto _ : st) {
        auto v = quarry::parse(in);
        int64_t last = 0;
        for (const auto& sample : v.as_array()) last = sample["ts"].as_integer();
        benchmark::DoNotOptimize(last);
    }
    st.SetBytesProcessed(st.iterations() * static_cast<int64_t>(in.size()));
}
BENCHMARK(BM_Numbers_QuarryEager);

static void BM_Numbers_QuarryLazy(benchmark::State& st) {
    const auto& in = telemetry_doc();
    for (auto _ : st) {
        auto v = quarry::parse(in, quarry::ParseOptions::lazy());
        int64_t last = 0;
        for (const auto& sample : v.as_array()) last = sample["ts"].as_integer();
        benchmark::DoNotOptimize(last);
    }
    st.SetBytesProcessed(st.iterations() * static_cast<int64_t>(in.size()));
}
BENCHMARK(BM_Numbers_QuarryLazy);

static void BM_Numbers_RapidEager(benchmark::State& st) {
    const auto& in = telemetry_doc();
    rapidjson::Document doc;
    for (auto _ : st) {
        doc.Parse(in.c_str(), in.size());
        int64_t last = 0;
        for (const auto& sample : doc.GetArray()) last = sample["ts"].GetInt64();
        benchmark::DoNotOptimize(last);
    }
    st.SetBytesProcessed(st.iterations() * static_cast<int64_t>(in.size()));
}
BENCHMARK(BM_Numbers_RapidEager);

/// RapidJSON keeps numbers as text; the caller converts what it reads.
static void BM_Numbers_RapidAsStrings(benchmark::State& st) {
    const auto& in = telemetry_doc();
    rapidjson::Document doc;
    for (auto _ : st) {
        doc.Parse<rapidjson::kParseNumbersAsStringsFlag>(in.c_str(), in.size());
        int64_t last = 0;
        for (const auto& sample : doc.GetArray()) {
            const auto& ts = sample["ts"];
            auto r = std::from_chars(ts.GetString(), ts.GetString() + ts.GetStringLength(), last);
            if (r.ec != std::errc{}) st.SkipWithError("bad integer text");
        }
        benchmark::DoNotOptimize(last);
    }
    st.SetBytesProcessed(st.iterations() * static_cast<int64_t>(in.size()));
}
BENCHMARK(BM_Numbers_RapidAsStrings);

/// simdjson On-Demand converts only the values it is asked for.
static void BM_Numbers_SimdjsonOnDemand(benchmark::State& st) {
    const auto& in = telemetry_doc();
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(in);
    for (auto _ : st) {
        simdjson::ondemand::document doc = parser.iterate(padded);
        int64_t last = 0;
        for (simdjson::ondemand::object sample : doc.get_array()) {
            last = int64_t(sample["ts"]);
        }
        benchmark::DoNotOptimize(last);
    }
    st.SetBytesProcessed(st.iterations() * static_cast<int64_t>(in.size()));
}
BENCHMARK(BM_Numbers_SimdjsonOnDemand);

// ═══════════════════════════════════════════════════════════════════════════════
// 3. CHUNKED STREAM INPUT
// ═══════════════════════════════════════════════════════════════════════════════
//
// Arg is the chunk size handed to the parser. RapidJSON and nlohmann/json
// read through std::istream and pick their own buffering.

namespace {

const std::string& stream_doc() {
    static const std::string doc = corpus::spread(corpus::inventory(1500));
    return doc;
}

} // namespace

static void BM_Stream_QuarryChunks(benchmark::State& st) {
    const auto& in = stream_doc();
    const auto chunk = static_cast<size_t>(st.range(0));
    for (auto _ : st) {
        std::istringstream is(in);
        quarry::StreamSource src(is, chunk);
        auto v = quarry::parse(src);
        benchmark::DoNotOptimize(v);
    }
    st.SetBytesProcessed(st.iterations() * static_cast<int64_t>(in.size()));
}
BENCHMARK(BM_Stream_QuarryChunks)->Arg(64)->Arg(4096)->Arg(65536);

static void BM_Stream_BoostChunks(benchmark::State& st) {
    const auto& in = stream_doc();
    const auto chunk = static_cast<size_t>(st.range(0));
    boost::json::stream_parser p;
    for (auto _ : st) {
        p.reset();
        for (size_t off = 0; off < in.size(); off += chunk) {
            p.write(in.data() + off, std::min(chunk, in.size() - off));
        }
        p.finish();
        auto v = p.release();
        benchmark::DoNotOptimize(v);
    }
    st.SetBytesProcessed(st.iterations() * static_cast<int64_t>(in.size()));
}
BENCHMARK(BM_Stream_BoostChunks)->Arg(64)->Arg(4096)->Arg(65536);

static void BM_Stream_RapidIStream(benchmark::State& st) {
    const auto& in = stream_doc();
    for (auto _ : st) {
        std::istringstream is(in);
        rapidjson::IStreamWrapper isw(is);
        rapidjson::Document doc;
        doc.ParseStream(isw);
        benchmark::DoNotOptimize(doc);
    }
    st.SetBytesProcessed(st.iterations() * static_cast<int64_t>(in.size()));
}
BENCHMARK(BM_Stream_RapidIStream);

static void BM_Stream_NlohmannIStream(benchmark::State& st) {
    const auto& in = stream_doc();
    for (auto _ : st) {
        std::istringstream is(in);
        auto v = nlohmann::json::parse(is);
        benchmark::DoNotOptimize(v);
    }
    st.SetBytesProcessed(st.iterations() * static_cast<int64_t>(in.size()));
}
BENCHMARK(BM_Stream_NlohmannIStream);
