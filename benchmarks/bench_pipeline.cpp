/// @file bench_pipeline.cpp
/// @brief Cost of each pipeline stage and of both front-ends on quarry alone.
///
/// Scenarios:
///   1. Stage by stage on one document: decode, scan, lex, parse
///   2. Coordinate tracking: compact vs re-indented input
///   3. Tree front-end per document shape, ASCII vs UTF-8 decoding
///   4. Event front-end: callback, pull reader, replay, path depth
///   5. Eager vs lazy numbers
///   6. Lookup: indexed object members, JSON Pointer
///   7. Message batches, clean and with faults

#include <benchmark/benchmark.h>

#include <quarry/quarry.hpp>

#include "bench_data.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

void count_bytes(benchmark::State& st, size_t bytes) {
    st.SetBytesProcessed(st.iterations() * static_cast<int64_t>(bytes));
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// 1. STAGE BY STAGE
// ═══════════════════════════════════════════════════════════════════════════════
//
// Each benchmark stops one stage later than the previous one, so the
// difference between neighbours is the cost of the added stage.

static void BM_Stage_Decode(benchmark::State& st, const std::string& in) {
    for (auto _ : st) {
        quarry::MemorySource src(in);
        quarry::Utf8Decoder dec(src);
        char32_t ch = 0;
        size_t n = 0;
        while (dec.next(ch)) ++n;
        benchmark::DoNotOptimize(n);
    }
    count_bytes(st, in.size());
}
BENCHMARK_CAPTURE(BM_Stage_Decode, inventory, corpus::inventory(2000));
BENCHMARK_CAPTURE(BM_Stage_Decode, multilingual, corpus::multilingual(4000));

static void BM_Stage_Scan(benchmark::State& st, const std::string& in) {
    for (auto _ : st) {
        quarry::MemorySource src(in);
        quarry::Utf8Decoder dec(src);
        quarry::Scanner scanner(dec);
        size_t n = 0;
        while (scanner.lookahead()) {
            scanner.advance();
            if (scanner.buffer_size() == 64) n += scanner.take().text.size();
        }
        benchmark::DoNotOptimize(n);
    }
    count_bytes(st, in.size());
}
BENCHMARK_CAPTURE(BM_Stage_Scan, inventory, corpus::inventory(2000));
BENCHMARK_CAPTURE(BM_Stage_Scan, multilingual, corpus::multilingual(4000));

static void BM_Stage_Lex(benchmark::State& st, const std::string& in) {
    for (auto _ : st) {
        quarry::Pipeline p(in);
        size_t n = 0;
        while (!p.lexer().next().is_end()) ++n;
        benchmark::DoNotOptimize(n);
    }
    count_bytes(st, in.size());
}
BENCHMARK_CAPTURE(BM_Stage_Lex, inventory, corpus::inventory(2000));
BENCHMARK_CAPTURE(BM_Stage_Lex, multilingual, corpus::multilingual(4000));

static void BM_Stage_Parse(benchmark::State& st, const std::string& in) {
    for (auto _ : st) { auto v = quarry::parse(in); benchmark::DoNotOptimize(v); }
    count_bytes(st, in.size());
}
BENCHMARK_CAPTURE(BM_Stage_Parse, inventory, corpus::inventory(2000));
BENCHMARK_CAPTURE(BM_Stage_Parse, multilingual, corpus::multilingual(4000));

static void BM_Stage_TokenizeCollect(benchmark::State& st) {
    const auto in = corpus::inventory(2000);
    for (auto _ : st) { auto v = quarry::tokenize(in); benchmark::DoNotOptimize(v); }
    count_bytes(st, in.size());
}
BENCHMARK(BM_Stage_TokenizeCollect);

// ═══════════════════════════════════════════════════════════════════════════════
// 2. COORDINATE TRACKING
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Lines_Compact(benchmark::State& st) {
    const auto in = corpus::telemetry(1000);
    for (auto _ : st) { auto v = quarry::parse(in); benchmark::DoNotOptimize(v); }
    count_bytes(st, in.size());
}
BENCHMARK(BM_Lines_Compact);

static void BM_Lines_Spread(benchmark::State& st) {
    const auto in = corpus::spread(corpus::telemetry(1000));
    for (auto _ : st) { auto v = quarry::parse(in); benchmark::DoNotOptimize(v); }
    count_bytes(st, in.size());
    st.counters["lines"] = static_cast<double>(std::count(in.begin(), in.end(), '\n') + 1);
}
BENCHMARK(BM_Lines_Spread);

// ═══════════════════════════════════════════════════════════════════════════════
// 3. TREE FRONT-END
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Tree_InventoryScaling(benchmark::State& st) {
    const auto in = corpus::inventory(static_cast<size_t>(st.range(0)));
    for (auto _ : st) { auto v = quarry::parse(in); benchmark::DoNotOptimize(v); }
    count_bytes(st, in.size());
    st.SetComplexityN(st.range(0));
}
BENCHMARK(BM_Tree_InventoryScaling)->RangeMultiplier(8)->Range(8, 8 << 9)->Complexity();

static void BM_Tree_Shape(benchmark::State& st, const std::string& in) {
    for (auto _ : st) { auto v = quarry::parse(in); benchmark::DoNotOptimize(v); }
    count_bytes(st, in.size());
}
BENCHMARK_CAPTURE(BM_Tree_Shape, telemetry, corpus::telemetry(1000));
BENCHMARK_CAPTURE(BM_Tree_Shape, multilingual, corpus::multilingual(4000));
BENCHMARK_CAPTURE(BM_Tree_Shape, nesting400, corpus::nesting(400));
BENCHMARK_CAPTURE(BM_Tree_Shape, wide_object, corpus::wide_object(4000));

static void BM_Tree_Decoder(benchmark::State& st) {
    const auto in = corpus::inventory(1000);
    const auto opts = st.range(0) ? quarry::ParseOptions::ascii() : quarry::ParseOptions{};
    for (auto _ : st) { auto v = quarry::parse(in, opts); benchmark::DoNotOptimize(v); }
    count_bytes(st, in.size());
    st.SetLabel(st.range(0) ? "ascii" : "utf-8");
}
BENCHMARK(BM_Tree_Decoder)->Arg(0)->Arg(1);

// ═══════════════════════════════════════════════════════════════════════════════
// 4. EVENT FRONT-END
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Events_Callback(benchmark::State& st) {
    const auto in = corpus::inventory(2000);
    for (auto _ : st) {
        size_t scalars = 0;
        quarry::parse_events(in, [&scalars](const quarry::Event& e) {
            if (e.kind == quarry::EventKind::Scalar) ++scalars;
        });
        benchmark::DoNotOptimize(scalars);
    }
    count_bytes(st, in.size());
}
BENCHMARK(BM_Events_Callback);

static void BM_Events_Pull(benchmark::State& st) {
    const auto in = corpus::inventory(2000);
    for (auto _ : st) {
        quarry::EventReader reader(in);
        size_t keys = 0;
        while (auto e = reader.next()) {
            if (e->kind == quarry::EventKind::Key) ++keys;
        }
        benchmark::DoNotOptimize(keys);
    }
    count_bytes(st, in.size());
}
BENCHMARK(BM_Events_Pull);

static void BM_Events_ReplayIntoTree(benchmark::State& st) {
    const auto in = corpus::inventory(2000);
    for (auto _ : st) {
        quarry::TreeBuilder builder;
        quarry::parse_events(in, [&builder](const quarry::Event& e) { builder.apply(e); });
        auto v = builder.release();
        benchmark::DoNotOptimize(v);
    }
    count_bytes(st, in.size());
}
BENCHMARK(BM_Events_ReplayIntoTree);

/// Every event carries its JSON Pointer, so cost grows with depth.
static void BM_Events_PathDepth(benchmark::State& st) {
    const auto in = corpus::nesting(static_cast<int>(st.range(0)));
    for (auto _ : st) {
        size_t tokens = 0;
        quarry::parse_events(in, [&tokens](const quarry::Event& e) { tokens += e.path.depth(); });
        benchmark::DoNotOptimize(tokens);
    }
    count_bytes(st, in.size());
}
BENCHMARK(BM_Events_PathDepth)->Arg(16)->Arg(128)->Arg(480);

// ═══════════════════════════════════════════════════════════════════════════════
// 5. EAGER VS LAZY NUMBERS
// ═══════════════════════════════════════════════════════════════════════════════
//
// Arg 0: eager. Arg 1: lazy, nothing read. Arg 2: lazy, only "ts" read.

static void BM_Numbers(benchmark::State& st) {
    const auto in = corpus::telemetry(2000);
    const auto mode = st.range(0);
    const auto opts = mode == 0 ? quarry::ParseOptions{} : quarry::ParseOptions::lazy();
    for (auto _ : st) {
        auto v = quarry::parse(in, opts);
        if (mode == 2) {
            int64_t last = 0;
            for (const auto& sample : v.as_array()) last = sample["ts"].as_integer();
            benchmark::DoNotOptimize(last);
        }
        benchmark::DoNotOptimize(v);
    }
    count_bytes(st, in.size());
    static const char* const kLabels[] = {"eager", "lazy-unread", "lazy-one-field"};
    st.SetLabel(kLabels[mode]);
}
BENCHMARK(BM_Numbers)->DenseRange(0, 2);

// ═══════════════════════════════════════════════════════════════════════════════
// 6. LOOKUP
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Lookup_WideObject(benchmark::State& st) {
    const auto fields = static_cast<size_t>(st.range(0));
    const auto doc = quarry::parse(corpus::wide_object(fields));
    std::vector<std::string> keys;
    for (size_t i = 0; i < fields; i += 3) keys.push_back(corpus::wide_object_key(i));
    for (auto _ : st) {
        int64_t sum = 0;
        for (const auto& k : keys) sum += doc.find(k)->as_integer();
        benchmark::DoNotOptimize(sum);
    }
    st.SetItemsProcessed(st.iterations() * static_cast<int64_t>(keys.size()));
}
// 12 fields stays under the hash-index threshold, the others build it.
BENCHMARK(BM_Lookup_WideObject)->Arg(12)->Arg(256)->Arg(4096);

static void BM_Lookup_Pointer(benchmark::State& st) {
    const auto doc = quarry::parse(corpus::inventory(1000));
    const quarry::JsonPointer ptr("/records/731/bin/1");
    for (auto _ : st) {
        const auto& v = ptr.resolve(doc);
        benchmark::DoNotOptimize(&v);
    }
}
BENCHMARK(BM_Lookup_Pointer);

// ═══════════════════════════════════════════════════════════════════════════════
// 7. MESSAGE BATCHES
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Batch(benchmark::State& st, const std::vector<std::string>& batch) {
    int64_t failed = 0;
    for (auto _ : st) {
        for (const auto& m : batch) {
            auto r = quarry::try_parse(m);
            if (!r) ++failed;
            benchmark::DoNotOptimize(r);
        }
    }
    count_bytes(st, corpus::byte_count(batch));
    st.SetItemsProcessed(st.iterations() * static_cast<int64_t>(batch.size()));
    st.counters["faults"] = benchmark::Counter(static_cast<double>(failed),
                                               benchmark::Counter::kAvgIterations);
}
BENCHMARK_CAPTURE(BM_Batch, clean, corpus::requests(200));
BENCHMARK_CAPTURE(BM_Batch, damaged, corpus::damaged(corpus::requests(200)));
