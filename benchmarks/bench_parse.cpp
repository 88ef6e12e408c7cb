/// @file bench_parse.cpp
/// @brief Performance benchmarks for rdjson.
///
/// Measured operations:
///   - Tokenizing only (lexer throughput)
///   - Parsing (small, medium, large documents)
///   - Scalar inference on quoted text
///   - Object lookup by key
///   - Exception-free parsing

#include <rdjson/rdjson.hpp>

#include <benchmark/benchmark.h>

#include <string>

using namespace rdjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// Generate small JSON object (~100 bytes).
static std::string generate_small_json() {
    return R"({"name":"John","age":30,"active":true,"score":95.5,"tags":["a","b"]})";
}

/// Generate medium JSON document (~2KB).
static std::string generate_medium_json() {
    std::string s = R"({
        "users": [)";
    for (int i = 0; i < 20; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"name":"user_)" + std::to_string(i) +
             R"(","email":"user)" + std::to_string(i) +
             R"(@test.com","active":)" + (i % 2 == 0 ? "true" : "false") +
             R"(,"score":)" + std::to_string(50.0 + i * 2.5) + "}";
    }
    s += R"(],"total":20,"page":1,"version":"2.0"})";
    return s;
}

/// Generate large JSON document (~200KB).
static std::string generate_large_json() {
    std::string s = R"({"data":[)";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"( with some longer title text for realism")" +
             R"(,"price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"quantity":)" + std::to_string(i % 100) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","common"],"active":)" + (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":1000,"generated":true}})";
    return s;
}

/// Generate number array.
static std::string generate_number_array(int count, bool quoted) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        if (quoted) s += '"';
        s += std::to_string(i * 1.25);
        if (quoted) s += '"';
    }
    s += "]";
    return s;
}

/// Generate deeply nested structure.
static std::string generate_deeply_nested(int depth) {
    std::string s;
    for (int i = 0; i < depth; ++i) {
        s += R"({"level":)" + std::to_string(i) + R"(,"child":)";
    }
    s += "null";
    for (int i = 0; i < depth; ++i) {
        s += "}";
    }
    return s;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lexer benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_TokenizeLarge(benchmark::State& state) {
    auto input = generate_large_json();
    for (auto _ : state) {
        Lexer lex(input);
        size_t count = 0;
        while (auto tok = lex.next_token()) {
            benchmark::DoNotOptimize(tok);
            ++count;
        }
        benchmark::DoNotOptimize(count);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_TokenizeLarge);

// ═══════════════════════════════════════════════════════════════════════════════
// Parsing benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ParseSmall(benchmark::State& state) {
    auto input = generate_small_json();
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_ParseSmall);

static void BM_ParseMedium(benchmark::State& state) {
    auto input = generate_medium_json();
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_ParseMedium);

static void BM_ParseLarge(benchmark::State& state) {
    auto input = generate_large_json();
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_ParseLarge);

static void BM_ParseNumberArray(benchmark::State& state) {
    auto input = generate_number_array(static_cast<int>(state.range(0)), false);
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_ParseNumberArray)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_ParseQuotedNumbers(benchmark::State& state) {
    auto input = generate_number_array(static_cast<int>(state.range(0)), true);
    const ParseOptions opts = state.range(1) != 0 ? ParseOptions{} : ParseOptions::strict();
    for (auto _ : state) {
        auto v = parse(input, opts);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_ParseQuotedNumbers)->Args({1000, 1})->Args({1000, 0});

static void BM_ParseDeeplyNested(benchmark::State& state) {
    auto input = generate_deeply_nested(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_ParseDeeplyNested)->Arg(10)->Arg(50)->Arg(200);

// ═══════════════════════════════════════════════════════════════════════════════
// Access benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ObjectLookup(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    std::string input = "{";
    for (int i = 0; i < n; ++i) {
        if (i > 0) input += ",";
        input += "\"key_" + std::to_string(i) + "\":" + std::to_string(i);
    }
    input += "}";
    auto v = parse(input);
    const std::string last = "key_" + std::to_string(n - 1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(v.find(last));
    }
}
BENCHMARK(BM_ObjectLookup)->Arg(5)->Arg(20)->Arg(100);

static void BM_CopyLarge(benchmark::State& state) {
    auto v = parse(generate_large_json());
    for (auto _ : state) {
        Value copy = v;
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(BM_CopyLarge);

// ═══════════════════════════════════════════════════════════════════════════════
// try_parse benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_TryParseSuccess(benchmark::State& state) {
    auto input = generate_medium_json();
    for (auto _ : state) {
        auto r = try_parse(input);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_TryParseSuccess);

static void BM_TryParseError(benchmark::State& state) {
    const std::string input = R"({"users":[{"id":1,"name":"x"},{"id":2,"name":)";
    for (auto _ : state) {
        auto r = try_parse(input);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_TryParseError);
