/// @file bench_edit.cpp
/// @brief Performance benchmarks for aywson document operations.
///
/// Measured operations:
///   - Parsing (syntax tree, decoded value)
///   - Single-path edits (set, remove, comment)
///   - Bulk changes (merge, replace)
///   - Whole-document passes (sort, format)
///
/// Every operation reparses the document, so the per-call cost grows with
/// document size; the Arg() values are the number of properties.

#include <aywson/aywson.hpp>

#include <benchmark/benchmark.h>

#include <string>

using namespace aywson;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// Commented configuration document with `count` sections in reverse key order.
static std::string generate_config(int count) {
    std::string s = "// generated configuration\n{\n";
    for (int i = count - 1; i >= 0; --i) {
        const std::string n = std::to_string(i);
        s += "  // section " + n + "\n";
        s += "  \"section_" + n + "\": {\n";
        s += "    \"enabled\": " + std::string(i % 2 == 0 ? "true" : "false") + ", // toggle\n";
        s += "    \"port\": " + std::to_string(8000 + i) + ",\n";
        s += "    \"tags\": [\"a\", \"b\", \"c\"]\n";
        s += "  }";
        s += i > 0 ? ",\n" : "\n";
    }
    s += "}\n";
    return s;
}

/// The same document without whitespace or comments.
static std::string generate_minified(int count) {
    std::string s = "{";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        const std::string n = std::to_string(i);
        s += "\"section_" + n + "\":{\"enabled\":true,\"port\":" + std::to_string(8000 + i) +
             ",\"tags\":[\"a\",\"b\",\"c\"]}";
    }
    s += "}";
    return s;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Parsing benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ParseTree(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto root = parse_tree(input);
        benchmark::DoNotOptimize(root);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_ParseTree)->Arg(10)->Arg(100)->Arg(1000);

static void BM_ParseValue(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_ParseValue)->Arg(10)->Arg(100)->Arg(1000);

static void BM_Get(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    const Path path{"section_0", "port"};
    for (auto _ : state) {
        auto v = get(input, path);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_Get)->Arg(10)->Arg(100)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// Single-path edits
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_SetExisting(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    const Path path{"section_0", "port"};
    for (auto _ : state) {
        auto out = set(input, path, 9090);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SetExisting)->Arg(10)->Arg(100)->Arg(1000);

static void BM_SetCreatesParents(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    const Path path{"logging", "file", "path"};
    for (auto _ : state) {
        auto out = set(input, path, "/var/log/app.log");
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SetCreatesParents)->Arg(10)->Arg(100)->Arg(1000);

static void BM_Remove(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    const Path path{"section_1"};
    for (auto _ : state) {
        auto out = aywson::remove(input, path);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_Remove)->Arg(10)->Arg(100)->Arg(1000);

static void BM_SetComment(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    const Path path{"section_0", "port"};
    for (auto _ : state) {
        auto out = set_comment(input, path, "listening port");
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SetComment)->Arg(10)->Arg(100);

// ═══════════════════════════════════════════════════════════════════════════════
// Bulk changes
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Merge(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    const Change change = {
        {"section_0", {{"port", 1}, {"enabled", Change::remove()}}},
        {"section_1", {{"host", "localhost"}}},
    };
    for (auto _ : state) {
        auto out = merge(input, change);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_Merge)->Arg(10)->Arg(100);

static void BM_Replace(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    const Change change = {
        {"section_0", {{"port", 1}}},
        {"section_1", {{"enabled", true}}},
    };
    for (auto _ : state) {
        auto out = aywson::replace(input, change);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_Replace)->Arg(10)->Arg(50);

// ═══════════════════════════════════════════════════════════════════════════════
// Whole-document passes
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_SortDeep(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto out = aywson::sort(input);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_SortDeep)->Arg(10)->Arg(100)->Arg(1000);

static void BM_SortShallow(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    SortOptions opts;
    opts.deep = false;
    for (auto _ : state) {
        auto out = aywson::sort(input, {}, opts);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SortShallow)->Arg(10)->Arg(100)->Arg(1000);

static void BM_FormatMinified(benchmark::State& state) {
    const auto input = generate_minified(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto out = format(input);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_FormatMinified)->Arg(10)->Arg(100)->Arg(1000);

static void BM_FormatCommented(benchmark::State& state) {
    const auto input = generate_config(static_cast<int>(state.range(0)));
    FormatOptions opts;
    opts.tab_size = 4;
    for (auto _ : state) {
        auto out = format(input, opts);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_FormatCommented)->Arg(10)->Arg(100)->Arg(1000);
