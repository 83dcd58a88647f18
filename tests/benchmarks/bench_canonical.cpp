// bench_canonical.cpp - canonical form and digest throughput
//
// Baselines for catching regressions in the hashing hot path.

#include <ocp/canonical_json.hpp>
#include <ocp/common.hpp>
#include <ocp/digest.hpp>
#include <ocp/entry.hpp>

#include <string>

#include <benchmark/benchmark.h>
#include <nlohmann/json.hpp>

namespace {

// A single governance action payload
nlohmann::json create_action()
{
    return nlohmann::json{
        {     "action_type",                                 "propose"},
        {        "agent_id",                       "agent-7f3c-warden"},
        {       "timestamp",                  "2026-03-14T09:26:53Z"},
        {         "content", {{"motion", "raise quorum"}, {"quorum", 0.66}}},
        {"evidence_pointers",   nlohmann::json::array({"ev-1", "ev-2"})},
    };
}

// An archive page with many entries and mixed number forms
nlohmann::json create_archive(int entries)
{
    nlohmann::json items = nlohmann::json::array();
    for (int i = 0; i < entries; ++i) {
        auto entry = create_action();
        entry["sequence"] = i;
        entry["weight"] = 1.0 / (i + 1);
        entry["note"] = "révision №" + std::to_string(i);
        items.push_back(std::move(entry));
    }
    return nlohmann::json{
        {"archive_version", "ocp.archive.v1"},
        {        "entries",             items},
    };
}

// Keys inserted far from code point order
nlohmann::json create_unordered()
{
    nlohmann::json j;
    j["zeta"] = 1;
    j["Alpha"] = 2;
    j["éclair"] = 3;
    j["beta"] = 4;
    j["nested"] = {
        {"zz", 1},
        {"AA", 2},
        {"mm", {{"y", 1e21}, {"x", 1e-7}}},
    };
    return j;
}

static void BM_Canonicalize_Action(benchmark::State& state)
{
    auto json = create_action();
    for (auto _ : state) {
        auto result = ocp::canonical::canonicalize(json);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Canonicalize_Action);

static void BM_Canonicalize_Archive(benchmark::State& state)
{
    auto json = create_archive(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto result = ocp::canonical::canonicalize(json);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Canonicalize_Archive)->Arg(10)->Arg(1'000);

static void BM_Canonicalize_Unordered(benchmark::State& state)
{
    auto json = create_unordered();
    for (auto _ : state) {
        auto result = ocp::canonical::canonicalize(json);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Canonicalize_Unordered);

static void BM_SHA256_1KB(benchmark::State& state)
{
    std::string data(1'024, 'x');
    for (auto _ : state) {
        auto result = ocp::common::sha256(data);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(data.size()));
}
BENCHMARK(BM_SHA256_1KB);

static void BM_SHA256_1MB(benchmark::State& state)
{
    std::string data(1'024 * 1'024, 'x');
    for (auto _ : state) {
        auto result = ocp::common::sha256(data);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(data.size()));
}
BENCHMARK(BM_SHA256_1MB);

static void BM_DigestHash_Archive(benchmark::State& state)
{
    auto json = create_archive(100);
    for (auto _ : state) {
        auto digest = ocp::digest::hash(json);
        benchmark::DoNotOptimize(digest);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DigestHash_Archive);

static void BM_Reproduce_Entry(benchmark::State& state)
{
    auto entry = create_action();
    entry["content"] = R"({"motion":"raise quorum","quorum":0.66})";
    entry["semantic_hash"] = std::string(64, '0');
    for (auto _ : state) {
        auto reproduction = ocp::entry::reproduce(entry);
        benchmark::DoNotOptimize(reproduction);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Reproduce_Entry);

}  // namespace
