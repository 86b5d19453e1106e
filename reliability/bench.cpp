#include <algorithm> // `std::shuffle`
#include <random>    // `std::mt19937`
#include <string>    // `std::string`
#include <vector>    // `std::vector`

#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include <avlidx/balanced_index.hpp>
#include <avlidx/locked.hpp>

namespace bm = benchmark;
using namespace unum::avlidx;

using locked_index_t = locked_gt<balanced_index_t>;

static std::vector<std::string> make_keys(std::size_t count, bool shuffled) {
    std::vector<std::string> keys;
    keys.reserve(count);
    for (std::size_t i = 0; i != count; ++i)
        keys.push_back(fmt::format("key-{:08}", i));
    if (shuffled)
        std::shuffle(keys.begin(), keys.end(), std::mt19937 {42});
    return keys;
}

template <typename index_at>
void upsert(bm::State& s, bool shuffled) {
    auto keys = make_keys(static_cast<std::size_t>(s.range(0)), shuffled);
    for (auto _ : s) {
        index_at index;
        for (auto const& key : keys)
            bm::DoNotOptimize(index.upsert(key, key));
        s.counters["rotations"] = static_cast<double>(index.rotations());
        s.counters["height"] = index.height();
    }
    s.counters["upsert/s"] = bm::Counter(s.iterations() * keys.size(), bm::Counter::kIsRate);
}

void find_random(bm::State& s) {
    auto keys = make_keys(static_cast<std::size_t>(s.range(0)), true);
    balanced_index_t index;
    for (auto const& key : keys)
        bm::DoNotOptimize(index.upsert(key, key));

    std::size_t found = 0;
    for (auto _ : s)
        for (auto const& key : keys)
            found += index.contains(key);

    bm::DoNotOptimize(found);
    s.counters["find/s"] = bm::Counter(s.iterations() * keys.size(), bm::Counter::kIsRate);
}

void erase_random(bm::State& s) {
    auto keys = make_keys(static_cast<std::size_t>(s.range(0)), true);
    for (auto _ : s) {
        s.PauseTiming();
        balanced_index_t index;
        for (auto const& key : keys)
            bm::DoNotOptimize(index.upsert(key, key));
        s.ResumeTiming();

        for (auto const& key : keys)
            bm::DoNotOptimize(index.erase(key));
    }
    s.counters["erase/s"] = bm::Counter(s.iterations() * keys.size(), bm::Counter::kIsRate);
}

int main(int argc, char** argv) {

    bm::RegisterBenchmark("upsert ascending", [](bm::State& s) { upsert<balanced_index_t>(s, false); })
        ->Arg(1'000)
        ->Arg(100'000);
    bm::RegisterBenchmark("upsert random", [](bm::State& s) { upsert<balanced_index_t>(s, true); })
        ->Arg(1'000)
        ->Arg(100'000);
    bm::RegisterBenchmark("upsert locked random", [](bm::State& s) { upsert<locked_index_t>(s, true); })
        ->Arg(1'000)
        ->Arg(100'000);
    bm::RegisterBenchmark("find random", find_random)->Arg(1'000)->Arg(100'000);
    bm::RegisterBenchmark("erase random", erase_random)->Arg(1'000)->Arg(100'000);

    bm::Initialize(&argc, argv);
    bm::RunSpecifiedBenchmarks();
    bm::Shutdown();
}
