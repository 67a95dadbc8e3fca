#include <array>
#include <cstddef>
#include <vector>

#include <benchmark/benchmark.h>

#include "nectar/chunk/bmt.hpp"
#include "nectar/chunk/file.hpp"

static void BM_BmtHash(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));

    std::array<nectar::core::u8, nectar::core::kChunkSize> buf{};
    for (size_t i = 0; i < buf.size(); ++i){
        buf[i] = static_cast<nectar::core::u8>(i & 0xffu);
    }

    for (auto _ : state){
        nectar::core::ChunkAddress out{};
        nectar::core::Status s = nectar::chunk::bmt_hash(n, {buf.data(), static_cast<nectar::core::u32>(n)}, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_BmtHash)->Arg(0)->Arg(3)->Arg(64)->Arg(1024)->Arg(4096);

static void BM_BmtProve(benchmark::State& state){
    std::array<nectar::core::u8, nectar::core::kChunkSize> buf{};
    buf.fill(0x5a);
    const auto index = static_cast<nectar::core::u32>(state.range(0));

    for (auto _ : state){
        nectar::chunk::BmtProof proof;
        nectar::core::Status s =
            nectar::chunk::bmt_prove(buf.size(), {buf.data(), static_cast<nectar::core::u32>(buf.size())}, index, &proof);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(proof);
    }
}

BENCHMARK(BM_BmtProve)->Arg(0)->Arg(127);

static void BM_SplitFile(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));
    std::vector<nectar::core::u8> data(n, 'a');

    for (auto _ : state){
        nectar::chunk::FileTree tree;
        nectar::core::Status s = nectar::chunk::split_file({data.data(), static_cast<nectar::core::u32>(n)}, &tree);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(tree.root);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_SplitFile)->Arg(5000)->Arg(1 << 20);
