#include <random>
#include <benchmark/benchmark.h>
#include "ovl/memory_store.hpp"
#include "ovl/sparse_array.hpp"

using array_t = ovl::sparse_array<ovl::memory_store>;

static constexpr ovl::word ELEMENT_COUNT{10000};

// Builds an array of ELEMENT_COUNT elements and then deletes
// the requested number of them, evenly spaced.
static auto make_array(ovl::memory_store* store, ovl::word deletions) -> array_t {
	array_t array{store, 1};
	for (ovl::word i = 0; i < ELEMENT_COUNT; i++) {
		array.push(i);
	}
	if (deletions == 0) {
		return array;
	}
	const auto gap{(ELEMENT_COUNT - deletions) / deletions};
	for (ovl::word i = 0; i < deletions; i++) {
		array.safe_delete_at(i * gap);
	}
	return array;
}

// Random reads after state.range(0) deletions
static void BM_get(benchmark::State& state) {
	ovl::memory_store store;
	const auto array{make_array(&store, state.range(0))};
	std::mt19937 rng(2);
	std::uniform_int_distribution<ovl::word> index(0, array.size() - 1);
	for (auto _ : state) {
		benchmark::DoNotOptimize(array.get(index(rng)));
	}
}
BENCHMARK(BM_get)->Arg(0)->Arg(16)->Arg(256)->Arg(4096);

static void BM_push(benchmark::State& state) {
	ovl::memory_store store;
	auto array{make_array(&store, state.range(0))};
	ovl::word value{0};
	for (auto _ : state) {
		array.push(value++);
	}
}
BENCHMARK(BM_push)->Arg(0)->Arg(256);

// Deleting the first element over and over
static void BM_delete_at(benchmark::State& state) {
	ovl::memory_store store;
	array_t array{&store, 1};
	for (auto _ : state) {
		state.PauseTiming();
		array.push(0);
		state.ResumeTiming();
		array.delete_at(0);
	}
}
BENCHMARK(BM_delete_at);

BENCHMARK_MAIN();
