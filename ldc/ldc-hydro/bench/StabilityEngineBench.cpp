// Ticket: 0005_gz_curve_and_summary

#include <benchmark/benchmark.h>
#include <cstdint>
#include <random>
#include <vector>

#include "ldc-data-gen/src/SampleShipData.hpp"
#include "ldc-hydro/src/StabilityEngine.hpp"
#include "ldc-hydro/src/TableModel.hpp"

using namespace ldc_hydro;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

const TableModel& delMonte()
{
  static const TableModel model =
    TableModel::load(ldc_data_gen::makeDelMonteWorkbook());
  return model;
}

// Fixed seed for deterministic benchmarks
std::vector<double> randomValues(size_t count, double lo, double hi)
{
  static std::mt19937 rng{42};
  std::uniform_real_distribution<double> dist{lo, hi};

  std::vector<double> values;
  values.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    values.push_back(dist(rng));
  }
  return values;
}

constexpr size_t kSampleCount = 1024;

}  // namespace

// ============================================================================
// Table lookups
// ============================================================================

/**
 * @brief KN lookup at random in-grid displacements and angles
 */
static void BM_KnLookup(benchmark::State& state)
{
  const auto& model = delMonte();
  const auto [dLo, dHi] = model.displacementRange();
  const auto displacements = randomValues(kSampleCount, dLo, dHi);
  const auto angles = randomValues(kSampleCount, 10.0, 60.0);

  size_t i = 0;
  for (auto _ : state)
  {
    benchmark::DoNotOptimize(model.knAt(displacements[i], angles[i]));
    i = (i + 1) % kSampleCount;
  }
}
BENCHMARK(BM_KnLookup);

/**
 * @brief Load of the sample workbook, including label parsing and validation
 */
static void BM_TableModelLoad(benchmark::State& state)
{
  const auto workbook = ldc_data_gen::makeDelMonteWorkbook();
  for (auto _ : state)
  {
    auto model = TableModel::load(workbook);
    benchmark::DoNotOptimize(model);
  }
}
BENCHMARK(BM_TableModelLoad);

// ============================================================================
// GZ curve
// ============================================================================

/**
 * @brief Full GZ curve over the tabulated angles plus its summary
 */
static void BM_GZCurveAndSummary(benchmark::State& state)
{
  const StabilityEngine engine{delMonte()};
  const auto drafts = randomValues(kSampleCount, 2.0, 14.0);

  size_t i = 0;
  for (auto _ : state)
  {
    const auto result = engine.computeGZ({drafts[i], 500000.0});
    auto summary = engine.summarize(result.curve, result.displacement, result.kg);
    benchmark::DoNotOptimize(summary);
    i = (i + 1) % kSampleCount;
  }
}
BENCHMARK(BM_GZCurveAndSummary);

/**
 * @brief GZ curve at N evenly spaced angles
 */
static void BM_GZCurveDenseAngles(benchmark::State& state)
{
  const StabilityEngine engine{delMonte()};
  const auto count = static_cast<size_t>(state.range(0));

  std::vector<double> angles(count);
  for (size_t k = 0; k < count; ++k)
  {
    angles[k] = 10.0 + 50.0 * static_cast<double>(k) /
                         static_cast<double>(count - 1);
  }

  for (auto _ : state)
  {
    auto curve = engine.buildGZCurve(7.5, 4.0, angles);
    benchmark::DoNotOptimize(curve);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(count));
}
BENCHMARK(BM_GZCurveDenseAngles)->RangeMultiplier(4)->Range(16, 1024);

BENCHMARK_MAIN();
