// Ticket: 0004_separable_kn_interpolation

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ldc-hydro/src/CrossCurveTable.hpp"
#include "ldc-hydro/src/HydroErrors.hpp"
#include "ldc-hydro/src/Interpolator.hpp"

using namespace ldc_hydro;

namespace
{

Eigen::VectorXd vec(std::initializer_list<double> values)
{
  Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
  Eigen::Index i = 0;
  for (double x : values)
  {
    v(i++) = x;
  }
  return v;
}

/// 3 displacements x 3 angles (0, 10, 20)
CrossCurveTable makeTable(double kn10At2000 = 1.2)
{
  std::vector<CrossCurveTable::Column> columns{
    {0.0, vec({0.0, 0.0, 0.0})},
    {10.0, vec({1.0, kn10At2000, 1.4})},
    {20.0, vec({2.0, 2.4, 2.8})}};
  return CrossCurveTable{vec({1000.0, 2000.0, 3000.0}), std::move(columns)};
}

}  // namespace

// ============================================================================
// interp1D
// ============================================================================

TEST(Interp1D, ExactSampleReturnsOrdinateVerbatim)
{
  const auto xs = vec({2.0, 3.0, 4.0});
  const auto ys = vec({1000.1, 1500.7, 2100.3});

  EXPECT_EQ(interp1D(3.0, xs, ys), 1500.7);
  EXPECT_EQ(interp1D(2.0, xs, ys), 1000.1);
  EXPECT_EQ(interp1D(4.0, xs, ys), 2100.3);
}

TEST(Interp1D, MidpointIsMeanOfNeighbours)
{
  const auto xs = vec({2.0, 3.0, 4.0});
  const auto ys = vec({1000.0, 1500.0, 2100.0});

  EXPECT_DOUBLE_EQ(interp1D(3.5, xs, ys), 1800.0);
}

TEST(Interp1D, LinearBetweenSamples)
{
  const auto xs = vec({0.0, 10.0});
  const auto ys = vec({5.0, 25.0});

  EXPECT_NEAR(interp1D(2.5, xs, ys), 10.0, 1e-12);
  EXPECT_NEAR(interp1D(7.5, xs, ys), 20.0, 1e-12);
}

TEST(Interp1D, BelowRangeThrowsWithBounds)
{
  const auto xs = vec({2.0, 3.0, 4.0});
  const auto ys = vec({1.0, 2.0, 3.0});

  try
  {
    (void)interp1D(1.9, xs, ys, "Draft", "m");
    FAIL() << "Expected RangeError";
  }
  catch (const RangeError& e)
  {
    EXPECT_EQ(e.quantity(), "Draft");
    EXPECT_DOUBLE_EQ(e.value(), 1.9);
    EXPECT_DOUBLE_EQ(e.lowerBound(), 2.0);
    EXPECT_DOUBLE_EQ(e.upperBound(), 4.0);
    EXPECT_NE(std::string{e.what()}.find("Draft"), std::string::npos);
  }
}

TEST(Interp1D, AboveRangeThrows)
{
  const auto xs = vec({2.0, 3.0, 4.0});
  const auto ys = vec({1.0, 2.0, 3.0});

  EXPECT_THROW((void)interp1D(4.0001, xs, ys), RangeError);
}

TEST(Interp1D, RangeErrorIsOutOfRange)
{
  const auto xs = vec({2.0, 3.0});
  const auto ys = vec({1.0, 2.0});

  EXPECT_THROW((void)interp1D(10.0, xs, ys), std::out_of_range);
}

TEST(Interp1D, NaNIsOutOfRange)
{
  const auto xs = vec({2.0, 3.0});
  const auto ys = vec({1.0, 2.0});

  EXPECT_THROW(
    (void)interp1D(std::numeric_limits<double>::quiet_NaN(), xs, ys),
    RangeError);
}

TEST(Interp1D, RequiresTwoAlignedSamples)
{
  EXPECT_THROW((void)interp1D(1.0, vec({1.0}), vec({1.0})),
               std::invalid_argument);
  EXPECT_THROW((void)interp1D(1.0, vec({1.0, 2.0}), vec({1.0})),
               std::invalid_argument);
}

// ============================================================================
// interp2D
// ============================================================================

TEST(Interp2D, ExactAngleUsesOnlyThatColumn)
{
  // The 10° column is the same in both tables; its neighbours are not
  // consulted for an exact angle, so changing the 20° data has no effect.
  const auto table = makeTable();
  std::vector<CrossCurveTable::Column> columns{
    {0.0, vec({0.0, 0.0, 0.0})},
    {10.0, vec({1.0, 1.2, 1.4})},
    {20.0, vec({9.0, 9.0, 9.0})}};
  const CrossCurveTable altered{vec({1000.0, 2000.0, 3000.0}), std::move(columns)};

  EXPECT_DOUBLE_EQ(interp2D(1500.0, 10.0, table), 1.1);
  EXPECT_DOUBLE_EQ(interp2D(1500.0, 10.0, altered), 1.1);
}

TEST(Interp2D, GridPointReturnsStoredValue)
{
  const auto table = makeTable(1.234);

  EXPECT_EQ(interp2D(2000.0, 10.0, table), 1.234);
}

TEST(Interp2D, BlendsBetweenAngleColumns)
{
  const auto table = makeTable();

  // 2000 t: 1.2 at 10°, 2.4 at 20°
  EXPECT_NEAR(interp2D(2000.0, 15.0, table), 1.8, 1e-12);
  // 2500 t: 1.3 at 10°, 2.6 at 20°
  EXPECT_NEAR(interp2D(2500.0, 12.5, table), 1.625, 1e-12);
}

TEST(Interp2D, AngleOutsideTableThrows)
{
  const auto table = makeTable();

  try
  {
    (void)interp2D(2000.0, 25.0, table);
    FAIL() << "Expected RangeError";
  }
  catch (const RangeError& e)
  {
    EXPECT_EQ(e.quantity(), "Heel angle");
    EXPECT_DOUBLE_EQ(e.lowerBound(), 0.0);
    EXPECT_DOUBLE_EQ(e.upperBound(), 20.0);
  }
  EXPECT_THROW((void)interp2D(2000.0, -1.0, table), RangeError);
}

TEST(Interp2D, DisplacementOutsideTableThrows)
{
  const auto table = makeTable();

  try
  {
    (void)interp2D(3500.0, 10.0, table);
    FAIL() << "Expected RangeError";
  }
  catch (const RangeError& e)
  {
    EXPECT_EQ(e.quantity(), "Displacement");
    EXPECT_DOUBLE_EQ(e.value(), 3500.0);
    EXPECT_DOUBLE_EQ(e.upperBound(), 3000.0);
  }
}

TEST(Interp2D, SingleColumnTableSupportsOnlyItsAngle)
{
  std::vector<CrossCurveTable::Column> columns{{30.0, vec({1.0, 2.0})}};
  const CrossCurveTable table{vec({1000.0, 2000.0}), std::move(columns)};

  EXPECT_DOUBLE_EQ(interp2D(1500.0, 30.0, table), 1.5);
  EXPECT_THROW((void)interp2D(1500.0, 29.0, table), RangeError);
}
