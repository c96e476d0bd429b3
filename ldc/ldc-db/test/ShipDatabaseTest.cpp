// Ticket: 0007_sqlite_ship_data_source

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/null_sink.h>

#include "ldc-db/src/Database.hpp"
#include "ldc-db/src/ShipDatabase.hpp"
#include "ldc-hydro/src/HydroErrors.hpp"
#include "ldc-hydro/test/Helpers/ShipFixtures.hpp"

using namespace ldc_db;

// ============================================================================
// Test Fixture
// ============================================================================

class ShipDatabaseTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    logger_ = std::make_shared<spdlog::logger>("ship_db_test", nullSink);

    dbPath_ = "test_ship_" +
              std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()) +
              ".db";
  }

  void TearDown() override
  {
    for (const char* suffix : {"", "-wal", "-shm"})
    {
      const auto path = dbPath_ + suffix;
      if (std::filesystem::exists(path))
      {
        std::filesystem::remove(path);
      }
    }
  }

  void writeFixture(const ldc_hydro::Workbook& workbook)
  {
    Database db{dbPath_, logger_, DBOpenCondition::OpenCreate};
    writeWorkbook(db, workbook);
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::string dbPath_;
};

// ============================================================================
// Round trip
// ============================================================================

TEST_F(ShipDatabaseTest, StoredWorkbookLoadsIntoSameModel)
{
  const auto workbook = ldc_test::makeWorkbook(ldc_test::LabelStyle::Mixed);
  writeFixture(workbook);

  const auto fromDb = loadTableModel(dbPath_, logger_);
  const auto inMemory = ldc_hydro::TableModel::load(workbook);

  EXPECT_EQ(fromDb.shipName(), "MV Test");
  EXPECT_EQ(fromDb.draftRange(), inMemory.draftRange());
  EXPECT_EQ(fromDb.availableHeelAngles(), inMemory.availableHeelAngles());
  EXPECT_EQ(fromDb.crossCurves().kn(), inMemory.crossCurves().kn());
  EXPECT_EQ(fromDb.hydrostatics().displacements(),
            inMemory.hydrostatics().displacements());
  EXPECT_EQ(fromDb.particulars().number("Breadth"), 20.0);
}

TEST_F(ShipDatabaseTest, ReadWorkbookReturnsRequiredSheets)
{
  writeFixture(ldc_test::makeWorkbook());

  const Database db{dbPath_, logger_, DBOpenCondition::OpenReadOnly};
  const auto workbook = readWorkbook(db);

  EXPECT_EQ(workbook.sheets.size(), 3u);
  ASSERT_NE(workbook.findSheet(ldc_hydro::kCrossCurveSheet), nullptr);
  EXPECT_EQ(workbook.findSheet(ldc_hydro::kCrossCurveSheet)->columns[1],
            "KN at 0°");
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ShipDatabaseTest, MissingTableIsSchemaError)
{
  auto workbook = ldc_test::makeWorkbook();
  workbook.sheets.erase(ldc_hydro::kDisplacementSheet);
  writeFixture(workbook);

  try
  {
    (void)loadTableModel(dbPath_, logger_);
    FAIL() << "Expected SchemaError";
  }
  catch (const ldc_hydro::SchemaError& e)
  {
    EXPECT_NE(std::string{e.what()}.find("Displacement Table"),
              std::string::npos);
  }
}

TEST_F(ShipDatabaseTest, MissingFileThrows)
{
  EXPECT_THROW((void)loadTableModel(dbPath_, logger_), std::runtime_error);
}

TEST_F(ShipDatabaseTest, BadDataInFileIsSchemaError)
{
  auto workbook = ldc_test::makeWorkbook();
  workbook.sheets[ldc_hydro::kCrossCurveSheet].columns[3] = "KN at twenty°";
  writeFixture(workbook);

  EXPECT_THROW((void)loadTableModel(dbPath_, logger_), ldc_hydro::SchemaError);
}
