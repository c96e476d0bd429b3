#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/sinks/null_sink.h>

#include "ldc-db/src/Database.hpp"

namespace ldc_db_test
{

class DatabaseTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    // Null logger keeps the test output clean
    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    testLogger_ = std::make_shared<spdlog::logger>("test_logger", nullSink);

    tempDbPath_ =
      "test_db_" +
      std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count()) +
      ".db";
  }

  void TearDown() override
  {
    for (const char* suffix : {"", "-wal", "-shm"})
    {
      const auto path = tempDbPath_ + suffix;
      if (std::filesystem::exists(path))
      {
        std::filesystem::remove(path);
      }
    }
  }

  ldc_db::Database openCreate()
  {
    return ldc_db::Database{
      tempDbPath_, testLogger_, ldc_db::DBOpenCondition::OpenCreate};
  }

  std::shared_ptr<spdlog::logger> testLogger_;
  std::string tempDbPath_;
};

// ============================================================================
// Connection and raw SQL
// ============================================================================

TEST_F(DatabaseTest, OpenAndCreateDatabase)
{
  auto db = openCreate();

  ASSERT_TRUE(std::filesystem::exists(tempDbPath_));
  ASSERT_TRUE(db.executeQuery("SELECT 1"));
}

TEST_F(DatabaseTest, OpenMissingFileReadOnlyThrows)
{
  EXPECT_THROW((ldc_db::Database{tempDbPath_,
                                 testLogger_,
                                 ldc_db::DBOpenCondition::OpenReadOnly}),
               std::runtime_error);
  EXPECT_FALSE(std::filesystem::exists(tempDbPath_));
}

TEST_F(DatabaseTest, InvalidQuery)
{
  auto db = openCreate();

  ASSERT_FALSE(db.executeQuery("CREATE TABLES invalid_syntax"));
}

TEST_F(DatabaseTest, TransactionRollback)
{
  auto db = openCreate();
  ASSERT_TRUE(db.executeQuery("CREATE TABLE t (value TEXT)"));
  ASSERT_TRUE(db.executeQuery("INSERT INTO t (value) VALUES ('permanent')"));

  ASSERT_TRUE(db.beginTransaction());
  ASSERT_TRUE(db.executeQuery("INSERT INTO t (value) VALUES ('gone 1')"));
  ASSERT_TRUE(db.executeQuery("INSERT INTO t (value) VALUES ('gone 2')"));
  ASSERT_TRUE(db.rollbackTransaction());

  EXPECT_EQ(db.selectAll("t").rows.size(), 1u);
}

TEST_F(DatabaseTest, BuildDatabaseFactory)
{
  auto dbOpt =
    ldc_db::buildDatabase(tempDbPath_, ldc_db::DBOpenCondition::OpenCreate);

  ASSERT_TRUE(dbOpt.has_value());
  ASSERT_TRUE(std::filesystem::exists(tempDbPath_));
  ASSERT_TRUE(dbOpt->executeQuery("CREATE TABLE test (id INTEGER PRIMARY KEY)"));

  // A second connection reuses the registered logger
  auto again =
    ldc_db::buildDatabase(tempDbPath_, ldc_db::DBOpenCondition::OpenReadWrite);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->getLogger(), dbOpt->getLogger());
}

TEST_F(DatabaseTest, MoveKeepsConnection)
{
  auto db = openCreate();
  ldc_db::Database moved{std::move(db)};

  EXPECT_NE(moved.getRawDb(), nullptr);
  EXPECT_TRUE(moved.executeQuery("SELECT 1"));
}

// ============================================================================
// Sheet tables
// ============================================================================

TEST_F(DatabaseTest, TableExistsAndNames)
{
  auto db = openCreate();
  ASSERT_TRUE(db.executeQuery("CREATE TABLE \"KN Curves\" (a REAL)"));
  ASSERT_TRUE(db.executeQuery("CREATE TABLE \"Displacement Table\" (a REAL)"));

  EXPECT_TRUE(db.tableExists("KN Curves"));
  EXPECT_FALSE(db.tableExists("Ship Particulars"));
  EXPECT_EQ(db.tableNames(),
            (std::vector<std::string>{"KN Curves", "Displacement Table"}));
}

TEST_F(DatabaseTest, SelectAllMapsColumnTypes)
{
  auto db = openCreate();
  ASSERT_TRUE(db.executeQuery("CREATE TABLE t (i INTEGER, r REAL, s TEXT, n)"));
  ASSERT_TRUE(db.executeQuery("INSERT INTO t VALUES (3, 2.5, 'MV', NULL)"));

  const auto sheet = db.selectAll("t");

  ASSERT_EQ(sheet.columns, (std::vector<std::string>{"i", "r", "s", "n"}));
  ASSERT_EQ(sheet.rows.size(), 1u);
  EXPECT_EQ(std::get<double>(sheet.rows[0][0]), 3.0);
  EXPECT_EQ(std::get<double>(sheet.rows[0][1]), 2.5);
  EXPECT_EQ(std::get<std::string>(sheet.rows[0][2]), "MV");
  EXPECT_TRUE(std::holds_alternative<std::monostate>(sheet.rows[0][3]));
}

TEST_F(DatabaseTest, SelectAllMissingTableThrows)
{
  auto db = openCreate();

  EXPECT_THROW((void)db.selectAll("nope"), std::runtime_error);
}

TEST_F(DatabaseTest, InsertSheetPreservesHeadersAndRowOrder)
{
  auto db = openCreate();

  ldc_hydro::Sheet sheet;
  sheet.columns = {"Displacement (tonnes)", "KN at 10°", "20°"};
  sheet.rows.push_back({3000.0, 0.5, 0.9});
  sheet.rows.push_back({1000.0, 0.3, std::string{"0.6"}});
  sheet.rows.push_back({2000.0});  // short row, trailing cells NULL

  db.insertSheet("KN Curves", sheet);
  const auto read = db.selectAll("KN Curves");

  EXPECT_EQ(read.columns, sheet.columns);
  ASSERT_EQ(read.rows.size(), 3u);
  EXPECT_EQ(std::get<double>(read.rows[0][0]), 3000.0);
  EXPECT_EQ(std::get<double>(read.rows[1][0]), 1000.0);
  EXPECT_EQ(std::get<std::string>(read.rows[1][2]), "0.6");
  EXPECT_TRUE(std::holds_alternative<std::monostate>(read.rows[2][1]));
}

TEST_F(DatabaseTest, InsertSheetTwiceThrows)
{
  auto db = openCreate();

  ldc_hydro::Sheet sheet;
  sheet.columns = {"a"};
  db.insertSheet("t", sheet);

  EXPECT_THROW(db.insertSheet("t", sheet), std::runtime_error);
  EXPECT_THROW(db.insertSheet("empty", ldc_hydro::Sheet{}), std::runtime_error);
}

TEST(Database, QuoteIdentifier)
{
  EXPECT_EQ(ldc_db::Database::quoteIdentifier("KN Curves"), "\"KN Curves\"");
  EXPECT_EQ(ldc_db::Database::quoteIdentifier("a\"b"), "\"a\"\"b\"");
}

}  // namespace ldc_db_test
