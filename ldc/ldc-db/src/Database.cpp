// ldc/ldc-db/src/Database.cpp
#include "ldc-db/src/Database.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ldc_db
{

Database::Database(std::string dbUrl,
                   std::shared_ptr<spdlog::logger> logger,
                   DBOpenCondition openCond)
  : logger_(std::move(logger)), dbUrl_(std::move(dbUrl))
{
  logger_->debug("Opening database: {}", dbUrl_);

  sqlite3* rawDb = nullptr;
  int rc = sqlite3_open_v2(
    dbUrl_.c_str(), &rawDb, static_cast<int>(openCond), nullptr);

  if (rc != SQLITE_OK)
  {
    const char* errMsg = rawDb ? sqlite3_errmsg(rawDb) : nullptr;
    std::string errorStr = errMsg ? errMsg : sqlite3_errstr(rc);

    logger_->error("Failed to open database {}: {}", dbUrl_, errorStr);

    // Close the database if it was partially opened
    if (rawDb)
    {
      sqlite3_close(rawDb);
    }

    throw std::runtime_error("Failed to open database " + dbUrl_ + ": " +
                             errorStr);
  }

  // Move ownership to the smart pointer
  db_.reset(rawDb);

  logger_->info("Database opened: {}", dbUrl_);

  // Journal mode cannot be changed on a read-only connection
  if (openCond != DBOpenCondition::OpenReadOnly)
  {
    executeQuery("PRAGMA journal_mode = WAL;");
  }
}

Database::~Database()
{
  if (db_)
  {
    logger_->debug("Closing database: {}", dbUrl_);
  }
}

Database::Database(Database&& other) noexcept
  : db_(std::move(other.db_)),
    logger_(std::move(other.logger_)),
    dbUrl_(std::move(other.dbUrl_))
{
  logger_->trace("Database moved via move constructor");
}

Database& Database::operator=(Database&& other) noexcept
{
  if (this != &other)
  {
    // First log with our current logger before we lose it
    if (logger_)
    {
      logger_->trace("Database moved via move assignment from: {}",
                     other.dbUrl_);
    }

    db_ = std::move(other.db_);
    logger_ = std::move(other.logger_);
    dbUrl_ = std::move(other.dbUrl_);
  }
  return *this;
}

bool Database::executeQuery(const std::string& query)
{
  logger_->debug("Executing query: {}", query);

  char* errMsg = nullptr;
  int rc = sqlite3_exec(db_.get(), query.c_str(), nullptr, nullptr, &errMsg);

  if (rc != SQLITE_OK)
  {
    if (errMsg)
    {
      logger_->error("SQL error: {}", errMsg);
      sqlite3_free(errMsg);
    }
    else
    {
      logger_->error("Unknown SQL error");
    }
    return false;
  }

  logger_->trace("Query executed successfully");
  return true;
}

bool Database::beginTransaction()
{
  logger_->debug("Beginning transaction");
  return executeQuery("BEGIN TRANSACTION;");
}

bool Database::commitTransaction()
{
  logger_->debug("Committing transaction");
  return executeQuery("COMMIT;");
}

bool Database::rollbackTransaction()
{
  logger_->debug("Rolling back transaction");
  return executeQuery("ROLLBACK;");
}

std::string Database::quoteIdentifier(const std::string& name)
{
  std::string quoted{"\""};
  for (char c : name)
  {
    if (c == '"')
    {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

Database::Statement Database::prepare(const std::string& sql) const
{
  sqlite3_stmt* raw = nullptr;
  int rc = sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr);
  Statement stmt{raw};
  if (rc != SQLITE_OK)
  {
    std::string errorStr = sqlite3_errmsg(db_.get());
    logger_->error("Failed to prepare '{}': {}", sql, errorStr);
    throw std::runtime_error("Failed to prepare statement: " + errorStr);
  }
  return stmt;
}

bool Database::tableExists(const std::string& table) const
{
  auto stmt =
    prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
  sqlite3_bind_text(stmt.get(), 1, table.c_str(), -1, SQLITE_TRANSIENT);
  return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

std::vector<std::string> Database::tableNames() const
{
  auto stmt = prepare(
    "SELECT name FROM sqlite_master WHERE type = 'table' "
    "AND name NOT LIKE 'sqlite_%' ORDER BY rowid;");

  std::vector<std::string> names;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW)
  {
    names.emplace_back(
      reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0)));
  }
  return names;
}

ldc_hydro::Sheet Database::selectAll(const std::string& table) const
{
  const std::string sql =
    "SELECT * FROM " + quoteIdentifier(table) + " ORDER BY rowid;";
  logger_->debug("Reading table: {}", table);
  auto stmt = prepare(sql);

  ldc_hydro::Sheet sheet;
  const int columnCount = sqlite3_column_count(stmt.get());
  sheet.columns.reserve(static_cast<size_t>(columnCount));
  for (int c = 0; c < columnCount; ++c)
  {
    sheet.columns.emplace_back(sqlite3_column_name(stmt.get(), c));
  }

  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
  {
    std::vector<ldc_hydro::Cell> row;
    row.reserve(static_cast<size_t>(columnCount));
    for (int c = 0; c < columnCount; ++c)
    {
      switch (sqlite3_column_type(stmt.get(), c))
      {
        case SQLITE_INTEGER:
        case SQLITE_FLOAT:
          row.emplace_back(sqlite3_column_double(stmt.get(), c));
          break;
        case SQLITE_TEXT:
          row.emplace_back(std::string{reinterpret_cast<const char*>(
            sqlite3_column_text(stmt.get(), c))});
          break;
        default:
          row.emplace_back(std::monostate{});
          break;
      }
    }
    sheet.rows.push_back(std::move(row));
  }

  if (rc != SQLITE_DONE)
  {
    std::string errorStr = sqlite3_errmsg(db_.get());
    logger_->error("Failed reading table {}: {}", table, errorStr);
    throw std::runtime_error("Failed reading table " + table + ": " + errorStr);
  }

  logger_->debug("Read {} rows x {} columns from {}",
                 sheet.rows.size(),
                 sheet.columns.size(),
                 table);
  return sheet;
}

void Database::insertSheet(const std::string& table, const ldc_hydro::Sheet& sheet)
{
  if (sheet.columns.empty())
  {
    throw std::runtime_error("Cannot create table " + table +
                             " without columns");
  }

  std::string create = "CREATE TABLE " + quoteIdentifier(table) + " (";
  std::string insert = "INSERT INTO " + quoteIdentifier(table) + " VALUES (";
  for (size_t c = 0; c < sheet.columns.size(); ++c)
  {
    if (c > 0)
    {
      create += ", ";
      insert += ", ";
    }
    create += quoteIdentifier(sheet.columns[c]);
    insert += "?";
  }
  create += ");";
  insert += ");";

  if (!executeQuery(create))
  {
    throw std::runtime_error("Failed to create table " + table);
  }

  if (!beginTransaction())
  {
    throw std::runtime_error("Failed to begin transaction for " + table);
  }

  try
  {
    auto stmt = prepare(insert);
    for (size_t r = 0; r < sheet.rows.size(); ++r)
    {
      sqlite3_reset(stmt.get());
      sqlite3_clear_bindings(stmt.get());
      for (size_t c = 0; c < sheet.columns.size(); ++c)
      {
        const auto index = static_cast<int>(c + 1);
        const auto& cell = sheet.cell(r, c);
        if (const auto* number = std::get_if<double>(&cell))
        {
          sqlite3_bind_double(stmt.get(), index, *number);
        }
        else if (const auto* text = std::get_if<std::string>(&cell))
        {
          sqlite3_bind_text(
            stmt.get(), index, text->c_str(), -1, SQLITE_TRANSIENT);
        }
        else
        {
          sqlite3_bind_null(stmt.get(), index);
        }
      }
      if (sqlite3_step(stmt.get()) != SQLITE_DONE)
      {
        throw std::runtime_error("Failed to insert row " +
                                 std::to_string(r + 1) + " into " + table +
                                 ": " + sqlite3_errmsg(db_.get()));
      }
    }
  }
  catch (const std::exception& e)
  {
    logger_->error("{}", e.what());
    if (!rollbackTransaction())
    {
      logger_->error("Rollback failed for {}", table);
    }
    throw;
  }

  if (!commitTransaction())
  {
    throw std::runtime_error("Failed to commit rows for " + table);
  }
  logger_->debug("Inserted {} rows into {}", sheet.rows.size(), table);
}

std::optional<Database> buildDatabase(const std::string& dbUrl,
                                      DBOpenCondition openCond,
                                      std::optional<std::string> loggerName)
{
  try
  {
    // Create a default logger name if none provided
    std::string actualLoggerName;
    if (loggerName)
    {
      actualLoggerName = *loggerName;
    }
    else
    {
      // Extract filename from path for default logger name
      std::filesystem::path filePath(dbUrl);
      actualLoggerName = "db-" + filePath.filename().string();
    }

    // Reuse a logger registered by an earlier connection to the same file
    auto logger = spdlog::get(actualLoggerName);
    if (!logger)
    {
      logger = spdlog::stdout_color_mt(actualLoggerName);
      logger->set_level(spdlog::level::info);
    }

    return Database(dbUrl, logger, openCond);
  }
  catch (const spdlog::spdlog_ex& e)
  {
    std::cerr << "Logger initialization failed: " << e.what() << std::endl;
    return std::nullopt;
  }
  catch (const std::exception& e)
  {
    std::cerr << "Failed to build database: " << e.what() << std::endl;
    return std::nullopt;
  }
}

}  // namespace ldc_db
