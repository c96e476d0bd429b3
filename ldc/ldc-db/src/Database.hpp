// ldc/ldc-db/src/Database.hpp
#ifndef LDC_DB_DATABASE_HPP
#define LDC_DB_DATABASE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "ldc-hydro/src/Workbook.hpp"

namespace ldc_db
{

/*!
 * @brief Enum class for SQLite open conditions
 */
enum class DBOpenCondition : int
{
  OpenReadOnly = SQLITE_OPEN_READONLY,
  OpenReadWrite = SQLITE_OPEN_READWRITE,
  OpenCreate = SQLITE_OPEN_CREATE | SQLITE_OPEN_READWRITE,
};

/**
 * @brief Wraps a SQLite database connection with integrated logging
 *
 * Tables are exchanged as ldc_hydro::Sheet values so that a ship data file
 * stored in SQLite reads exactly like a spreadsheet export: one table per
 * sheet, one column per header.
 */
class Database
{
public:
  /**
   * @brief Constructs a database connection
   *
   * @param dbUrl URL to the SQLite database
   * @param logger Shared pointer to a logger instance
   * @param openCond Condition to open the database with
   * @throws std::runtime_error if the database cannot be opened
   */
  Database(std::string dbUrl,
           std::shared_ptr<spdlog::logger> logger,
           DBOpenCondition openCond = DBOpenCondition::OpenReadWrite);

  /**
   * @brief Destructor automatically closes the database connection
   */
  ~Database();

  // Delete copy constructor and copy assignment
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // Allow move constructor and move assignment
  Database(Database&& other) noexcept;
  Database& operator=(Database&& other) noexcept;

  /**
   * @brief Get the raw SQLite database pointer
   */
  sqlite3* getRawDb() const
  {
    return db_.get();
  }

  /**
   * @brief Execute a raw SQL statement
   *
   * @param query SQL to execute
   * @return true if successful, false otherwise
   */
  bool executeQuery(const std::string& query);

  bool beginTransaction();
  bool commitTransaction();
  bool rollbackTransaction();

  /**
   * @brief Whether a table named @p table exists
   */
  bool tableExists(const std::string& table) const;

  /**
   * @brief Names of all user tables, in creation order
   */
  std::vector<std::string> tableNames() const;

  /**
   * @brief Read a whole table in rowid order
   *
   * NULL becomes an empty cell, INTEGER and REAL become numbers, TEXT stays
   * text. BLOB columns are not part of any ship data layout and are read as
   * empty cells.
   *
   * @throws std::runtime_error if the table cannot be read
   */
  ldc_hydro::Sheet selectAll(const std::string& table) const;

  /**
   * @brief Create @p table with the sheet's headers as columns and insert all
   * of its rows in one transaction
   *
   * @throws std::runtime_error if the table already exists or an insert fails
   */
  void insertSheet(const std::string& table, const ldc_hydro::Sheet& sheet);

  /**
   * @brief Get the logger instance
   */
  std::shared_ptr<spdlog::logger> getLogger() const
  {
    return logger_;
  }

  /**
   * @brief Quote an identifier for use in SQL ("KN at 10°" -> "\"KN at 10°\"")
   */
  static std::string quoteIdentifier(const std::string& name);

private:
  // Custom deleter for sqlite3 pointer
  struct Sqlite3Deleter
  {
    void operator()(sqlite3* db) const
    {
      if (db)
      {
        sqlite3_close(db);
      }
    }
  };

  struct StatementDeleter
  {
    void operator()(sqlite3_stmt* stmt) const
    {
      if (stmt)
      {
        sqlite3_finalize(stmt);
      }
    }
  };

  using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

  Statement prepare(const std::string& sql) const;

  // SQLite database smart pointer with custom deleter
  std::unique_ptr<sqlite3, Sqlite3Deleter> db_;

  // Logger instance
  std::shared_ptr<spdlog::logger> logger_;

  // Database URL (useful for logging)
  std::string dbUrl_;
};

/**
 * @brief Factory function to build a database connection
 *
 * @param dbUrl URL to the SQLite database
 * @param openCond Condition to open the database with
 * @param loggerName Name to use for the logger (defaults to "db-[filename]")
 * @return The Database if successful, std::nullopt otherwise
 */
std::optional<Database> buildDatabase(
  const std::string& dbUrl,
  DBOpenCondition openCond = DBOpenCondition::OpenReadWrite,
  std::optional<std::string> loggerName = std::nullopt);

}  // namespace ldc_db

#endif  // LDC_DB_DATABASE_HPP
