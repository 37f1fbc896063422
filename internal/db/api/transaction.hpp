#pragma once

namespace capacity::db {

/*
  Unit of work spanning every row an entry point touches.

  For all backends:

  - Writes, including id counter advances, are invisible until Commit()
  - Rollback() or destruction without Commit() discards them all

  Isolation per backend:
    Memory    snapshot copy, commit refused if another commit landed first
    SQLite    BEGIN IMMEDIATE, one writer per connection
    Postgres  pqxx::work on a pooled connection
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace capacity::db
