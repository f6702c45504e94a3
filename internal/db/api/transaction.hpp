#pragma once

namespace flowstore::db {

/*
  Abstract transaction.

  Semantics guaranteed by every backend:

  - Changes are invisible to other connections until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() finished the transaction
  virtual bool IsFinished() const = 0;
};

}
