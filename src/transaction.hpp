#pragma once

#include <mw/database.hpp>

#include "error.hpp"

// RAII transaction on a SQLite connection.
//
// The transaction is started with BEGIN IMMEDIATE, so the write lock
// is taken up front and the whole unit runs serialized against
// other writers. Unless commit() succeeds, the destructor rolls
// everything back. Returning early on an error is therefore enough to
// undo a half-done multi-statement operation.
//
// Example:
//
//     ASSIGN_OR_RETURN(auto txn, Transaction::begin(db));
//     DO_OR_RETURN(db.execute("DELETE FROM ..."));
//     DO_OR_RETURN(db.execute("DELETE FROM ..."));
//     return txn.commit();
class Transaction
{
public:
    static E<Transaction> begin(mw::SQLite& db);

    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& rhs) noexcept;
    Transaction& operator=(Transaction&& rhs) = delete;

    E<void> commit();
    bool active() const { return db != nullptr; }

private:
    explicit Transaction(mw::SQLite& db) : db(&db) {}
    void rollback();

    // Null once committed, rolled back, or moved from.
    mw::SQLite* db;
};
