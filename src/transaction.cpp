#include <mw/database.hpp>
#include <mw/error.hpp>
#include <spdlog/spdlog.h>

#include "error.hpp"
#include "transaction.hpp"

E<Transaction> Transaction::begin(mw::SQLite& db)
{
    auto result = db.execute("BEGIN IMMEDIATE;");
    if(!result.has_value())
    {
        spdlog::error("Failed to begin transaction: {}",
                      mw::errorMsg(result.error()));
        return std::unexpected(StoreUnavailable(result.error()));
    }
    return Transaction(db);
}

Transaction::Transaction(Transaction&& rhs) noexcept : db(rhs.db)
{
    rhs.db = nullptr;
}

Transaction::~Transaction()
{
    if(active())
    {
        rollback();
    }
}

E<void> Transaction::commit()
{
    if(!active())
    {
        return std::unexpected(StoreUnavailable("Transaction is not active."));
    }
    auto result = db->execute("COMMIT;");
    if(!result.has_value())
    {
        spdlog::error("Failed to commit transaction: {}",
                      mw::errorMsg(result.error()));
        rollback();
        return std::unexpected(StoreUnavailable(result.error()));
    }
    db = nullptr;
    return {};
}

void Transaction::rollback()
{
    auto result = db->execute("ROLLBACK;");
    if(!result.has_value())
    {
        spdlog::error("Failed to roll back transaction: {}",
                      mw::errorMsg(result.error()));
    }
    db = nullptr;
}
