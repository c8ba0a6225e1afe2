#include <utility>

#include <gtest/gtest.h>
#include <mw/database.hpp>

#include "test_utils.hpp"
#include "transaction.hpp"

class TransactionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto result = mw::SQLite::connectMemory();
        ASSERT_TRUE(result.has_value());
        db = *std::move(result);
        ASSERT_TRUE(db->execute("CREATE TABLE Items (Value INTEGER);")
                    .has_value());
    }

    int count()
    {
        auto result = db->evalToValue<int>("SELECT count(*) FROM Items;");
        return result.has_value() ? *result : -1;
    }

    std::unique_ptr<mw::SQLite> db;
};

TEST_F(TransactionTest, CommitKeepsChanges)
{
    ASSIGN_OR_FAIL(auto txn, Transaction::begin(*db));
    EXPECT_TRUE(txn.active());
    ASSERT_TRUE(db->execute("INSERT INTO Items VALUES (1);").has_value());
    ASSERT_TRUE(txn.commit().has_value());
    EXPECT_FALSE(txn.active());
    EXPECT_EQ(count(), 1);
    EXPECT_FALSE(txn.commit().has_value());
}

TEST_F(TransactionTest, DestructionRollsBack)
{
    {
        ASSIGN_OR_FAIL(auto txn, Transaction::begin(*db));
        ASSERT_TRUE(db->execute("INSERT INTO Items VALUES (1);").has_value());
        ASSERT_TRUE(db->execute("INSERT INTO Items VALUES (2);").has_value());
    }
    EXPECT_EQ(count(), 0);
}

TEST_F(TransactionTest, MovedFromTransactionIsInactive)
{
    ASSIGN_OR_FAIL(auto txn, Transaction::begin(*db));
    Transaction other(std::move(txn));
    EXPECT_FALSE(txn.active());
    EXPECT_TRUE(other.active());
    ASSERT_TRUE(db->execute("INSERT INTO Items VALUES (1);").has_value());
    ASSERT_TRUE(other.commit().has_value());
    EXPECT_EQ(count(), 1);
}
