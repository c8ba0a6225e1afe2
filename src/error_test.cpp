#include <variant>

#include <gtest/gtest.h>
#include <mw/error.hpp>

#include "error.hpp"

TEST(Error, CarriesMessage)
{
    Error e = notFoundError("User with ID 1 not found.");
    EXPECT_TRUE(std::holds_alternative<NotFound>(e));
    EXPECT_EQ(errorMsg(e), "User with ID 1 not found.");
    EXPECT_EQ(errorMsg(uniqueError("dup")), "dup");
    EXPECT_EQ(errorMsg(foreignKeyError("fk")), "fk");
}

TEST(Error, StoreErrorsBecomeStoreUnavailable)
{
    E<int> result = std::unexpected(mw::runtimeError("disk I/O error"));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<StoreUnavailable>(result.error()));
    EXPECT_NE(errorMsg(result.error()).find("disk I/O error"),
              std::string::npos);
}
