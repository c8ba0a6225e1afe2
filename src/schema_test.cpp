#include <string>
#include <tuple>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <mw/database.hpp>

#include "schema.hpp"
#include "test_utils.hpp"

using ::testing::IsSupersetOf;

namespace {

E<std::vector<std::string>> tableNames(mw::SQLite& db)
{
    ASSIGN_OR_RETURN(auto sql, db.statementFromStr(
        "SELECT name FROM sqlite_master WHERE type = 'table';"));
    ASSIGN_OR_RETURN(auto rows, db.eval<std::string>(std::move(sql)));
    std::vector<std::string> names;
    for(const auto& row : rows)
    {
        names.push_back(std::get<0>(row));
    }
    return names;
}

} // namespace

TEST(Schema, CreatesAllTables)
{
    auto db = mw::SQLite::connectMemory();
    ASSERT_TRUE(db.has_value());
    ASSERT_TRUE(ensureSchema(**db).has_value());
    ASSIGN_OR_FAIL(auto names, tableNames(**db));
    EXPECT_THAT(names, IsSupersetOf(requiredTables()));
}

TEST(Schema, KeepsExistingData)
{
    auto db = mw::SQLite::connectMemory();
    ASSERT_TRUE(db.has_value());
    ASSERT_TRUE(ensureSchema(**db).has_value());
    ASSERT_TRUE((*db)->execute(
        "INSERT INTO Tags (Name, Colour, AddedOn) VALUES ('a', 'red', 0);")
                .has_value());
    ASSERT_TRUE(ensureSchema(**db).has_value());
    auto count = (*db)->evalToValue<int>("SELECT count(*) FROM Tags;");
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 1);
}

TEST(Schema, RecreatesMissingTables)
{
    auto db = mw::SQLite::connectMemory();
    ASSERT_TRUE(db.has_value());
    ASSERT_TRUE(ensureSchema(**db).has_value());
    ASSERT_TRUE((*db)->execute("DROP TABLE PostTags;").has_value());
    ASSERT_TRUE((*db)->execute("DROP TABLE Comments;").has_value());

    ASSERT_TRUE(ensureSchema(**db).has_value());
    ASSIGN_OR_FAIL(auto names, tableNames(**db));
    EXPECT_THAT(names, IsSupersetOf(requiredTables()));
}
