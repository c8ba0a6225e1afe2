#include <algorithm>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <mw/database.hpp>
#include <mw/error.hpp>
#include <spdlog/spdlog.h>

#include "error.hpp"
#include "schema.hpp"

namespace {

// Timestamps are seconds since UNIX epoch.
const std::unordered_map<std::string, std::string>& tableDefinitions()
{
    static const std::unordered_map<std::string, std::string> defs = {
        {"Users", R"(
CREATE TABLE IF NOT EXISTS Users
(Id INTEGER PRIMARY KEY AUTOINCREMENT,
 FirstName TEXT NOT NULL,
 LastName TEXT NOT NULL,
 Email TEXT NOT NULL UNIQUE,
 -- PBKDF2-SHA512 credential, in the “$pbkdf2-sha512$...” format.
 Password TEXT NOT NULL,
 Admin BOOLEAN NOT NULL DEFAULT FALSE,
 Bio TEXT,
 AddedOn INTEGER NOT NULL
);)"},

        {"Posts", R"(
CREATE TABLE IF NOT EXISTS Posts
(Id INTEGER PRIMARY KEY AUTOINCREMENT,
 CreatorId INTEGER NOT NULL,
 Title TEXT NOT NULL,
 Content TEXT NOT NULL,
 AddedOn INTEGER NOT NULL,
 ExpiresOn INTEGER,
 FOREIGN KEY (CreatorId) REFERENCES Users (Id) ON DELETE CASCADE
);)"},

        {"Tags", R"(
CREATE TABLE IF NOT EXISTS Tags
(Id INTEGER PRIMARY KEY AUTOINCREMENT,
 Name TEXT NOT NULL,
 Description TEXT,
 Colour TEXT NOT NULL,
 AddedOn INTEGER NOT NULL
);)"},

        {"Comments", R"(
CREATE TABLE IF NOT EXISTS Comments
(Id INTEGER PRIMARY KEY AUTOINCREMENT,
 PostId INTEGER NOT NULL,
 UserId INTEGER NOT NULL,
 Content TEXT NOT NULL,
 AddedOn INTEGER NOT NULL,
 EditedOn INTEGER,
 -- Non-null once the comment is removed.
 DeletedOn INTEGER,
 FOREIGN KEY (PostId) REFERENCES Posts (Id) ON DELETE CASCADE,
 FOREIGN KEY (UserId) REFERENCES Users (Id) ON DELETE CASCADE
);)"},

        {"PostTags", R"(
CREATE TABLE IF NOT EXISTS PostTags
(PostId INTEGER NOT NULL,
 TagId INTEGER NOT NULL,
 FOREIGN KEY (PostId) REFERENCES Posts (Id) ON DELETE CASCADE,
 FOREIGN KEY (TagId) REFERENCES Tags (Id) ON DELETE CASCADE
);)"},
    };
    return defs;
}

E<std::vector<std::string>> existingTables(mw::SQLite& db)
{
    ASSIGN_OR_RETURN(auto sql, db.statementFromStr(
        "SELECT name FROM sqlite_master WHERE type = 'table';"));
    ASSIGN_OR_RETURN(auto rows, db.eval<std::string>(std::move(sql)));
    std::vector<std::string> names;
    names.reserve(rows.size());
    for(const auto& row : rows)
    {
        names.push_back(std::get<0>(row));
    }
    return names;
}

} // namespace

const std::vector<std::string>& requiredTables()
{
    static const std::vector<std::string> tables = {
        "Users", "Posts", "Tags", "Comments", "PostTags"};
    return tables;
}

E<void> ensureSchema(mw::SQLite& db)
{
    spdlog::debug("Checking that the tables exist in the database...");
    ASSIGN_OR_RETURN(std::vector<std::string> tables, existingTables(db));

    for(const std::string& name : requiredTables())
    {
        if(std::find(std::begin(tables), std::end(tables), name) !=
           std::end(tables))
        {
            continue;
        }
        if(!tables.empty())
        {
            spdlog::warn("Table {} does not exist in the database. "
                         "Creating it.", name);
        }
        else
        {
            spdlog::debug("Creating table {}...", name);
        }

        const std::string& ddl = tableDefinitions().at(name);
        auto result = db.execute(ddl);
        if(!result.has_value())
        {
            spdlog::error("Failed to create table {}: {}", name,
                          mw::errorMsg(result.error()));
            return std::unexpected(StoreUnavailable(result.error()));
        }
    }
    return {};
}
