#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <mw/database.hpp>
#include <mw/error.hpp>
#include <mw/utils.hpp>
#include <spdlog/spdlog.h>

#include "credential.hpp"
#include "database.hpp"
#include "error.hpp"
#include "records.hpp"
#include "schema.hpp"
#include "transaction.hpp"

namespace {

int64_t nowSeconds()
{
    return mw::timeToSeconds(mw::Clock::now());
}

std::optional<int64_t> toSeconds(const std::optional<mw::Time>& t)
{
    if(!t.has_value())
    {
        return std::nullopt;
    }
    return mw::timeToSeconds(*t);
}

std::optional<mw::Time> fromSeconds(const std::optional<int64_t>& s)
{
    if(!s.has_value())
    {
        return std::nullopt;
    }
    return mw::secondsToTime(*s);
}

template<typename... Args>
E<void> run(mw::SQLite& db, const std::string& sql, const Args&... args)
{
    ASSIGN_OR_RETURN(auto stmt, db.statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(args...));
    auto result = db.execute(std::move(stmt));
    if(!result.has_value())
    {
        spdlog::error("Failed to execute SQL: {}", sql);
        return std::unexpected(StoreUnavailable(result.error()));
    }
    return {};
}

// Evaluate a “SELECT count(*) ...” query.
template<typename... Args>
E<bool> rowExists(mw::SQLite& db, const std::string& sql, const Args&... args)
{
    ASSIGN_OR_RETURN(auto stmt, db.statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(args...));
    ASSIGN_OR_RETURN(auto counts, db.eval<int64_t>(std::move(stmt)));
    return !counts.empty() && std::get<0>(counts[0]) > 0;
}

template<typename... Args>
E<std::vector<int64_t>> selectIds(mw::SQLite& db, const std::string& sql,
                                  const Args&... args)
{
    ASSIGN_OR_RETURN(auto stmt, db.statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(args...));
    ASSIGN_OR_RETURN(auto rows, db.eval<int64_t>(std::move(stmt)));
    std::vector<int64_t> ids;
    ids.reserve(rows.size());
    for(const auto& row : rows)
    {
        ids.push_back(std::get<0>(row));
    }
    return ids;
}

// The select*() functions below read whole rows. “condition” is
// whatever follows the FROM clause, and “args” are bound to its
// placeholders.

template<typename... Args>
E<std::vector<User>> selectUsers(mw::SQLite& db, std::string_view condition,
                                 const Args&... args)
{
    ASSIGN_OR_RETURN(auto stmt, db.statementFromStr(std::format(
        "SELECT Id, FirstName, LastName, Email, Password, Admin, Bio, "
        "AddedOn FROM Users {};", condition)));
    if constexpr(sizeof...(Args) > 0)
    {
        DO_OR_RETURN(stmt.bind(args...));
    }
    ASSIGN_OR_RETURN(
        auto rows,
        (db.eval<int64_t, std::string, std::string, std::string, std::string,
                 int, std::optional<std::string>, int64_t>(std::move(stmt))));

    std::vector<User> users;
    users.reserve(rows.size());
    for(const auto& row : rows)
    {
        User u;
        u.id = std::get<0>(row);
        u.first_name = std::get<1>(row);
        u.last_name = std::get<2>(row);
        u.email = std::get<3>(row);
        u.password = std::get<4>(row);
        u.admin = std::get<5>(row) != 0;
        u.bio = std::get<6>(row);
        u.added_on = mw::secondsToTime(std::get<7>(row));
        users.push_back(std::move(u));
    }
    return users;
}

template<typename... Args>
E<std::vector<Post>> selectPosts(mw::SQLite& db, std::string_view condition,
                                 const Args&... args)
{
    ASSIGN_OR_RETURN(auto stmt, db.statementFromStr(std::format(
        "SELECT Id, CreatorId, Title, Content, AddedOn, ExpiresOn "
        "FROM Posts {};", condition)));
    if constexpr(sizeof...(Args) > 0)
    {
        DO_OR_RETURN(stmt.bind(args...));
    }
    ASSIGN_OR_RETURN(
        auto rows,
        (db.eval<int64_t, int64_t, std::string, std::string, int64_t,
                 std::optional<int64_t>>(std::move(stmt))));

    std::vector<Post> posts;
    posts.reserve(rows.size());
    for(const auto& row : rows)
    {
        Post p;
        p.id = std::get<0>(row);
        p.creator_id = std::get<1>(row);
        p.title = std::get<2>(row);
        p.content = std::get<3>(row);
        p.added_on = mw::secondsToTime(std::get<4>(row));
        p.expires_on = fromSeconds(std::get<5>(row));
        posts.push_back(std::move(p));
    }
    return posts;
}

template<typename... Args>
E<std::vector<Tag>> selectTags(mw::SQLite& db, std::string_view condition,
                               const Args&... args)
{
    ASSIGN_OR_RETURN(auto stmt, db.statementFromStr(std::format(
        "SELECT Id, Name, Description, Colour, AddedOn FROM Tags {};",
        condition)));
    if constexpr(sizeof...(Args) > 0)
    {
        DO_OR_RETURN(stmt.bind(args...));
    }
    ASSIGN_OR_RETURN(
        auto rows,
        (db.eval<int64_t, std::string, std::optional<std::string>,
                 std::string, int64_t>(std::move(stmt))));

    std::vector<Tag> tags;
    tags.reserve(rows.size());
    for(const auto& row : rows)
    {
        Tag t;
        t.id = std::get<0>(row);
        t.name = std::get<1>(row);
        t.description = std::get<2>(row);
        t.colour = std::get<3>(row);
        t.added_on = mw::secondsToTime(std::get<4>(row));
        tags.push_back(std::move(t));
    }
    return tags;
}

// Only comments that are not removed are ever selected.
template<typename... Args>
E<std::vector<Comment>> selectComments(
    mw::SQLite& db, std::string_view condition, const Args&... args)
{
    ASSIGN_OR_RETURN(auto stmt, db.statementFromStr(std::format(
        "SELECT Id, PostId, UserId, Content, AddedOn, EditedOn, DeletedOn "
        "FROM Comments WHERE DeletedOn IS NULL {};", condition)));
    if constexpr(sizeof...(Args) > 0)
    {
        DO_OR_RETURN(stmt.bind(args...));
    }
    ASSIGN_OR_RETURN(
        auto rows,
        (db.eval<int64_t, int64_t, int64_t, std::string, int64_t,
                 std::optional<int64_t>, std::optional<int64_t>>(
            std::move(stmt))));

    std::vector<Comment> comments;
    comments.reserve(rows.size());
    for(const auto& row : rows)
    {
        Comment c;
        c.id = std::get<0>(row);
        c.post_id = std::get<1>(row);
        c.user_id = std::get<2>(row);
        c.content = std::get<3>(row);
        c.added_on = mw::secondsToTime(std::get<4>(row));
        c.edited_on = fromSeconds(std::get<5>(row));
        c.deleted_on = fromSeconds(std::get<6>(row));
        comments.push_back(std::move(c));
    }
    return comments;
}

} // namespace

// ========== Single fields =============================================>

E<std::string> DatabaseInterface::getUserFirstName(int64_t id)
{
    ASSIGN_OR_RETURN(User u, getUser(id));
    return u.first_name;
}

E<std::string> DatabaseInterface::getUserLastName(int64_t id)
{
    ASSIGN_OR_RETURN(User u, getUser(id));
    return u.last_name;
}

E<std::string> DatabaseInterface::getUserEmail(int64_t id)
{
    ASSIGN_OR_RETURN(User u, getUser(id));
    return u.email;
}

E<bool> DatabaseInterface::getUserAdmin(int64_t id)
{
    ASSIGN_OR_RETURN(User u, getUser(id));
    return u.admin;
}

E<std::optional<std::string>> DatabaseInterface::getUserBio(int64_t id)
{
    ASSIGN_OR_RETURN(User u, getUser(id));
    return u.bio;
}

E<mw::Time> DatabaseInterface::getUserAddedOn(int64_t id)
{
    ASSIGN_OR_RETURN(User u, getUser(id));
    return u.added_on;
}

E<int64_t> DatabaseInterface::getPostCreatorId(int64_t id)
{
    ASSIGN_OR_RETURN(Post p, getPost(id));
    return p.creator_id;
}

E<std::string> DatabaseInterface::getPostTitle(int64_t id)
{
    ASSIGN_OR_RETURN(Post p, getPost(id));
    return p.title;
}

E<std::string> DatabaseInterface::getPostContent(int64_t id)
{
    ASSIGN_OR_RETURN(Post p, getPost(id));
    return p.content;
}

E<mw::Time> DatabaseInterface::getPostAddedOn(int64_t id)
{
    ASSIGN_OR_RETURN(Post p, getPost(id));
    return p.added_on;
}

E<std::optional<mw::Time>> DatabaseInterface::getPostExpiresOn(int64_t id)
{
    ASSIGN_OR_RETURN(Post p, getPost(id));
    return p.expires_on;
}

E<std::string> DatabaseInterface::getTagName(int64_t id)
{
    ASSIGN_OR_RETURN(Tag t, getTag(id));
    return t.name;
}

E<std::optional<std::string>> DatabaseInterface::getTagDescription(int64_t id)
{
    ASSIGN_OR_RETURN(Tag t, getTag(id));
    return t.description;
}

E<std::string> DatabaseInterface::getTagColour(int64_t id)
{
    ASSIGN_OR_RETURN(Tag t, getTag(id));
    return t.colour;
}

E<mw::Time> DatabaseInterface::getTagAddedOn(int64_t id)
{
    ASSIGN_OR_RETURN(Tag t, getTag(id));
    return t.added_on;
}

E<int64_t> DatabaseInterface::getCommentPostId(int64_t id)
{
    ASSIGN_OR_RETURN(Comment c, getComment(id));
    return c.post_id;
}

E<int64_t> DatabaseInterface::getCommentUserId(int64_t id)
{
    ASSIGN_OR_RETURN(Comment c, getComment(id));
    return c.user_id;
}

E<std::string> DatabaseInterface::getCommentContent(int64_t id)
{
    ASSIGN_OR_RETURN(Comment c, getComment(id));
    return c.content;
}

E<mw::Time> DatabaseInterface::getCommentAddedOn(int64_t id)
{
    ASSIGN_OR_RETURN(Comment c, getComment(id));
    return c.added_on;
}

E<std::optional<mw::Time>> DatabaseInterface::getCommentEditedOn(int64_t id)
{
    ASSIGN_OR_RETURN(Comment c, getComment(id));
    return c.edited_on;
}

// ========== Connection ================================================>

E<std::unique_ptr<Database>> Database::connectFile(const std::string& path,
                                                   int password_rounds)
{
    spdlog::debug("Opening database at {}...", path);
    ASSIGN_OR_RETURN(auto conn, mw::SQLite::connectFile(path));
    std::unique_ptr<Database> result(
        new Database(std::move(conn), password_rounds));
    DO_OR_RETURN(result->init(true));
    return result;
}

E<std::unique_ptr<Database>> Database::connectMemory(int password_rounds)
{
    ASSIGN_OR_RETURN(auto conn, mw::SQLite::connectMemory());
    std::unique_ptr<Database> result(
        new Database(std::move(conn), password_rounds));
    DO_OR_RETURN(result->init(false));
    return result;
}

Database::Database(std::unique_ptr<mw::SQLite> conn, int password_rounds)
        : db(std::move(conn)), hasher(password_rounds)
{
}

E<void> Database::init(bool file_backed)
{
    if(file_backed)
    {
        DO_OR_RETURN(db->execute("PRAGMA journal_mode=WAL;"));
    }
    DO_OR_RETURN(db->execute("PRAGMA foreign_keys=ON;"));
    DO_OR_RETURN(ensureSchema(*db));
    ASSIGN_OR_RETURN(dummy_credential, hasher.hash("dummy password"));
    return {};
}

// ========== Users =====================================================>

E<int64_t> Database::addUser(const std::string& first_name,
                             const std::string& last_name,
                             const std::string& email,
                             const std::string& password)
{
    spdlog::info("Adding user {} {} ({}) to the database.", first_name,
                 last_name, email);
    ASSIGN_OR_RETURN(std::string credential, hasher.hash(password));

    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto txn, Transaction::begin(*db));
    ASSIGN_OR_RETURN(bool taken, emailTaken(email, std::nullopt));
    if(taken)
    {
        return std::unexpected(uniqueError(
            std::format("Email {} is already registered.", email)));
    }
    DO_OR_RETURN(run(*db, "INSERT INTO Users (FirstName, LastName, Email, "
                     "Password, AddedOn) VALUES (?, ?, ?, ?, ?);",
                     first_name, last_name, email, credential, nowSeconds()));
    int64_t id = db->lastInsertRowID();
    DO_OR_RETURN(txn.commit());
    return id;
}

E<User> Database::getUser(int64_t id)
{
    std::lock_guard<std::mutex> lock(db_lock);
    return fetchUser(id);
}

E<void> Database::modifyUser(int64_t id, const UserUpdate& update)
{
    spdlog::info("Modifying user {}.", id);
    std::optional<std::string> credential;
    if(update.password.has_value())
    {
        ASSIGN_OR_RETURN(credential, hasher.hash(*update.password));
    }

    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto txn, Transaction::begin(*db));
    ASSIGN_OR_RETURN(User user, fetchUser(id));
    if(update.email.has_value() && *update.email != user.email)
    {
        ASSIGN_OR_RETURN(bool taken, emailTaken(*update.email, id));
        if(taken)
        {
            return std::unexpected(uniqueError(std::format(
                "Email {} is already registered.", *update.email)));
        }
        user.email = *update.email;
    }
    if(update.first_name.has_value())
    {
        user.first_name = *update.first_name;
    }
    if(update.last_name.has_value())
    {
        user.last_name = *update.last_name;
    }
    if(credential.has_value())
    {
        user.password = *std::move(credential);
    }
    if(update.admin.has_value())
    {
        user.admin = *update.admin;
    }
    if(update.bio.has_value())
    {
        user.bio = *update.bio;
    }

    DO_OR_RETURN(run(*db, "UPDATE Users SET FirstName = ?, LastName = ?, "
                     "Email = ?, Password = ?, Admin = ?, Bio = ? "
                     "WHERE Id = ?;",
                     user.first_name, user.last_name, user.email,
                     user.password, user.admin ? 1 : 0, user.bio, id));
    return txn.commit();
}

E<void> Database::removeUser(int64_t id)
{
    spdlog::info("Removing user {} from the database.", id);
    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto txn, Transaction::begin(*db));
    ASSIGN_OR_RETURN(std::vector<int64_t> post_ids, selectIds(
        *db, "SELECT Id FROM Posts WHERE CreatorId = ?;", id));
    spdlog::debug("User {} has {} posts to remove.", id, post_ids.size());
    DO_OR_RETURN(deletePostRows(post_ids));
    // Comments the user left on posts of other users.
    DO_OR_RETURN(run(*db, "DELETE FROM Comments WHERE UserId = ?;", id));
    DO_OR_RETURN(run(*db, "DELETE FROM Users WHERE Id = ?;", id));
    return txn.commit();
}

E<bool> Database::checkUserExists(int64_t id)
{
    std::lock_guard<std::mutex> lock(db_lock);
    return userExists(id);
}

E<std::vector<User>> Database::users()
{
    std::lock_guard<std::mutex> lock(db_lock);
    return selectUsers(*db, "ORDER BY Id");
}

// ========== Posts =====================================================>

E<int64_t> Database::addPost(int64_t creator_id, const std::string& title,
                             const std::string& content,
                             std::optional<mw::Time> expires_on,
                             const std::vector<int64_t>& tags)
{
    spdlog::info("Adding post '{}' to the database.", title);
    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto txn, Transaction::begin(*db));
    ASSIGN_OR_RETURN(bool creator_exists, userExists(creator_id));
    if(!creator_exists)
    {
        return std::unexpected(foreignKeyError(
            std::format("User with ID {} not found.", creator_id)));
    }
    DO_OR_RETURN(run(*db, "INSERT INTO Posts (CreatorId, Title, Content, "
                     "AddedOn, ExpiresOn) VALUES (?, ?, ?, ?, ?);",
                     creator_id, title, content, nowSeconds(),
                     toSeconds(expires_on)));
    int64_t id = db->lastInsertRowID();
    DO_OR_RETURN(insertPostTags(id, uniqueIds(tags)));
    DO_OR_RETURN(txn.commit());
    return id;
}

E<Post> Database::getPost(int64_t id)
{
    std::lock_guard<std::mutex> lock(db_lock);
    return fetchPost(id);
}

E<void> Database::modifyPost(int64_t id, const PostUpdate& update)
{
    spdlog::info("Modifying post {}.", id);
    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto txn, Transaction::begin(*db));
    ASSIGN_OR_RETURN(Post post, fetchPost(id));
    if(update.title.has_value())
    {
        post.title = *update.title;
    }
    if(update.content.has_value())
    {
        post.content = *update.content;
    }
    if(update.expires_on.has_value())
    {
        post.expires_on = *update.expires_on;
    }
    DO_OR_RETURN(run(*db, "UPDATE Posts SET Title = ?, Content = ?, "
                     "ExpiresOn = ? WHERE Id = ?;",
                     post.title, post.content, toSeconds(post.expires_on), id));

    if(update.tags.has_value())
    {
        DO_OR_RETURN(run(*db, "DELETE FROM PostTags WHERE PostId = ?;", id));
        DO_OR_RETURN(insertPostTags(id, uniqueIds(*update.tags)));
    }
    return txn.commit();
}

E<void> Database::removePost(int64_t id)
{
    spdlog::info("Removing post {} from the database.", id);
    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto txn, Transaction::begin(*db));
    DO_OR_RETURN(deletePostRows({id}));
    return txn.commit();
}

E<bool> Database::checkPostExists(int64_t id)
{
    std::lock_guard<std::mutex> lock(db_lock);
    return postExists(id);
}

E<std::vector<Post>> Database::posts()
{
    std::lock_guard<std::mutex> lock(db_lock);
    return selectPosts(*db, "ORDER BY Id");
}

// ========== Tags ======================================================>

E<int64_t> Database::addTag(const std::string& name,
                            const std::optional<std::string>& description,
                            const std::string& colour)
{
    spdlog::info("Adding tag '{}' to the database.", name);
    std::lock_guard<std::mutex> lock(db_lock);
    DO_OR_RETURN(run(*db, "INSERT INTO Tags (Name, Description, Colour, "
                     "AddedOn) VALUES (?, ?, ?, ?);",
                     name, description, colour, nowSeconds()));
    return db->lastInsertRowID();
}

E<Tag> Database::getTag(int64_t id)
{
    std::lock_guard<std::mutex> lock(db_lock);
    return fetchTag(id);
}

E<void> Database::modifyTag(int64_t id, const TagUpdate& update)
{
    spdlog::info("Modifying tag {}.", id);
    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto txn, Transaction::begin(*db));
    ASSIGN_OR_RETURN(Tag tag, fetchTag(id));
    if(update.name.has_value())
    {
        tag.name = *update.name;
    }
    if(update.description.has_value())
    {
        tag.description = *update.description;
    }
    if(update.colour.has_value())
    {
        tag.colour = *update.colour;
    }
    DO_OR_RETURN(run(*db, "UPDATE Tags SET Name = ?, Description = ?, "
                     "Colour = ? WHERE Id = ?;",
                     tag.name, tag.description, tag.colour, id));
    return txn.commit();
}

// Removing a tag takes the posts carrying it along. Older versions
// of the forum did this, and existing deployments rely on it.
E<void> Database::removeTag(int64_t id)
{
    spdlog::info("Removing tag {} from the database.", id);
    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto txn, Transaction::begin(*db));
    ASSIGN_OR_RETURN(std::vector<int64_t> post_ids, selectIds(
        *db, "SELECT DISTINCT PostId FROM PostTags WHERE TagId = ?;", id));
    spdlog::debug("Tag {} is on {} posts to remove.", id, post_ids.size());
    DO_OR_RETURN(deletePostRows(post_ids));
    DO_OR_RETURN(run(*db, "DELETE FROM PostTags WHERE TagId = ?;", id));
    DO_OR_RETURN(run(*db, "DELETE FROM Tags WHERE Id = ?;", id));
    return txn.commit();
}

E<bool> Database::checkTagExists(int64_t id)
{
    std::lock_guard<std::mutex> lock(db_lock);
    return tagExists(id);
}

E<std::vector<Tag>> Database::tags()
{
    std::lock_guard<std::mutex> lock(db_lock);
    return selectTags(*db, "ORDER BY Id");
}

// ========== Comments ==================================================>

E<int64_t> Database::addComment(int64_t post_id, int64_t user_id,
                                const std::string& content)
{
    spdlog::info("Adding comment by user {} on post {} to the database.",
                 user_id, post_id);
    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto txn, Transaction::begin(*db));
    ASSIGN_OR_RETURN(bool post_exists, postExists(post_id));
    if(!post_exists)
    {
        return std::unexpected(foreignKeyError(
            std::format("Post with ID {} not found.", post_id)));
    }
    ASSIGN_OR_RETURN(bool user_exists, userExists(user_id));
    if(!user_exists)
    {
        return std::unexpected(foreignKeyError(
            std::format("User with ID {} not found.", user_id)));
    }
    DO_OR_RETURN(run(*db, "INSERT INTO Comments (PostId, UserId, Content, "
                     "AddedOn) VALUES (?, ?, ?, ?);",
                     post_id, user_id, content, nowSeconds()));
    int64_t id = db->lastInsertRowID();
    DO_OR_RETURN(txn.commit());
    return id;
}

E<Comment> Database::getComment(int64_t id)
{
    std::lock_guard<std::mutex> lock(db_lock);
    return fetchComment(id);
}

E<void> Database::modifyComment(int64_t id, const CommentUpdate& update)
{
    spdlog::info("Modifying comment {}.", id);
    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto txn, Transaction::begin(*db));
    ASSIGN_OR_RETURN(Comment comment, fetchComment(id));
    if(!update.content.has_value())
    {
        return txn.commit();
    }
    DO_OR_RETURN(run(*db, "UPDATE Comments SET Content = ?, EditedOn = ? "
                     "WHERE Id = ?;", *update.content, nowSeconds(),
                     comment.id));
    return txn.commit();
}

E<void> Database::removeComment(int64_t id)
{
    spdlog::info("Removing comment {}.", id);
    std::lock_guard<std::mutex> lock(db_lock);
    return run(*db, "UPDATE Comments SET DeletedOn = ? "
               "WHERE Id = ? AND DeletedOn IS NULL;", nowSeconds(), id);
}

E<bool> Database::checkCommentExists(int64_t id)
{
    std::lock_guard<std::mutex> lock(db_lock);
    return commentExists(id);
}

E<std::vector<Comment>> Database::comments()
{
    std::lock_guard<std::mutex> lock(db_lock);
    return selectComments(*db, "ORDER BY Id");
}

// ========== Post-tag associations =====================================>

E<void> Database::linkTag(int64_t post_id, int64_t tag_id)
{
    spdlog::info("Tagging post {} with tag {}.", post_id, tag_id);
    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto txn, Transaction::begin(*db));
    ASSIGN_OR_RETURN(bool post_exists, postExists(post_id));
    if(!post_exists)
    {
        return std::unexpected(foreignKeyError(
            std::format("Post with ID {} not found.", post_id)));
    }
    DO_OR_RETURN(insertPostTags(post_id, {tag_id}));
    return txn.commit();
}

E<void> Database::unlinkTag(int64_t post_id, int64_t tag_id)
{
    spdlog::info("Untagging post {} from tag {}.", post_id, tag_id);
    std::lock_guard<std::mutex> lock(db_lock);
    return run(*db, "DELETE FROM PostTags WHERE PostId = ? AND TagId = ?;",
               post_id, tag_id);
}

E<bool> Database::checkPostTagExists(int64_t post_id, int64_t tag_id)
{
    std::lock_guard<std::mutex> lock(db_lock);
    return postTagExists(post_id, tag_id);
}

E<std::vector<int64_t>> Database::getPostTags(int64_t post_id)
{
    std::lock_guard<std::mutex> lock(db_lock);
    return selectIds(*db, "SELECT DISTINCT TagId FROM PostTags "
                     "WHERE PostId = ?;", post_id);
}

E<std::vector<PostTag>> Database::postTags()
{
    std::lock_guard<std::mutex> lock(db_lock);
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(
        "SELECT PostId, TagId FROM PostTags ORDER BY PostId, TagId;"));
    ASSIGN_OR_RETURN(auto rows, (db->eval<int64_t, int64_t>(std::move(stmt))));
    std::vector<PostTag> result;
    result.reserve(rows.size());
    for(const auto& row : rows)
    {
        result.push_back({std::get<0>(row), std::get<1>(row)});
    }
    return result;
}

// ========== Credentials ===============================================>

E<bool> Database::attemptLogin(const std::string& email,
                               const std::string& password)
{
    std::optional<std::string> credential;
    {
        std::lock_guard<std::mutex> lock(db_lock);
        ASSIGN_OR_RETURN(std::vector<User> found,
                         selectUsers(*db, "WHERE Email = ?", email));
        if(!found.empty())
        {
            credential = std::move(found[0].password);
        }
    }

    if(!credential.has_value())
    {
        // Do the same amount of work as for a registered email.
        hasher.verify(password, dummy_credential);
        spdlog::info("Failed login attempt for {}.", email);
        return false;
    }
    bool ok = hasher.verify(password, *credential);
    if(!ok)
    {
        spdlog::info("Failed login attempt for {}.", email);
    }
    return ok;
}

// ========== Privates ==================================================>

E<bool> Database::userExists(int64_t id)
{
    return rowExists(*db, "SELECT count(*) FROM Users WHERE Id = ?;", id);
}

E<bool> Database::postExists(int64_t id)
{
    return rowExists(*db, "SELECT count(*) FROM Posts WHERE Id = ?;", id);
}

E<bool> Database::tagExists(int64_t id)
{
    return rowExists(*db, "SELECT count(*) FROM Tags WHERE Id = ?;", id);
}

E<bool> Database::commentExists(int64_t id)
{
    return rowExists(*db, "SELECT count(*) FROM Comments "
                     "WHERE Id = ? AND DeletedOn IS NULL;", id);
}

E<bool> Database::postTagExists(int64_t post_id, int64_t tag_id)
{
    return rowExists(*db, "SELECT count(*) FROM PostTags "
                     "WHERE PostId = ? AND TagId = ?;", post_id, tag_id);
}

E<bool> Database::emailTaken(const std::string& email,
                             std::optional<int64_t> except)
{
    if(except.has_value())
    {
        return rowExists(*db, "SELECT count(*) FROM Users "
                         "WHERE Email = ? AND Id != ?;", email, *except);
    }
    return rowExists(*db, "SELECT count(*) FROM Users WHERE Email = ?;",
                     email);
}

E<User> Database::fetchUser(int64_t id)
{
    ASSIGN_OR_RETURN(std::vector<User> users,
                     selectUsers(*db, "WHERE Id = ?", id));
    if(users.empty())
    {
        return std::unexpected(notFoundError(
            std::format("User with ID {} not found.", id)));
    }
    return users[0];
}

E<Post> Database::fetchPost(int64_t id)
{
    ASSIGN_OR_RETURN(std::vector<Post> posts,
                     selectPosts(*db, "WHERE Id = ?", id));
    if(posts.empty())
    {
        return std::unexpected(notFoundError(
            std::format("Post with ID {} not found.", id)));
    }
    return posts[0];
}

E<Tag> Database::fetchTag(int64_t id)
{
    ASSIGN_OR_RETURN(std::vector<Tag> tags,
                     selectTags(*db, "WHERE Id = ?", id));
    if(tags.empty())
    {
        return std::unexpected(notFoundError(
            std::format("Tag with ID {} not found.", id)));
    }
    return tags[0];
}

E<Comment> Database::fetchComment(int64_t id)
{
    ASSIGN_OR_RETURN(std::vector<Comment> comments,
                     selectComments(*db, "AND Id = ?", id));
    if(comments.empty())
    {
        return std::unexpected(notFoundError(
            std::format("Comment with ID {} not found.", id)));
    }
    return comments[0];
}

E<void> Database::insertPostTags(int64_t post_id,
                                 const std::vector<int64_t>& tags)
{
    for(int64_t tag_id : tags)
    {
        ASSIGN_OR_RETURN(bool tag_exists, tagExists(tag_id));
        if(!tag_exists)
        {
            return std::unexpected(foreignKeyError(
                std::format("Tag with ID {} not found.", tag_id)));
        }
        ASSIGN_OR_RETURN(bool linked, postTagExists(post_id, tag_id));
        if(linked)
        {
            continue;
        }
        DO_OR_RETURN(run(*db, "INSERT INTO PostTags (PostId, TagId) "
                         "VALUES (?, ?);", post_id, tag_id));
    }
    return {};
}

E<void> Database::deletePostRows(const std::vector<int64_t>& post_ids)
{
    for(int64_t id : post_ids)
    {
        DO_OR_RETURN(run(*db, "DELETE FROM Comments WHERE PostId = ?;", id));
        DO_OR_RETURN(run(*db, "DELETE FROM PostTags WHERE PostId = ?;", id));
        DO_OR_RETURN(run(*db, "DELETE FROM Posts WHERE Id = ?;", id));
    }
    return {};
}
