#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <mw/database.hpp>
#include <mw/utils.hpp>

#include "credential.hpp"
#include "error.hpp"
#include "records.hpp"

// The data access surface of the forum. Every read and write of users,
// posts, tags, comments and post-tag associations goes through this.
//
// Lookups by ID fail with NotFound when the row does not exist.
// Removals of rows that do not exist are no-ops. Creations and
// modifications fail with ForeignKeyViolation or
// UniqueConstraintViolation instead of correcting the input.
class DatabaseInterface
{
public:
    virtual ~DatabaseInterface() = default;

    // ========== Users =================================================>

    virtual E<int64_t> addUser(const std::string& first_name,
                               const std::string& last_name,
                               const std::string& email,
                               const std::string& password) = 0;
    virtual E<User> getUser(int64_t id) = 0;
    virtual E<void> modifyUser(int64_t id, const UserUpdate& update) = 0;
    // Also removes the posts of the user and every comment the user
    // wrote.
    virtual E<void> removeUser(int64_t id) = 0;
    virtual E<bool> checkUserExists(int64_t id) = 0;
    virtual E<std::vector<User>> users() = 0;

    // ========== Posts =================================================>

    // Create a post, tagged with “tags”. Either the post and all its
    // tags are stored, or nothing is.
    virtual E<int64_t> addPost(int64_t creator_id, const std::string& title,
                               const std::string& content,
                               std::optional<mw::Time> expires_on,
                               const std::vector<int64_t>& tags) = 0;
    virtual E<Post> getPost(int64_t id) = 0;
    virtual E<void> modifyPost(int64_t id, const PostUpdate& update) = 0;
    // Also removes the comments and tag associations of the post.
    virtual E<void> removePost(int64_t id) = 0;
    virtual E<bool> checkPostExists(int64_t id) = 0;
    virtual E<std::vector<Post>> posts() = 0;

    // ========== Tags ==================================================>

    virtual E<int64_t> addTag(const std::string& name,
                              const std::optional<std::string>& description,
                              const std::string& colour) = 0;
    virtual E<Tag> getTag(int64_t id) = 0;
    virtual E<void> modifyTag(int64_t id, const TagUpdate& update) = 0;
    // Removes the tag together with every post that carries it.
    virtual E<void> removeTag(int64_t id) = 0;
    virtual E<bool> checkTagExists(int64_t id) = 0;
    virtual E<std::vector<Tag>> tags() = 0;

    // ========== Comments ==============================================>

    virtual E<int64_t> addComment(int64_t post_id, int64_t user_id,
                                  const std::string& content) = 0;
    virtual E<Comment> getComment(int64_t id) = 0;
    virtual E<void> modifyComment(int64_t id, const CommentUpdate& update) = 0;
    // Marks the comment as deleted. From then on it behaves as if it
    // does not exist.
    virtual E<void> removeComment(int64_t id) = 0;
    virtual E<bool> checkCommentExists(int64_t id) = 0;
    virtual E<std::vector<Comment>> comments() = 0;

    // ========== Post-tag associations =================================>

    // Tag a post. Tagging a post with a tag it already has does
    // nothing.
    virtual E<void> linkTag(int64_t post_id, int64_t tag_id) = 0;
    virtual E<void> unlinkTag(int64_t post_id, int64_t tag_id) = 0;
    virtual E<bool> checkPostTagExists(int64_t post_id, int64_t tag_id) = 0;
    // IDs of the tags of a post, in no particular order.
    virtual E<std::vector<int64_t>> getPostTags(int64_t post_id) = 0;
    virtual E<std::vector<PostTag>> postTags() = 0;

    // ========== Credentials ===========================================>

    virtual E<bool> attemptLogin(const std::string& email,
                                 const std::string& password) = 0;

    // ========== Single fields =========================================>
    //
    // These read the whole record and return one field of it.

    E<std::string> getUserFirstName(int64_t id);
    E<std::string> getUserLastName(int64_t id);
    E<std::string> getUserEmail(int64_t id);
    E<bool> getUserAdmin(int64_t id);
    E<std::optional<std::string>> getUserBio(int64_t id);
    E<mw::Time> getUserAddedOn(int64_t id);

    E<int64_t> getPostCreatorId(int64_t id);
    E<std::string> getPostTitle(int64_t id);
    E<std::string> getPostContent(int64_t id);
    E<mw::Time> getPostAddedOn(int64_t id);
    E<std::optional<mw::Time>> getPostExpiresOn(int64_t id);

    E<std::string> getTagName(int64_t id);
    E<std::optional<std::string>> getTagDescription(int64_t id);
    E<std::string> getTagColour(int64_t id);
    E<mw::Time> getTagAddedOn(int64_t id);

    E<int64_t> getCommentPostId(int64_t id);
    E<int64_t> getCommentUserId(int64_t id);
    E<std::string> getCommentContent(int64_t id);
    E<mw::Time> getCommentAddedOn(int64_t id);
    E<std::optional<mw::Time>> getCommentEditedOn(int64_t id);
};

// The SQLite implementation. It owns one connection for its whole
// lifetime; all operations are serialized on an internal mutex, and
// every operation that touches more than one row runs in a single
// transaction.
class Database : public DatabaseInterface
{
public:
    // Open (or create) the database file and make sure the schema is
    // in place. A database that cannot be opened or whose schema
    // cannot be created is an error.
    static E<std::unique_ptr<Database>> connectFile(
        const std::string& path,
        int password_rounds = PasswordHasher::DEFAULT_ROUNDS);
    static E<std::unique_ptr<Database>> connectMemory(
        int password_rounds = PasswordHasher::DEFAULT_ROUNDS);

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    E<int64_t> addUser(const std::string& first_name,
                       const std::string& last_name,
                       const std::string& email,
                       const std::string& password) override;
    E<User> getUser(int64_t id) override;
    E<void> modifyUser(int64_t id, const UserUpdate& update) override;
    E<void> removeUser(int64_t id) override;
    E<bool> checkUserExists(int64_t id) override;
    E<std::vector<User>> users() override;

    E<int64_t> addPost(int64_t creator_id, const std::string& title,
                       const std::string& content,
                       std::optional<mw::Time> expires_on,
                       const std::vector<int64_t>& tags) override;
    E<Post> getPost(int64_t id) override;
    E<void> modifyPost(int64_t id, const PostUpdate& update) override;
    E<void> removePost(int64_t id) override;
    E<bool> checkPostExists(int64_t id) override;
    E<std::vector<Post>> posts() override;

    E<int64_t> addTag(const std::string& name,
                      const std::optional<std::string>& description,
                      const std::string& colour) override;
    E<Tag> getTag(int64_t id) override;
    E<void> modifyTag(int64_t id, const TagUpdate& update) override;
    E<void> removeTag(int64_t id) override;
    E<bool> checkTagExists(int64_t id) override;
    E<std::vector<Tag>> tags() override;

    E<int64_t> addComment(int64_t post_id, int64_t user_id,
                          const std::string& content) override;
    E<Comment> getComment(int64_t id) override;
    E<void> modifyComment(int64_t id, const CommentUpdate& update) override;
    E<void> removeComment(int64_t id) override;
    E<bool> checkCommentExists(int64_t id) override;
    E<std::vector<Comment>> comments() override;

    E<void> linkTag(int64_t post_id, int64_t tag_id) override;
    E<void> unlinkTag(int64_t post_id, int64_t tag_id) override;
    E<bool> checkPostTagExists(int64_t post_id, int64_t tag_id) override;
    E<std::vector<int64_t>> getPostTags(int64_t post_id) override;
    E<std::vector<PostTag>> postTags() override;

    E<bool> attemptLogin(const std::string& email,
                         const std::string& password) override;

private:
    Database(std::unique_ptr<mw::SQLite> conn, int password_rounds);
    E<void> init(bool file_backed);

    // The helpers below expect db_lock to be held by the caller.
    E<bool> userExists(int64_t id);
    E<bool> postExists(int64_t id);
    E<bool> tagExists(int64_t id);
    E<bool> commentExists(int64_t id);
    E<bool> postTagExists(int64_t post_id, int64_t tag_id);
    // Whether a user other than “except” has this email.
    E<bool> emailTaken(const std::string& email,
                       std::optional<int64_t> except);

    E<User> fetchUser(int64_t id);
    E<Post> fetchPost(int64_t id);
    E<Tag> fetchTag(int64_t id);
    E<Comment> fetchComment(int64_t id);

    // Associate every tag with the post. Fails with
    // ForeignKeyViolation on the first tag that does not exist.
    E<void> insertPostTags(int64_t post_id, const std::vector<int64_t>& tags);
    // Delete the posts, with their comments and tag associations.
    E<void> deletePostRows(const std::vector<int64_t>& post_ids);

    std::unique_ptr<mw::SQLite> db;
    PasswordHasher hasher;
    // Verified against when a login names an unknown email, so that
    // unknown and known emails take the same time.
    std::string dummy_credential;
    std::mutex db_lock;
};
