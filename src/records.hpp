#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <mw/utils.hpp>

// One row of each table, as handed out by the database. These are
// snapshots: changing a field does not touch the store, use the
// modify*() operations for that.

struct User
{
    int64_t id = 0;
    std::string first_name;
    std::string last_name;
    std::string email;
    // The PBKDF2 credential derived from the password. Never the
    // plaintext.
    std::string password;
    bool admin = false;
    std::optional<std::string> bio;
    mw::Time added_on;

    bool operator==(const User& rhs) const = default;
};

struct Post
{
    int64_t id = 0;
    int64_t creator_id = 0;
    std::string title;
    std::string content;
    mw::Time added_on;
    std::optional<mw::Time> expires_on;

    bool operator==(const Post& rhs) const = default;
};

struct Tag
{
    int64_t id = 0;
    std::string name;
    std::optional<std::string> description;
    std::string colour;
    mw::Time added_on;

    bool operator==(const Tag& rhs) const = default;
};

struct Comment
{
    int64_t id = 0;
    int64_t post_id = 0;
    int64_t user_id = 0;
    std::string content;
    mw::Time added_on;
    std::optional<mw::Time> edited_on;
    // Set when the comment is removed. Removed comments are never
    // handed out by the database, so this is always empty in practice.
    std::optional<mw::Time> deleted_on;

    bool operator==(const Comment& rhs) const = default;
};

struct PostTag
{
    int64_t post_id = 0;
    int64_t tag_id = 0;

    bool operator==(const PostTag& rhs) const = default;
};

// Option sets for the modify*() operations. An empty option leaves
// the column alone. For nullable columns the inner optional is the
// new value, so “std::optional<std::string>(std::nullopt)” clears
// it.

struct UserUpdate
{
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> email;
    // Plaintext; a new credential is derived from it.
    std::optional<std::string> password;
    std::optional<bool> admin;
    std::optional<std::optional<std::string>> bio;
};

struct PostUpdate
{
    std::optional<std::string> title;
    std::optional<std::string> content;
    std::optional<std::optional<mw::Time>> expires_on;
    // Replaces the whole tag set of the post.
    std::optional<std::vector<int64_t>> tags;
};

struct TagUpdate
{
    std::optional<std::string> name;
    std::optional<std::optional<std::string>> description;
    std::optional<std::string> colour;
};

struct CommentUpdate
{
    std::optional<std::string> content;
};

// Tag IDs of the given tags, for passing full records where IDs are
// expected.
std::vector<int64_t> tagIds(const std::vector<Tag>& tags);

// Drop repeated IDs, keeping the first occurrence of each.
std::vector<int64_t> uniqueIds(const std::vector<int64_t>& ids);
