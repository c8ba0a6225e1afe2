#pragma once
#include <gmock/gmock.h>
#include "database.hpp"

class DatabaseMock : public DatabaseInterface {
public:
    MOCK_METHOD(E<int64_t>, addUser, (const std::string&, const std::string&, const std::string&, const std::string&), (override));
    MOCK_METHOD(E<User>, getUser, (int64_t), (override));
    MOCK_METHOD(E<void>, modifyUser, (int64_t, const UserUpdate&), (override));
    MOCK_METHOD(E<void>, removeUser, (int64_t), (override));
    MOCK_METHOD(E<bool>, checkUserExists, (int64_t), (override));
    MOCK_METHOD(E<std::vector<User>>, users, (), (override));
    MOCK_METHOD(E<int64_t>, addPost, (int64_t, const std::string&, const std::string&, std::optional<mw::Time>, const std::vector<int64_t>&), (override));
    MOCK_METHOD(E<Post>, getPost, (int64_t), (override));
    MOCK_METHOD(E<void>, modifyPost, (int64_t, const PostUpdate&), (override));
    MOCK_METHOD(E<void>, removePost, (int64_t), (override));
    MOCK_METHOD(E<bool>, checkPostExists, (int64_t), (override));
    MOCK_METHOD(E<std::vector<Post>>, posts, (), (override));
    MOCK_METHOD(E<int64_t>, addTag, (const std::string&, const std::optional<std::string>&, const std::string&), (override));
    MOCK_METHOD(E<Tag>, getTag, (int64_t), (override));
    MOCK_METHOD(E<void>, modifyTag, (int64_t, const TagUpdate&), (override));
    MOCK_METHOD(E<void>, removeTag, (int64_t), (override));
    MOCK_METHOD(E<bool>, checkTagExists, (int64_t), (override));
    MOCK_METHOD(E<std::vector<Tag>>, tags, (), (override));
    MOCK_METHOD(E<int64_t>, addComment, (int64_t, int64_t, const std::string&), (override));
    MOCK_METHOD(E<Comment>, getComment, (int64_t), (override));
    MOCK_METHOD(E<void>, modifyComment, (int64_t, const CommentUpdate&), (override));
    MOCK_METHOD(E<void>, removeComment, (int64_t), (override));
    MOCK_METHOD(E<bool>, checkCommentExists, (int64_t), (override));
    MOCK_METHOD(E<std::vector<Comment>>, comments, (), (override));
    MOCK_METHOD(E<void>, linkTag, (int64_t, int64_t), (override));
    MOCK_METHOD(E<void>, unlinkTag, (int64_t, int64_t), (override));
    MOCK_METHOD(E<bool>, checkPostTagExists, (int64_t, int64_t), (override));
    MOCK_METHOD(E<std::vector<int64_t>>, getPostTags, (int64_t), (override));
    MOCK_METHOD(E<std::vector<PostTag>>, postTags, (), (override));
    MOCK_METHOD(E<bool>, attemptLogin, (const std::string&, const std::string&), (override));
};
