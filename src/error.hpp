#pragma once

#include <expected>
#include <string>
#include <variant>

#include <mw/error.hpp>

// A referenced parent row does not exist.
struct ForeignKeyViolation
{
    std::string msg;
};

// A unique column (e.g. a user’s email) already holds the value.
struct UniqueConstraintViolation
{
    std::string msg;
};

// A keyed lookup found no row.
struct NotFound
{
    std::string msg;
};

// The store failed to carry out a statement or transaction. Every
// error coming out of the SQLite layer converts into this.
struct StoreUnavailable
{
    std::string msg;

    StoreUnavailable() = default;
    explicit StoreUnavailable(std::string m) : msg(std::move(m)) {}
    StoreUnavailable(const mw::Error& e);
};

using Error = std::variant<ForeignKeyViolation, UniqueConstraintViolation,
                           NotFound, StoreUnavailable>;

template<typename T>
using E = std::expected<T, Error>;

std::string errorMsg(const Error& e);

ForeignKeyViolation foreignKeyError(std::string msg);
UniqueConstraintViolation uniqueError(std::string msg);
NotFound notFoundError(std::string msg);
