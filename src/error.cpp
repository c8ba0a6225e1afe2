#include <string>
#include <variant>

#include <mw/error.hpp>

#include "error.hpp"

StoreUnavailable::StoreUnavailable(const mw::Error& e)
        : msg(mw::errorMsg(e))
{
}

std::string errorMsg(const Error& e)
{
    return std::visit([](const auto& err) { return err.msg; }, e);
}

ForeignKeyViolation foreignKeyError(std::string msg)
{
    return {std::move(msg)};
}

UniqueConstraintViolation uniqueError(std::string msg)
{
    return {std::move(msg)};
}

NotFound notFoundError(std::string msg)
{
    return {std::move(msg)};
}
