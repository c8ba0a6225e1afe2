#include <algorithm>
#include <charconv>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include <mw/crypto.hpp>
#include <mw/error.hpp>
#include <mw/utils.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include "credential.hpp"

namespace {

constexpr std::string_view SCHEME = "pbkdf2-sha512";

std::vector<std::string_view> splitDollar(std::string_view s)
{
    std::vector<std::string_view> parts;
    size_t begin = 0;
    while(true)
    {
        size_t end = s.find('$', begin);
        if(end == std::string_view::npos)
        {
            parts.push_back(s.substr(begin));
            break;
        }
        parts.push_back(s.substr(begin, end - begin));
        begin = end + 1;
    }
    return parts;
}

} // namespace

std::string ab64Encode(const std::vector<unsigned char>& bytes)
{
    std::string b64 = mw::base64Encode(bytes);
    std::string result;
    result.reserve(b64.size());
    for(char c : b64)
    {
        if(c == '=' || c == '\n' || c == '\r')
        {
            continue;
        }
        result.push_back(c == '+' ? '.' : c);
    }
    return result;
}

mw::E<std::vector<unsigned char>> ab64Decode(std::string_view s)
{
    std::string b64(s);
    std::replace(std::begin(b64), std::end(b64), '.', '+');
    if(b64.size() % 4 == 1)
    {
        return std::unexpected(mw::runtimeError("Invalid adapted base64."));
    }
    while(b64.size() % 4 != 0)
    {
        b64.push_back('=');
    }
    ASSIGN_OR_RETURN(auto bytes, mw::base64Decode(b64));
    return std::vector<unsigned char>(std::begin(bytes), std::end(bytes));
}

std::optional<Credential> Credential::fromStr(std::string_view s)
{
    // The string starts with “$”, so the first part is empty.
    std::vector<std::string_view> parts = splitDollar(s);
    if(parts.size() != 5 || !parts[0].empty() || parts[1] != SCHEME)
    {
        return std::nullopt;
    }

    Credential c;
    const char* rounds_end = parts[2].data() + parts[2].size();
    auto [ptr, ec] = std::from_chars(parts[2].data(), rounds_end, c.rounds);
    if(ec != std::errc() || ptr != rounds_end || c.rounds <= 0)
    {
        return std::nullopt;
    }

    auto salt = ab64Decode(parts[3]);
    auto checksum = ab64Decode(parts[4]);
    if(!salt.has_value() || !checksum.has_value() || checksum->empty())
    {
        return std::nullopt;
    }
    c.salt = *std::move(salt);
    c.checksum = *std::move(checksum);
    return c;
}

std::string Credential::toStr() const
{
    return std::format("${}${}${}${}", SCHEME, rounds, ab64Encode(salt),
                       ab64Encode(checksum));
}

mw::E<std::vector<unsigned char>> PasswordHasher::derive(
    std::string_view password, const std::vector<unsigned char>& salt,
    int rounds, size_t size)
{
    std::vector<unsigned char> out(size);
    if(PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                         salt.data(), static_cast<int>(salt.size()), rounds,
                         EVP_sha512(), static_cast<int>(out.size()),
                         out.data()) != 1)
    {
        return std::unexpected(mw::runtimeError("Failed to derive key."));
    }
    return out;
}

mw::E<std::string> PasswordHasher::hash(std::string_view password) const
{
    Credential c;
    c.rounds = rounds;
    c.salt.resize(SALT_SIZE);
    if(RAND_bytes(c.salt.data(), static_cast<int>(c.salt.size())) != 1)
    {
        return std::unexpected(mw::runtimeError("Failed to generate salt."));
    }
    ASSIGN_OR_RETURN(c.checksum,
                     derive(password, c.salt, rounds, CHECKSUM_SIZE));
    return c.toStr();
}

bool PasswordHasher::verify(std::string_view password,
                            std::string_view credential) const
{
    std::optional<Credential> c = Credential::fromStr(credential);
    if(!c.has_value())
    {
        spdlog::warn("Stored credential is malformed.");
        return false;
    }
    auto computed = derive(password, c->salt, c->rounds,
                           c->checksum.size());
    if(!computed.has_value())
    {
        spdlog::error("Failed to verify password: {}",
                      mw::errorMsg(computed.error()));
        return false;
    }
    return CRYPTO_memcmp(computed->data(), c->checksum.data(),
                         computed->size()) == 0;
}
