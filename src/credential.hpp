#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mw/error.hpp>

// A parsed “$pbkdf2-sha512$<rounds>$<salt>$<checksum>” credential.
// Salt and checksum are in adapted base64 (“.” instead of “+”, no
// padding), which is what passlib writes. Credentials created by
// older versions of the forum therefore keep working.
struct Credential
{
    int rounds;
    std::vector<unsigned char> salt;
    std::vector<unsigned char> checksum;

    static std::optional<Credential> fromStr(std::string_view s);
    std::string toStr() const;
};

std::string ab64Encode(const std::vector<unsigned char>& bytes);
mw::E<std::vector<unsigned char>> ab64Decode(std::string_view s);

class PasswordHasher
{
public:
    static constexpr int DEFAULT_ROUNDS = 25000;
    static constexpr size_t SALT_SIZE = 16;
    static constexpr size_t CHECKSUM_SIZE = 64;

    explicit PasswordHasher(int rounds = DEFAULT_ROUNDS) : rounds(rounds) {}

    // Derive a credential string from the password with a fresh
    // random salt.
    mw::E<std::string> hash(std::string_view password) const;

    // Check the password against a stored credential string. The
    // checksum comparison takes the same time wherever the first
    // difference is. Malformed credentials never verify.
    bool verify(std::string_view password, std::string_view credential) const;

private:
    static mw::E<std::vector<unsigned char>> derive(
        std::string_view password, const std::vector<unsigned char>& salt,
        int rounds, size_t size);

    int rounds;
};
