// password_authenticator.hpp
#pragma once
#include <string>
#include "player_record.hpp"

struct HashedPassword {
    std::string hash;
    std::string salt;
};

// PBKDF2-HMAC-SHA512 over OpenSSL. Salt is 16 random bytes rendered as hex and
// fed to PBKDF2 as the hex text itself, so hashes match the existing data files.
class PasswordAuthenticator {
public:
    static constexpr int kDefaultIterations = 10000;
    static constexpr int kKeyLength = 64;
    static constexpr int kSaltBytes = 16;

    explicit PasswordAuthenticator(int iterations = kDefaultIterations);

    HashedPassword hash(const std::string& password) const;
    bool verify(const std::string& password, const std::string& hash, const std::string& salt) const;

    // Checks `password` against the record's credential. A matching legacy
    // plaintext credential is replaced by a fresh hash+salt in place and
    // `migrated` is set; the caller persists. A mismatch leaves the record as is.
    bool authenticate(PlayerRecord& record, const std::string& password, bool& migrated) const;

    // Unconditionally upgrades a legacy credential. Returns false if there was none.
    bool migrate(PlayerRecord& record) const;

    int iterations() const { return iterations_; }

private:
    std::string derive(const std::string& password, const std::string& salt) const;
    static std::string random_salt();

    int iterations_;
};
