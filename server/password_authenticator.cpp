// password_authenticator.cpp
#include "password_authenticator.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

} // namespace

PasswordAuthenticator::PasswordAuthenticator(int iterations)
    : iterations_(iterations) {
    if (iterations_ <= 0) throw std::invalid_argument("PBKDF2 iteration count must be positive");
}

std::string PasswordAuthenticator::random_salt() {
    unsigned char bytes[kSaltBytes];
    if (RAND_bytes(bytes, kSaltBytes) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(bytes, kSaltBytes);
}

std::string PasswordAuthenticator::derive(const std::string& password, const std::string& salt) const {
    std::vector<unsigned char> key(kKeyLength);
    int ok = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                               reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
                               iterations_, EVP_sha512(),
                               kKeyLength, key.data());
    if (ok != 1) throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    return to_hex(key.data(), key.size());
}

HashedPassword PasswordAuthenticator::hash(const std::string& password) const {
    HashedPassword out;
    out.salt = random_salt();
    out.hash = derive(password, out.salt);
    return out;
}

bool PasswordAuthenticator::verify(const std::string& password, const std::string& hash, const std::string& salt) const {
    if (hash.empty() || salt.empty()) return false;
    std::string candidate = derive(password, salt);
    if (candidate.size() != hash.size()) return false;
    return CRYPTO_memcmp(candidate.data(), hash.data(), hash.size()) == 0;
}

bool PasswordAuthenticator::authenticate(PlayerRecord& record, const std::string& password, bool& migrated) const {
    migrated = false;
    Credential& cred = record.credential;

    if (cred.legacy_password) {
        const std::string& stored = *cred.legacy_password;
        bool same = stored.size() == password.size() &&
                    CRYPTO_memcmp(stored.data(), password.data(), stored.size()) == 0;
        if (!same) return false;
        migrated = migrate(record);
        return true;
    }

    return verify(password, cred.password_hash, cred.salt);
}

bool PasswordAuthenticator::migrate(PlayerRecord& record) const {
    Credential& cred = record.credential;
    if (!cred.legacy_password) return false;

    HashedPassword fresh = hash(*cred.legacy_password);
    cred.password_hash = std::move(fresh.hash);
    cred.salt = std::move(fresh.salt);
    cred.legacy_password.reset();
    return true;
}
