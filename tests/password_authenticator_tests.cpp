// password_authenticator_tests.cpp
#define BOOST_TEST_MODULE PasswordAuthenticatorTests
#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include "password_authenticator.hpp"

class AuthFixture {
public:
    AuthFixture() : auth(100) {}

protected:
    PasswordAuthenticator auth;
};

BOOST_AUTO_TEST_SUITE(ConstructionTests)

BOOST_AUTO_TEST_CASE(DefaultIterationCount) {
    PasswordAuthenticator a;
    BOOST_CHECK_EQUAL(a.iterations(), 10000);
}

BOOST_AUTO_TEST_CASE(NonPositiveIterationsRejected) {
    BOOST_CHECK_THROW(PasswordAuthenticator(0), std::invalid_argument);
    BOOST_CHECK_THROW(PasswordAuthenticator(-3), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(HashTests, AuthFixture)

BOOST_AUTO_TEST_CASE(HashIsHexOfExpectedLength) {
    HashedPassword h = auth.hash("correct horse");
    BOOST_CHECK_EQUAL(h.salt.size(), 32u);   // 16 bytes
    BOOST_CHECK_EQUAL(h.hash.size(), 128u);  // 64 bytes
    BOOST_CHECK(h.hash.find_first_not_of("0123456789abcdef") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(VerifyMatchesOnlyTheRightPassword) {
    HashedPassword h = auth.hash("correct horse");
    BOOST_CHECK(auth.verify("correct horse", h.hash, h.salt));
    BOOST_CHECK(!auth.verify("correct horsE", h.hash, h.salt));
    BOOST_CHECK(!auth.verify("", h.hash, h.salt));
}

BOOST_AUTO_TEST_CASE(FreshSaltEveryTime) {
    HashedPassword a = auth.hash("same");
    HashedPassword b = auth.hash("same");
    BOOST_CHECK_NE(a.salt, b.salt);
    BOOST_CHECK_NE(a.hash, b.hash);
}

BOOST_AUTO_TEST_CASE(IterationCountIsPartOfTheHash) {
    PasswordAuthenticator other(101);
    HashedPassword h = auth.hash("pw");
    BOOST_CHECK(!other.verify("pw", h.hash, h.salt));
}

BOOST_AUTO_TEST_CASE(EmptyStoredCredentialNeverVerifies) {
    BOOST_CHECK(!auth.verify("pw", "", ""));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RecordTests, AuthFixture)

BOOST_AUTO_TEST_CASE(HashedRecordAuthenticates) {
    PlayerRecord r;
    HashedPassword h = auth.hash("pw");
    r.credential.password_hash = h.hash;
    r.credential.salt = h.salt;

    bool migrated = true;
    BOOST_CHECK(auth.authenticate(r, "pw", migrated));
    BOOST_CHECK(!migrated);
    BOOST_CHECK(!auth.authenticate(r, "nope", migrated));
}

BOOST_AUTO_TEST_CASE(LegacyPlaintextIsMigratedOnMatch) {
    PlayerRecord r;
    r.credential.legacy_password = "secret";

    bool migrated = false;
    BOOST_CHECK(auth.authenticate(r, "secret", migrated));
    BOOST_CHECK(migrated);
    BOOST_CHECK(!r.credential.legacy_password);
    BOOST_CHECK(auth.verify("secret", r.credential.password_hash, r.credential.salt));
}

BOOST_AUTO_TEST_CASE(LegacyMismatchLeavesRecordAlone) {
    PlayerRecord r;
    r.credential.legacy_password = "secret";

    bool migrated = false;
    BOOST_CHECK(!auth.authenticate(r, "Secret", migrated));
    BOOST_CHECK(!migrated);
    BOOST_REQUIRE(r.credential.legacy_password);
    BOOST_CHECK_EQUAL(*r.credential.legacy_password, "secret");
    BOOST_CHECK(r.credential.password_hash.empty());
}

BOOST_AUTO_TEST_CASE(LegacyValueWinsOverStaleHash) {
    PlayerRecord r;
    HashedPassword old = auth.hash("old");
    r.credential.password_hash = old.hash;
    r.credential.salt = old.salt;
    r.credential.legacy_password = "new";

    bool migrated = false;
    BOOST_CHECK(!auth.authenticate(r, "old", migrated));
    BOOST_CHECK(auth.authenticate(r, "new", migrated));
    BOOST_CHECK(migrated);
}

BOOST_AUTO_TEST_CASE(MigrateWithoutPassword) {
    PlayerRecord r;
    BOOST_CHECK(!auth.migrate(r));

    r.credential.legacy_password = "plain";
    BOOST_CHECK(auth.migrate(r));
    BOOST_CHECK(!r.credential.needs_migration());
    BOOST_CHECK(auth.verify("plain", r.credential.password_hash, r.credential.salt));
}

BOOST_AUTO_TEST_SUITE_END()
