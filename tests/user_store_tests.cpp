// user_store_tests.cpp
#define BOOST_TEST_MODULE UserStoreTests
#include <boost/test/unit_test.hpp>

#include <memory>
#include <nlohmann/json.hpp>
#include "password_authenticator.hpp"
#include "persistence_gateway.hpp"
#include "user_store.hpp"
#include "mocks/memory_backends.hpp"
#include "mocks/temp_dir.hpp"

using json = nlohmann::json;

class StoreFixture {
public:
    StoreFixture()
        : flat(std::make_shared<FlatState>()),
          gateway(StorageBackend::File, std::make_unique<MemoryFlatBackend>(flat), nullptr),
          auth(100),
          store(gateway, auth) {
        store.create_user("alice", "wonderland");
        flat->saves = 0;
    }

protected:
    std::shared_ptr<FlatState> flat;
    PersistenceGateway gateway;
    PasswordAuthenticator auth;
    UserStore store;
};

BOOST_FIXTURE_TEST_SUITE(CreateTests, StoreFixture)

BOOST_AUTO_TEST_CASE(NewUserGetsDefaults) {
    const PlayerRecord* r = store.get_user("alice");
    BOOST_REQUIRE(r);
    BOOST_CHECK_EQUAL(r->health, 100);
    BOOST_CHECK_EQUAL(r->max_health, 100);
    BOOST_CHECK_EQUAL(r->mana, 100);
    BOOST_CHECK_EQUAL(r->level, 1);
    BOOST_CHECK_EQUAL(r->experience, 0);
    BOOST_CHECK_EQUAL(r->charisma, 10);
    BOOST_CHECK_EQUAL(r->current_room_id, "start");
    BOOST_CHECK(r->equipment.empty());
    BOOST_CHECK_EQUAL(r->total_play_time, 0);
    BOOST_CHECK(r->join_date == r->last_login);
    BOOST_CHECK(!r->credential.needs_migration());
}

BOOST_AUTO_TEST_CASE(LookupIsCaseInsensitive) {
    BOOST_CHECK(store.user_exists("ALICE"));
    BOOST_CHECK(store.get_user("Alice") == store.get_user("alice"));
}

BOOST_AUTO_TEST_CASE(DuplicatesAndBadNamesRejected) {
    BOOST_CHECK(!store.create_user("Alice", "other"));
    BOOST_CHECK(!store.create_user("al", "pw"));
    BOOST_CHECK(!store.create_user("alice99", "pw"));
    BOOST_CHECK(!store.create_user("bobby", ""));
    BOOST_CHECK_EQUAL(store.size(), 1u);
    BOOST_CHECK_EQUAL(flat->saves, 0);
}

BOOST_AUTO_TEST_CASE(CreatePersists) {
    BOOST_CHECK(store.create_user("bob", "builder"));
    BOOST_CHECK_EQUAL(flat->saves, 1);
    BOOST_CHECK_EQUAL(flat->records.size(), 2u);
}

BOOST_AUTO_TEST_CASE(AllUsersIsACopy) {
    auto users = store.all_users();
    users[0].health = 1;
    BOOST_CHECK_EQUAL(store.get_user("alice")->health, 100);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(UpdateTests, StoreFixture)

BOOST_AUTO_TEST_CASE(UpdateStatsOnExistingUser) {
    PlayerPatch patch;
    patch.health = 50;
    BOOST_CHECK(store.update_user_stats("alice", patch));
    BOOST_CHECK_EQUAL(store.get_user("alice")->health, 50);
    BOOST_CHECK_EQUAL(flat->saves, 1);
}

BOOST_AUTO_TEST_CASE(UpdateStatsOnMissingUserCreatesNothing) {
    PlayerPatch patch;
    patch.health = 50;
    BOOST_CHECK(!store.update_user_stats("nobody", patch));
    BOOST_CHECK(!store.user_exists("nobody"));
    BOOST_CHECK_EQUAL(flat->saves, 0);
}

BOOST_AUTO_TEST_CASE(FlagsReplaceAndManaClamps) {
    store.add_flag("alice", "newbie");
    PlayerPatch patch;
    patch.flags = std::vector<std::string>{"veteran"};
    patch.max_mana = 30;
    BOOST_CHECK(store.update_user_stats("alice", patch));

    const PlayerRecord* r = store.get_user("alice");
    BOOST_REQUIRE_EQUAL(r->flags.size(), 1u);
    BOOST_CHECK_EQUAL(r->flags[0], "veteran");
    BOOST_CHECK_EQUAL(r->mana, 30);
}

BOOST_AUTO_TEST_CASE(FlagOperations) {
    BOOST_CHECK(store.add_flag("alice", "admin"));
    BOOST_CHECK(!store.add_flag("alice", "admin"));
    BOOST_CHECK(store.has_flag("alice", "admin"));
    BOOST_REQUIRE(store.get_flags("alice"));
    BOOST_CHECK_EQUAL(store.get_flags("alice")->size(), 1u);
    BOOST_CHECK(store.remove_flag("alice", "admin"));
    BOOST_CHECK(!store.remove_flag("alice", "admin"));
    BOOST_CHECK(!store.has_flag("alice", "admin"));
    BOOST_CHECK(!store.get_flags("nobody"));
    BOOST_CHECK(!store.add_flag("nobody", "admin"));
}

BOOST_AUTO_TEST_CASE(InventoryPlayTimeAndLastLogin) {
    Inventory inv;
    inv.items = {"potion-1", "potion-2"};
    inv.currency.silver = 9;
    BOOST_CHECK(store.update_inventory("alice", inv));
    BOOST_CHECK_EQUAL(store.get_user("alice")->inventory.items.size(), 2u);
    BOOST_CHECK_EQUAL(store.get_user("alice")->inventory.currency.silver, 9);

    BOOST_CHECK(store.add_play_time("alice", 30));
    BOOST_CHECK(store.add_play_time("alice", -10));
    BOOST_CHECK_EQUAL(store.get_user("alice")->total_play_time, 30);

    TimePoint before = store.get_user("alice")->last_login;
    BOOST_CHECK(store.update_last_login("alice"));
    BOOST_CHECK(store.get_user("alice")->last_login >= before);
    BOOST_CHECK(!store.update_last_login("nobody"));
}

BOOST_AUTO_TEST_CASE(DeleteUser) {
    BOOST_CHECK(store.delete_user("ALICE"));
    BOOST_CHECK(!store.user_exists("alice"));
    BOOST_CHECK(!store.delete_user("alice"));
    BOOST_CHECK(flat->records.empty());
}

BOOST_AUTO_TEST_CASE(DeletedUserStaysDeletedInDatabase) {
    auto rows = std::make_shared<RelationalState>();
    PersistenceGateway db_gateway(StorageBackend::Database, nullptr, std::make_unique<MemoryRelationalBackend>(rows));
    UserStore db_store(db_gateway, auth);
    BOOST_REQUIRE(db_store.create_user("bob", "builder"));
    BOOST_REQUIRE(db_store.create_user("carol", "singer"));
    db_gateway.flush();
    BOOST_REQUIRE_EQUAL(rows->rows.size(), 2u);

    BOOST_CHECK(db_store.delete_user("bob"));
    db_gateway.flush();
    BOOST_CHECK_EQUAL(rows->rows.count("bob"), 0u);

    UserStore reloaded(db_gateway, auth);
    reloaded.load();
    BOOST_CHECK(!reloaded.user_exists("bob"));
    BOOST_CHECK(reloaded.user_exists("carol"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(AuthenticateTests, StoreFixture)

BOOST_AUTO_TEST_CASE(AuthenticateHashedUser) {
    BOOST_CHECK(store.authenticate("Alice", "wonderland"));
    BOOST_CHECK(!store.authenticate("alice", "Wonderland"));
    BOOST_CHECK(!store.authenticate("nobody", "wonderland"));
    BOOST_CHECK_EQUAL(flat->saves, 0);
}

BOOST_AUTO_TEST_CASE(ChangePassword) {
    BOOST_CHECK(store.change_password("alice", "looking-glass"));
    BOOST_CHECK(!store.authenticate("alice", "wonderland"));
    BOOST_CHECK(store.authenticate("alice", "looking-glass"));
    BOOST_CHECK(!store.change_password("nobody", "x"));
}

BOOST_AUTO_TEST_CASE(LegacyPasswordMigratesAndPersists) {
    // Bypass bulk load so the plaintext survives until the first login.
    store.get_user("alice")->credential = Credential{ "", "", std::string("plain") };

    BOOST_CHECK(store.authenticate("alice", "plain"));
    const PlayerRecord* r = store.get_user("alice");
    BOOST_CHECK(!r->credential.legacy_password);
    BOOST_CHECK(!r->credential.password_hash.empty());
    BOOST_CHECK(auth.verify("plain", r->credential.password_hash, r->credential.salt));
    BOOST_CHECK_EQUAL(flat->saves, 1);
    BOOST_CHECK(!flat->records.at(0).credential.legacy_password);

    BOOST_CHECK(store.authenticate("alice", "plain"));
    BOOST_CHECK_EQUAL(flat->saves, 1);
}

BOOST_AUTO_TEST_CASE(FailedLegacyLoginHasNoSideEffects) {
    store.get_user("alice")->credential = Credential{ "", "", std::string("plain") };
    BOOST_CHECK(!store.authenticate("alice", "wrong"));
    BOOST_CHECK(store.get_user("alice")->credential.legacy_password);
    BOOST_CHECK_EQUAL(flat->saves, 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(BulkLoadTests, StoreFixture)

BOOST_AUTO_TEST_CASE(BulkLoadReplacesCollectionAndMigrates) {
    json users = json::array({
        { {"username", "Bob"}, {"password", "builder"} },
        { {"username", "carol"}, {"maxMana", 20}, {"mana", 90} },
    });
    BOOST_CHECK(store.load_prevalidated(users));

    BOOST_CHECK_EQUAL(store.size(), 2u);
    BOOST_CHECK(!store.user_exists("alice"));
    BOOST_CHECK(!store.get_user("bob")->credential.needs_migration());
    BOOST_CHECK(store.authenticate("bob", "builder"));
    BOOST_CHECK_EQUAL(store.get_user("carol")->mana, 20);
    BOOST_CHECK_EQUAL(flat->records.size(), 2u);
}

BOOST_AUTO_TEST_CASE(DuplicateRejectsWholeBatch) {
    json users = json::array({
        { {"username", "bob"} },
        { {"username", "BOB"} },
    });
    BOOST_CHECK(!store.load_prevalidated(users));
    BOOST_CHECK_EQUAL(store.size(), 1u);
    BOOST_CHECK(store.user_exists("alice"));
    BOOST_CHECK_EQUAL(flat->saves, 0);
}

BOOST_AUTO_TEST_CASE(MalformedUsernameRejectsWholeBatch) {
    json users = json::array({
        { {"username", "bob"} },
        { {"username", "x1"} },
    });
    BOOST_CHECK(!store.load_prevalidated(users));
    BOOST_CHECK(store.user_exists("alice"));
    BOOST_CHECK(!store.user_exists("bob"));
}

BOOST_AUTO_TEST_CASE(NonArrayRejected) {
    BOOST_CHECK(!store.load_prevalidated(json::object()));
    BOOST_CHECK(!store.load_prevalidated(json::array({ 42 })));
    BOOST_CHECK(store.user_exists("alice"));
}

BOOST_AUTO_TEST_CASE(LoadFromGateway) {
    PlayerRecord dave;
    dave.username = "Dave";
    dave.credential.legacy_password = "pw";
    flat->records = { dave };
    flat->present = true;

    store.load();
    BOOST_CHECK_EQUAL(store.size(), 1u);
    BOOST_REQUIRE(store.get_user("dave"));
    BOOST_CHECK(!store.get_user("dave")->credential.needs_migration());
}

BOOST_AUTO_TEST_CASE(SnapshotSkipsBackends) {
    flat->present = true;
    store.load(std::make_optional<json>(json::array({ { {"username", "erin"} } })));
    BOOST_CHECK_EQUAL(flat->loads, 0);
    BOOST_CHECK(store.user_exists("erin"));
}

BOOST_AUTO_TEST_CASE(SaveAndLoadExplicitPath) {
    TempDir dir;
    const std::string path = dir.file("dump/users.json");
    store.add_flag("alice", "admin");
    BOOST_CHECK_EQUAL(store.save_to_path(path), 1u);

    store.delete_user("alice");
    store.load_from_path(path);
    BOOST_CHECK(store.has_flag("alice", "admin"));
    BOOST_CHECK(store.authenticate("alice", "wonderland"));

    BOOST_CHECK_THROW(store.load_from_path(dir.file("missing.json")), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
