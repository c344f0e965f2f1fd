// player_record_tests.cpp
#define BOOST_TEST_MODULE PlayerRecordTests
#include <boost/test/unit_test.hpp>

#include <limits>
#include <nlohmann/json.hpp>
#include "player_record.hpp"

using json = nlohmann::json;

BOOST_AUTO_TEST_SUITE(UsernameTests)

BOOST_AUTO_TEST_CASE(NormalizeLowercases) {
    BOOST_CHECK_EQUAL(normalize_username("AlIcE"), "alice");
}

BOOST_AUTO_TEST_CASE(ValidNamesAreThreeToTwelveLetters) {
    BOOST_CHECK(is_valid_username("bob"));
    BOOST_CHECK(is_valid_username("abcdefghijkl"));
    BOOST_CHECK(!is_valid_username("al"));
    BOOST_CHECK(!is_valid_username("abcdefghijklm"));
    BOOST_CHECK(!is_valid_username("bob1"));
    BOOST_CHECK(!is_valid_username("bob smith"));
    BOOST_CHECK(!is_valid_username(""));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TimestampTests)

BOOST_AUTO_TEST_CASE(FormatsUtcWithMilliseconds) {
    TimePoint tp = Clock::from_time_t(1709294400) + std::chrono::milliseconds(123); // 2024-03-01T12:00:00
    BOOST_CHECK_EQUAL(format_iso8601(tp), "2024-03-01T12:00:00.123Z");
}

BOOST_AUTO_TEST_CASE(ParsesWithAndWithoutFraction) {
    auto with = parse_iso8601("2024-03-01T12:00:00.123Z");
    BOOST_REQUIRE(with);
    BOOST_CHECK(*with == Clock::from_time_t(1709294400) + std::chrono::milliseconds(123));

    auto without = parse_iso8601("2024-03-01T12:00:00Z");
    BOOST_REQUIRE(without);
    BOOST_CHECK(*without == Clock::from_time_t(1709294400));

    BOOST_CHECK(!parse_iso8601("yesterday"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ManaTests)

BOOST_AUTO_TEST_CASE(PatchClampsManaToNewMaximum) {
    PlayerRecord r;
    PlayerPatch patch;
    patch.max_mana = 40;
    patch.apply_to(r);
    BOOST_CHECK_EQUAL(r.max_mana, 40);
    BOOST_CHECK_EQUAL(r.mana, 40);

    PlayerPatch negative;
    negative.mana = -5;
    negative.apply_to(r);
    BOOST_CHECK_EQUAL(r.mana, 0);
}

BOOST_AUTO_TEST_CASE(PatchReplacesFlags) {
    PlayerRecord r;
    r.flags = {"newbie", "quiet"};
    PlayerPatch patch;
    patch.flags = std::vector<std::string>{"admin"};
    patch.apply_to(r);
    BOOST_REQUIRE_EQUAL(r.flags.size(), 1u);
    BOOST_CHECK_EQUAL(r.flags[0], "admin");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonLayoutTests)

BOOST_AUTO_TEST_CASE(PartialRecordGetsDefaults) {
    json j = { {"username", "Carol"}, {"password", "hunter"}, {"maxMana", 50} };
    PlayerRecord r = j.get<PlayerRecord>();

    BOOST_CHECK_EQUAL(r.username, "carol");
    BOOST_CHECK(r.credential.needs_migration());
    BOOST_CHECK_EQUAL(r.health, 100);
    BOOST_CHECK_EQUAL(r.level, 1);
    BOOST_CHECK_EQUAL(r.max_mana, 50);
    BOOST_CHECK_EQUAL(r.mana, 50);
    BOOST_CHECK_EQUAL(r.strength, 10);
    BOOST_CHECK_EQUAL(r.current_room_id, "start");
    BOOST_CHECK(r.inventory.items.empty());
    BOOST_CHECK_EQUAL(r.inventory.currency.gold, 0);
    BOOST_CHECK(r.last_login == r.join_date);
}

BOOST_AUTO_TEST_CASE(WritesCamelCaseKeysAndKeepsUnknownOnes) {
    json in = {
        {"username", "dave"},
        {"passwordHash", "abc"},
        {"salt", "def"},
        {"currentRoomId", "tavern"},
        {"inventory", { {"items", {"sword-1"}}, {"currency", { {"gold", 3} }} }},
        {"bank", { {"silver", 7} }},
        {"joinDate", "2024-03-01T12:00:00.000Z"},
        {"questLog", { {"active", 2} }},
    };
    PlayerRecord r = in.get<PlayerRecord>();
    json out = r;

    BOOST_CHECK_EQUAL(out["passwordHash"], "abc");
    BOOST_CHECK(!out.contains("password"));
    BOOST_CHECK_EQUAL(out["currentRoomId"], "tavern");
    BOOST_CHECK_EQUAL(out["inventory"]["items"][0], "sword-1");
    BOOST_CHECK_EQUAL(out["inventory"]["currency"]["gold"], 3);
    BOOST_CHECK_EQUAL(out["bank"]["silver"], 7);
    BOOST_CHECK_EQUAL(out["joinDate"], "2024-03-01T12:00:00.000Z");
    BOOST_CHECK_EQUAL(out["questLog"]["active"], 2);
    BOOST_CHECK(out.contains("maxHealth"));
    BOOST_CHECK(out.contains("totalPlayTime"));
}

BOOST_AUTO_TEST_CASE(EpochMillisecondDatesAreAccepted) {
    json in = { {"username", "erin"}, {"lastLogin", 1709294400000LL} };
    PlayerRecord r = in.get<PlayerRecord>();
    BOOST_CHECK(r.last_login == Clock::from_time_t(1709294400));
}

BOOST_AUTO_TEST_CASE(OversizedNumbersSaturate) {
    json in = {
        {"username", "frank"},
        {"experience", 1e300},
        {"level", -1e300},
        {"strength", 42.9},
        {"totalPlayTime", 18446744073709551615ULL},
        {"lastLogin", 1e300},
    };
    PlayerRecord r = in.get<PlayerRecord>();
    BOOST_CHECK_EQUAL(r.experience, std::numeric_limits<int64_t>::max());
    BOOST_CHECK_EQUAL(r.level, std::numeric_limits<int64_t>::min());
    BOOST_CHECK_EQUAL(r.strength, 42);
    BOOST_CHECK_EQUAL(r.total_play_time, std::numeric_limits<int64_t>::max());
    // Out-of-range dates fall back to the join date.
    BOOST_CHECK(r.last_login == r.join_date);
}

BOOST_AUTO_TEST_SUITE_END()
