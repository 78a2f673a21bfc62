/*
===============================================================================
 protocol::parser::SnapshotDecoder — Unit Tests
===============================================================================

Scope:
------
Decoding of delivered payloads into schema::MatchSnapshot. The decoder is the
only place where protobuf-JSON conventions (camelCase keys, base64 bytes,
64-bit integers as strings, omitted defaults) are handled.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

D1. camelCase snapshot with base64 match id decodes completely
D2. snake_case keys decode to the same snapshot
D3. A match id that is not base64 is kept as raw bytes
D4. Numeric strings are accepted for ids and ranks; a non-numeric rank is
    InvalidValue
D5. Missing totalTeamStats / tournamentId / matchId is InvalidSchema
D6. Team without id gets the stable name hash
D7. Omitted player fields: empty deathType is absent, omitted telemetry
    booleans decode as false
D8. Non-JSON payloads are InvalidJson; the decoder is reusable afterwards
D9. Only canonical base64 match ids are decoded: unpadded, URL-safe,
    mixed-alphabet or non-zero-tail forms are kept raw, so distinct wire
    ids stay distinct

===============================================================================
*/

#include <iostream>
#include <string>
#include <vector>
#include <cstdint>
#include <type_traits>

#include "lcr/base64.hpp"
#include "livestand/protocol/parser/snapshot.hpp"
#include "common/snapshot_builder.hpp"
#include "common/test_check.hpp"

using namespace livestand;
using namespace livestand::protocol;

using parser::Result;


// -----------------------------------------------------------------------------
// D1. camelCase
// -----------------------------------------------------------------------------
void test_camel_case() {
    std::cout << "[TEST] D1: camelCase snapshot\n";

    const std::string json = R"({
        "matchId": "AQID",
        "tournamentId": "cup-2024",
        "refresh": true,
        "totalTeamStats": [
            {"name": "ALP", "fullName": "Alpha Esports", "id": 11, "rank": 1, "totalScore": 42.5, "totalKills": 9},
            {"name": "BRV", "id": "12", "rank": "2", "placementRank": 3}
        ],
        "teamStats": [
            {"name": "ALP", "id": 11, "rank": 1, "totalKills": 3}
        ],
        "playerStats": [
            {"name": "a1", "teamName": "ALP", "teamId": "11", "postDataPb": {"deathType": "groggy"}},
            {"name": "a2", "teamName": "ALP", "teamId": 11, "telemetryPb": {"isAlive": true, "isGroggy": false}}
        ],
        "totalPlayerStats": []
    })";

    parser::SnapshotDecoder decoder;
    schema::MatchSnapshot s;
    TEST_CHECK(decoder.decode(json, s) == Result::Parsed);

    TEST_CHECK((s.match_id == schema::MatchId{1, 2, 3}));
    TEST_CHECK(schema::to_hex(s.match_id) == "01-02-03");
    TEST_CHECK(s.tournament_id == "cup-2024");
    TEST_CHECK(s.refresh);

    TEST_CHECK(s.total_teams.size() == 2);
    TEST_CHECK(s.total_teams[0].name == "ALP");
    TEST_CHECK(s.total_teams[0].full_name == "Alpha Esports");
    TEST_CHECK(s.total_teams[0].id == 11);
    TEST_CHECK(s.total_teams[0].total_score == 42.5);
    TEST_CHECK(s.total_teams[0].total_kills == 9);
    TEST_CHECK(s.total_teams[1].id == 12);
    TEST_CHECK(s.total_teams[1].rank == 2);
    TEST_CHECK(s.total_teams[1].placement_rank == 3);
    TEST_CHECK(s.total_teams[1].full_name == "BRV");

    TEST_CHECK(s.teams.size() == 1);
    TEST_CHECK(s.teams[0].total_kills == 3);

    TEST_CHECK(s.players.size() == 2);
    TEST_CHECK(s.players[0].team_id == 11);
    TEST_CHECK(s.players[0].death_type == "groggy");
    TEST_CHECK(!s.players[0].telemetry.has());
    TEST_CHECK(!s.players[1].death_type.has());
    TEST_CHECK(s.players[1].telemetry.has());
    TEST_CHECK(s.players[1].telemetry.value().is_alive);
    TEST_CHECK(s.total_players.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D2. snake_case
// -----------------------------------------------------------------------------
void test_snake_case() {
    std::cout << "[TEST] D2: snake_case snapshot\n";

    const std::string json = R"({
        "match_id": "AQID",
        "tournament_id": "cup-2024",
        "total_team_stats": [{"name": "ALP", "team_id": 11, "rank": 1, "total_score": 1, "placement_rank": 4}],
        "team_stats": [{"name": "ALP", "team_id": 11, "rank": 1, "total_kills": 2}],
        "player_stats": [{"name": "a1", "team_name": "ALP", "team_id": 11, "post_data_pb": {"death_type": "dead"},
                          "telemetry_pb": {"is_alive": false}}]
    })";

    parser::SnapshotDecoder decoder;
    schema::MatchSnapshot s;
    TEST_CHECK(decoder.decode(json, s) == Result::Parsed);

    TEST_CHECK((s.match_id == schema::MatchId{1, 2, 3}));
    TEST_CHECK(!s.refresh);
    TEST_CHECK(s.total_teams.size() == 1);
    TEST_CHECK(s.total_teams[0].id == 11);
    TEST_CHECK(s.total_teams[0].placement_rank == 4);
    TEST_CHECK(s.teams[0].total_kills == 2);
    TEST_CHECK(s.players.size() == 1);
    TEST_CHECK(s.players[0].death_type == "dead");
    TEST_CHECK(s.players[0].telemetry.has());
    TEST_CHECK(!s.players[0].telemetry.value().is_alive);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D3. Raw match id
// -----------------------------------------------------------------------------
void test_raw_match_id() {
    std::cout << "[TEST] D3: non-base64 match id\n";

    test::SnapshotBuilder b;
    b.match("match:7").team("ALP", 11, 1);

    parser::SnapshotDecoder decoder;
    schema::MatchSnapshot s;
    TEST_CHECK(decoder.decode(b.json(), s) == Result::Parsed);

    const std::string expected = "match:7";
    TEST_CHECK((s.match_id == schema::MatchId(expected.begin(), expected.end())));
    TEST_CHECK(s.match_id == b.build().match_id);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D4. Numeric strings and invalid ranks
// -----------------------------------------------------------------------------
void test_rank_values() {
    std::cout << "[TEST] D4: numeric strings and invalid rank\n";

    parser::SnapshotDecoder decoder;
    schema::MatchSnapshot s;

    TEST_CHECK(decoder.decode(R"({"matchId":"AQID","tournamentId":"t","totalTeamStats":[{"name":"A","id":"9007199254740993","rank":"3"}]})", s) == Result::Parsed);
    TEST_CHECK(s.total_teams[0].id == 9007199254740993LL);
    TEST_CHECK(s.total_teams[0].rank == 3);

    TEST_CHECK(decoder.decode(R"({"matchId":"AQID","tournamentId":"t","totalTeamStats":[{"name":"A","rank":"first"}]})", s) == Result::InvalidValue);
    TEST_CHECK(decoder.decode(R"({"matchId":"AQID","tournamentId":"t","totalTeamStats":[{"name":"A","rank":1.5}]})", s) == Result::InvalidValue);
    TEST_CHECK(decoder.decode(R"({"matchId":"AQID","tournamentId":"t","totalTeamStats":[{"name":"A"}]})", s) == Result::InvalidSchema);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D5. Required fields
// -----------------------------------------------------------------------------
void test_required_fields() {
    std::cout << "[TEST] D5: required fields\n";

    parser::SnapshotDecoder decoder;
    schema::MatchSnapshot s;

    TEST_CHECK(decoder.decode(R"({"matchId":"AQID","tournamentId":"t"})", s) == Result::InvalidSchema);
    TEST_CHECK(decoder.decode(R"({"matchId":"AQID","totalTeamStats":[]})", s) == Result::InvalidSchema);
    TEST_CHECK(decoder.decode(R"({"tournamentId":"t","totalTeamStats":[]})", s) == Result::InvalidSchema);
    TEST_CHECK(decoder.decode(R"({"matchId":"","tournamentId":"t","totalTeamStats":[]})", s) == Result::InvalidValue);
    TEST_CHECK(decoder.decode(R"({"matchId":"AQID","tournamentId":"t","totalTeamStats":{}})", s) == Result::InvalidSchema);

    // Empty roster is valid
    TEST_CHECK(decoder.decode(R"({"matchId":"AQID","tournamentId":"t","totalTeamStats":[]})", s) == Result::Parsed);
    TEST_CHECK(s.total_teams.empty());
    TEST_CHECK(s.players.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D6. Name hash
// -----------------------------------------------------------------------------
void test_team_id_from_name() {
    std::cout << "[TEST] D6: team id derived from name\n";

    TEST_CHECK(parser::team_id_from_name("") == 0);
    TEST_CHECK(parser::team_id_from_name("a") == 97);
    TEST_CHECK(parser::team_id_from_name("ab") == 97 * 31 + 98);
    TEST_CHECK(parser::team_id_from_name("ALP") == parser::team_id_from_name("ALP"));
    TEST_CHECK(parser::team_id_from_name("ALP") != parser::team_id_from_name("BRV"));
    // Long names wrap around 32 bits and stay non-negative
    TEST_CHECK(parser::team_id_from_name("a very long team name that overflows") >= 0);

    parser::SnapshotDecoder decoder;
    schema::MatchSnapshot s;
    TEST_CHECK(decoder.decode(R"({"matchId":"AQID","tournamentId":"t","totalTeamStats":[{"name":"ab","rank":1}]})", s) == Result::Parsed);
    TEST_CHECK(s.total_teams[0].id == 97 * 31 + 98);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D7. Player defaults
// -----------------------------------------------------------------------------
void test_player_defaults() {
    std::cout << "[TEST] D7: player defaults\n";

    static_assert(std::is_default_constructible_v<schema::PlayerRecord::Telemetry>);
    const schema::PlayerRecord blank{};
    TEST_CHECK(!blank.telemetry.has());
    TEST_CHECK(!blank.death_type.has());
    TEST_CHECK(blank.team_id == 0);

    parser::SnapshotDecoder decoder;
    schema::MatchSnapshot s;
    TEST_CHECK(decoder.decode(R"({"matchId":"AQID","tournamentId":"t","totalTeamStats":[],
        "playerStats":[{"name":"p","postDataPb":{"deathType":""},"telemetryPb":{}}]})", s) == Result::Parsed);

    TEST_CHECK(s.players.size() == 1);
    TEST_CHECK(s.players[0].team_id == 0);
    TEST_CHECK(s.players[0].team_name.empty());
    TEST_CHECK(!s.players[0].death_type.has());
    TEST_CHECK(s.players[0].telemetry.has());
    TEST_CHECK(!s.players[0].telemetry.value().is_alive);
    TEST_CHECK(!s.players[0].telemetry.value().is_groggy);

    TEST_CHECK(decoder.decode(R"({"matchId":"AQID","tournamentId":"t","totalTeamStats":[],
        "playerStats":[{"name":"p","telemetryPb":{"isAlive":"yes"}}]})", s) == Result::InvalidSchema);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D8. Invalid JSON
// -----------------------------------------------------------------------------
void test_invalid_json() {
    std::cout << "[TEST] D8: invalid JSON\n";

    parser::SnapshotDecoder decoder;
    schema::MatchSnapshot s;
    TEST_CHECK(decoder.decode("{\"matchId\":", s) == Result::InvalidJson);
    TEST_CHECK(decoder.decode("", s) == Result::InvalidJson);
    TEST_CHECK(decoder.decode("\"just a string\"", s) == Result::InvalidSchema);

    test::SnapshotBuilder b;
    b.team("ALP", 11, 1);
    TEST_CHECK(decoder.decode(b.json(), s) == Result::Parsed);
    TEST_CHECK(s.total_teams.size() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D9. Canonical match id encoding
// -----------------------------------------------------------------------------
static schema::MatchId decode_match_id(parser::SnapshotDecoder& decoder, const std::string& id) {
    schema::MatchSnapshot s;
    const std::string json = R"({"matchId":")" + id + R"(","tournamentId":"t","totalTeamStats":[]})";
    TEST_CHECK(decoder.decode(json, s) == Result::Parsed);
    return s.match_id;
}

static schema::MatchId raw(const std::string& text) {
    return schema::MatchId(text.begin(), text.end());
}

void test_canonical_match_id() {
    std::cout << "[TEST] D9: canonical base64 match ids\n";

    parser::SnapshotDecoder decoder;

    TEST_CHECK((decode_match_id(decoder, "QTo=") == schema::MatchId{0x41, 0x3A}));
    TEST_CHECK(decode_match_id(decoder, "QTo") == raw("QTo"));
    TEST_CHECK(decode_match_id(decoder, "QTo") != decode_match_id(decoder, "QTo="));

    TEST_CHECK(decode_match_id(decoder, "ab+d").size() == 3);
    TEST_CHECK(decode_match_id(decoder, "ab-d") == raw("ab-d"));
    TEST_CHECK(decode_match_id(decoder, "a+_d") == raw("a+_d"));

    // Non-zero unused bits
    TEST_CHECK(decode_match_id(decoder, "QTp=") == raw("QTp="));
    // Misplaced padding
    TEST_CHECK(decode_match_id(decoder, "Q=o=") == raw("Q=o="));

    std::vector<std::uint8_t> out;
    TEST_CHECK(lcr::base64::decode("AQID", out));
    TEST_CHECK((out == std::vector<std::uint8_t>{1, 2, 3}));
    TEST_CHECK(!lcr::base64::decode("AQI", out));
    TEST_CHECK(out.empty());
    TEST_CHECK(!lcr::base64::decode("A===", out));

    std::cout << "[TEST] OK\n";
}


int main() {
    test_camel_case();
    test_snake_case();
    test_raw_match_id();
    test_rank_values();
    test_required_fields();
    test_team_id_from_name();
    test_player_defaults();
    test_invalid_json();
    test_canonical_match_id();

    std::cout << "\n[SNAPSHOT DECODER TESTS PASSED]\n";
    return 0;
}
