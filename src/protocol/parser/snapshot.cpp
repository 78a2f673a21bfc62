#include "livestand/protocol/parser/snapshot.hpp"
#include "livestand/protocol/parser/helpers.hpp"
#include "lcr/base64.hpp"
#include "lcr/log/logger.hpp"

#include <cstdlib>
#include <new>
#include <utility>
#include <vector>
#include <string>


namespace livestand::protocol::parser {

std::int64_t team_id_from_name(std::string_view name) noexcept {
    std::uint32_t hash = 0;
    for (unsigned char c : name) {
        hash = (hash << 5) - hash + c;
    }
    return std::llabs(static_cast<std::int64_t>(static_cast<std::int32_t>(hash)));
}

namespace {

// -----------------------------------------------------------------------------
// Match id: base64 (protobuf-JSON bytes) or raw UTF-8
// -----------------------------------------------------------------------------
[[nodiscard]]
Result parse_match_id(const simdjson::dom::element& root, schema::MatchId& out) {
    std::string_view sv;
    if (helper::parse_string_required(root, {"matchId", "match_id"}, sv) != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'matchId' missing or invalid in snapshot -> ignore message.");
        return Result::InvalidSchema;
    }
    if (sv.empty()) {
        LS_DEBUG("[PARSER] Field 'matchId' empty in snapshot -> ignore message.");
        return Result::InvalidValue;
    }
    out.clear();
    if (!lcr::base64::decode(sv, out) || out.empty()) {
        out.assign(sv.begin(), sv.end());
    }
    return Result::Parsed;
}

// -----------------------------------------------------------------------------
// Team record
// -----------------------------------------------------------------------------
[[nodiscard]]
Result parse_team(const simdjson::dom::element& elem, schema::TeamRecord& out) {
    if (helper::require_object(elem) != Result::Parsed) {
        LS_DEBUG("[PARSER] Team record not an object -> ignore message.");
        return Result::InvalidSchema;
    }

    // name (required, non-empty)
    std::string_view name;
    if (helper::parse_string_required(elem, {"name"}, name) != Result::Parsed || name.empty()) {
        LS_DEBUG("[PARSER] Field 'name' missing or invalid in team record -> ignore message.");
        return Result::InvalidSchema;
    }
    out.name = std::string(name);

    // fullName (optional)
    std::string_view full_name;
    bool has_full_name = false;
    if (helper::parse_string_optional(elem, {"fullName", "full_name"}, full_name, has_full_name) != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'fullName' invalid in team '" << out.name << "' -> ignore message.");
        return Result::InvalidSchema;
    }
    out.full_name = (has_full_name && !full_name.empty()) ? std::string(full_name) : out.name;

    // id (optional, derived from the name when absent)
    bool has_id = false;
    Result r = helper::parse_int64_optional(elem, {"id"}, out.id, has_id);
    if (r == Result::Parsed && !has_id) {
        r = helper::parse_int64_optional(elem, {"teamId", "team_id"}, out.id, has_id);
    }
    if (r != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'id' invalid in team '" << out.name << "' -> ignore message.");
        return r;
    }
    if (!has_id) {
        out.id = team_id_from_name(out.name);
    }

    // rank (required, numeric)
    r = helper::parse_int64_required(elem, {"rank"}, out.rank);
    if (r != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'rank' missing or not numeric in team '" << out.name << "' -> ignore message.");
        return r;
    }

    bool present = false;
    if (helper::parse_int64_optional(elem, {"placementRank", "placement_rank"}, out.placement_rank, present) != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'placementRank' invalid in team '" << out.name << "' -> ignore message.");
        return Result::InvalidValue;
    }
    if (helper::parse_int64_optional(elem, {"totalKills", "total_kills"}, out.total_kills, present) != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'totalKills' invalid in team '" << out.name << "' -> ignore message.");
        return Result::InvalidValue;
    }
    if (helper::parse_double_optional(elem, {"totalScore", "total_score"}, out.total_score, present) != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'totalScore' invalid in team '" << out.name << "' -> ignore message.");
        return Result::InvalidValue;
    }
    if (helper::parse_bool_optional(elem, {"eliminated"}, out.eliminated, present) != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'eliminated' invalid in team '" << out.name << "' -> ignore message.");
        return Result::InvalidSchema;
    }

    return Result::Parsed;
}

// -----------------------------------------------------------------------------
// Player record
// -----------------------------------------------------------------------------
[[nodiscard]]
Result parse_player(const simdjson::dom::element& elem, schema::PlayerRecord& out) {
    if (helper::require_object(elem) != Result::Parsed) {
        LS_DEBUG("[PARSER] Player record not an object -> ignore message.");
        return Result::InvalidSchema;
    }

    bool present = false;
    std::string_view sv;

    if (helper::parse_string_optional(elem, {"name"}, sv, present) != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'name' invalid in player record -> ignore message.");
        return Result::InvalidSchema;
    }
    if (present) {
        out.name = std::string(sv);
    }

    if (helper::parse_string_optional(elem, {"teamName", "team_name"}, sv, present) != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'teamName' invalid in player '" << out.name << "' -> ignore message.");
        return Result::InvalidSchema;
    }
    if (present) {
        out.team_name = std::string(sv);
    }

    if (helper::parse_int64_optional(elem, {"teamId", "team_id"}, out.team_id, present) != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'teamId' invalid in player '" << out.name << "' -> ignore message.");
        return Result::InvalidValue;
    }

    // postDataPb.deathType (optional, empty means absent)
    simdjson::dom::element post;
    bool has_post = false;
    if (helper::parse_object_optional(elem, {"postDataPb", "post_data_pb"}, post, has_post) != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'postDataPb' invalid in player '" << out.name << "' -> ignore message.");
        return Result::InvalidSchema;
    }
    if (has_post) {
        if (helper::parse_string_optional(post, {"deathType", "death_type"}, sv, present) != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'deathType' invalid in player '" << out.name << "' -> ignore message.");
            return Result::InvalidSchema;
        }
        if (present && !sv.empty()) {
            out.death_type.emplace(sv);
        }
    }

    // telemetryPb.isAlive / isGroggy (optional)
    simdjson::dom::element telemetry;
    bool has_telemetry = false;
    if (helper::parse_object_optional(elem, {"telemetryPb", "telemetry_pb"}, telemetry, has_telemetry) != Result::Parsed) {
        LS_DEBUG("[PARSER] Field 'telemetryPb' invalid in player '" << out.name << "' -> ignore message.");
        return Result::InvalidSchema;
    }
    if (has_telemetry) {
        schema::PlayerRecord::Telemetry t;
        if (helper::parse_bool_optional(telemetry, {"isAlive", "is_alive"}, t.is_alive, present) != Result::Parsed ||
            helper::parse_bool_optional(telemetry, {"isGroggy", "is_groggy"}, t.is_groggy, present) != Result::Parsed) {
            LS_DEBUG("[PARSER] Telemetry flags invalid in player '" << out.name << "' -> ignore message.");
            return Result::InvalidSchema;
        }
        out.telemetry = t;
    }

    return Result::Parsed;
}

// -----------------------------------------------------------------------------
// Arrays
// -----------------------------------------------------------------------------
template<class Record, class ParseFn>
[[nodiscard]]
Result parse_records(const simdjson::dom::element& root, helper::Key key, bool required,
                     std::vector<Record>& out, ParseFn&& parse_one) {
    out.clear();
    simdjson::dom::array arr;
    bool present = true;
    Result r = required ? helper::parse_array_required(root, key, arr)
                        : helper::parse_array_optional(root, key, arr, present);
    if (r != Result::Parsed) {
        LS_DEBUG("[PARSER] Field '" << key.primary << "' missing or not an array in snapshot -> ignore message.");
        return r;
    }
    if (!present) {
        return Result::Parsed;
    }
    out.reserve(arr.size());
    for (simdjson::dom::element elem : arr) {
        Record rec;
        r = parse_one(elem, rec);
        if (r != Result::Parsed) {
            return r;
        }
        out.push_back(std::move(rec));
    }
    return Result::Parsed;
}

} // namespace

// ============================================================================
// SnapshotDecoder
// ============================================================================

Result SnapshotDecoder::decode(std::string_view payload, schema::MatchSnapshot& out) noexcept {
    try {
        out = schema::MatchSnapshot{};

        simdjson::dom::element root;
        auto error = parser_.parse(payload.data(), payload.size()).get(root);
        if (error) {
            LS_DEBUG("[PARSER] Snapshot is not valid JSON (" << simdjson::error_message(error) << ") -> ignore message.");
            return Result::InvalidJson;
        }

        // Root must be an object
        if (helper::require_object(root) != Result::Parsed) {
            LS_DEBUG("[PARSER] Snapshot root not an object -> ignore message.");
            return Result::InvalidSchema;
        }

        Result r = parse_match_id(root, out.match_id);
        if (r != Result::Parsed) {
            return r;
        }

        // tournamentId (required, non-empty)
        std::string_view tournament;
        if (helper::parse_string_required(root, {"tournamentId", "tournament_id"}, tournament) != Result::Parsed || tournament.empty()) {
            LS_DEBUG("[PARSER] Field 'tournamentId' missing or invalid in snapshot -> ignore message.");
            return Result::InvalidSchema;
        }
        out.tournament_id = std::string(tournament);

        // refresh (optional)
        bool present = false;
        if (helper::parse_bool_optional(root, {"refresh"}, out.refresh, present) != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'refresh' invalid in snapshot -> ignore message.");
            return Result::InvalidSchema;
        }

        if ((r = parse_records(root, {"totalTeamStats", "total_team_stats"}, true, out.total_teams, parse_team)) != Result::Parsed) {
            return r;
        }
        if ((r = parse_records(root, {"teamStats", "team_stats"}, false, out.teams, parse_team)) != Result::Parsed) {
            return r;
        }
        if ((r = parse_records(root, {"playerStats", "player_stats"}, false, out.players, parse_player)) != Result::Parsed) {
            return r;
        }
        if ((r = parse_records(root, {"totalPlayerStats", "total_player_stats"}, false, out.total_players, parse_player)) != Result::Parsed) {
            return r;
        }

        return Result::Parsed;
    }
    catch (const std::bad_alloc&) {
        LS_ERROR("[PARSER] Out of memory while decoding snapshot -> ignore message.");
        return Result::InvalidJson;
    }
}

} // namespace livestand::protocol::parser
