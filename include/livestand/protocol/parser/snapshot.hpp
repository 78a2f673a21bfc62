#pragma once

#include <cstdint>
#include <string_view>

#include "livestand/schema/snapshot.hpp"
#include "livestand/protocol/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
SnapshotDecoder
================================================================================

Decodes one delivered payload into a schema::MatchSnapshot.

Accepted input:
  • Protobuf-JSON (camelCase keys, bytes as base64, int64 as strings)
  • Plain JSON with snake_case keys and numeric values

Validation:
  • matchId and tournamentId are required and non-empty
  • totalTeamStats is required; the other arrays default to empty
  • every team needs a non-empty name and a numeric rank

The decoder owns its simdjson parser and reuses its buffers across calls.
It is not thread-safe; the DispatchQueue calls it from one thread.

================================================================================
*/

namespace livestand::protocol::parser {

// Stable numeric id derived from a team name (31-multiplier string hash),
// used when a team record carries no explicit id.
[[nodiscard]]
std::int64_t team_id_from_name(std::string_view name) noexcept;

class SnapshotDecoder {
public:
    SnapshotDecoder() = default;

    SnapshotDecoder(const SnapshotDecoder&) = delete;
    SnapshotDecoder& operator=(const SnapshotDecoder&) = delete;

    [[nodiscard]]
    Result decode(std::string_view payload, schema::MatchSnapshot& out) noexcept;

private:
    simdjson::dom::parser parser_;
};

} // namespace livestand::protocol::parser
