#pragma once

#include <string>
#include <string_view>

#include "lcr/json.hpp"


namespace livestand::protocol {

// ===============================================
// AUTHENTICATION REQUEST
// ===============================================
// Sent exactly once per successful transport open.
struct AuthRequest {
    std::string access_token;

    // {"access_token":"<credential>"}
    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(access_token.size() + 20);
        out += "{\"access_token\":\"";
        lcr::json::append_escaped(out, access_token);
        out += "\"}";
        return out;
    }
};

} // namespace livestand::protocol
