#pragma once

#include <cstdint>
#include <string>
#include <ostream>

#include "livestand/config.hpp"


namespace livestand::protocol {

// Envelope codes that are not sent by the server but assigned locally
inline constexpr std::int64_t CODE_MISSING = -1;

// ===============================================
// BROADCAST ENVELOPE
// ===============================================
// {"code": <int>, "data": "<payload>", "message": "<detail>"}
struct Envelope {
    std::int64_t code = CODE_MISSING;
    std::string  data;       // opaque snapshot payload (code 200)
    std::string  message;    // error detail (other codes)

    [[nodiscard]] inline bool is_authenticated() const noexcept {
        return code == config::CODE_AUTHENTICATED;
    }

    [[nodiscard]] inline bool is_payload() const noexcept {
        return code == config::CODE_PAYLOAD;
    }

    inline void dump(std::ostream& os) const {
        os << "[ENVELOPE] {code=" << code
           << ", data=" << data.size() << " bytes"
           << ", message=\"" << message << "\"}";
    }
};

} // namespace livestand::protocol
