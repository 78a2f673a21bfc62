#pragma once

#include <string>
#include <string_view>

#include <CLI/CLI.hpp>


namespace livestand::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty() || value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with ws:// or wss://";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Host validator (no scheme, no path)
// -------------------------------------------------------------
inline auto host_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.find("://") != std::string::npos) {
            return "Host must not include a scheme (use --url for full endpoints)";
        }
        if (value.find('/') != std::string::npos) {
            return "Host must not include a path";
        }
        return {};
    },
    "Broadcast host validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error"});


// -------------------------------------------------------------
// Dedup policy validator
// -------------------------------------------------------------
inline auto dedup_validator = CLI::IsMember({"keep-newest", "newest-of-two"});

} // namespace livestand::examples::cli
