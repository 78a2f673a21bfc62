#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "livestand/config.hpp"
#include "livestand/transport/parse_url.hpp"

#include "common/cli/validators.hpp"
#include "common/logger.hpp"


namespace livestand::examples::cli {

struct Params {
    std::string   host          = "localhost:8080";
    bool          secure        = false;
    std::string   url           = "";      // overrides host/secure when set
    std::string   token         = "";
    std::string   log_level     = "info";
    std::string   log_file      = "";
    std::int64_t  pacing_ms     = config::PACING_INTERVAL.count();
    std::int64_t  check_ms      = config::PACING_CHECK.count();
    std::int64_t  reconnect_ms  = config::RECONNECT_DELAY.count();
    std::int64_t  timeout_ms    = config::CONNECT_TIMEOUT.count();
    std::size_t   max_teams     = config::MAX_DISPLAYED_TEAMS;
    std::string   dedup         = std::string(to_string(DedupPolicy::KeepNewest));
    std::string   file          = "";      // replay input

    [[nodiscard]]
    inline std::string endpoint() const {
        return url.empty() ? transport::make_broadcast_url(host, secure) : url;
    }

    [[nodiscard]]
    inline Config to_config() const {
        Config cfg;
        cfg.pacing_interval     = std::chrono::milliseconds{pacing_ms};
        cfg.pacing_check        = std::chrono::milliseconds{check_ms};
        cfg.reconnect_delay     = std::chrono::milliseconds{reconnect_ms};
        cfg.connect_timeout     = std::chrono::milliseconds{timeout_ms};
        cfg.max_displayed_teams = max_teams;
        cfg.dedup = (dedup == to_string(DedupPolicy::NewestOfTwo)) ? DedupPolicy::NewestOfTwo : DedupPolicy::KeepNewest;
        return cfg;
    }

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n";
        if (!file.empty()) {
            os << "  File      : " << file << "\n";
        }
        else {
            os << "  Endpoint  : " << endpoint() << "\n"
               << "  Token     : " << (token.empty() ? "(none)" : "(set)") << "\n"
               << "  Reconnect : " << reconnect_ms << " ms\n"
               << "  Timeout   : " << timeout_ms << " ms\n";
        }
        os << "  Pacing    : " << pacing_ms << " ms (check " << check_ms << " ms)\n"
           << "  Max teams : " << max_teams << "\n"
           << "  Dedup     : " << dedup << "\n"
           << "  Log Level : " << log_level << "\n";
        if (!log_file.empty()) {
            os << "  Log File  : " << log_file << "\n";
        }
    }
};

namespace detail {

inline void add_common_options(CLI::App& app, Params& params) {
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
    app.add_option("--log-file", params.log_file, "Write logs to this file instead of stdout");
    app.add_option("--pacing-ms", params.pacing_ms, "Minimum time between two deliveries")->check(CLI::Range(1, 600000))->default_val(params.pacing_ms);
    app.add_option("--check-ms", params.check_ms, "Granularity of the pacing tick")->check(CLI::Range(1, 60000))->default_val(params.check_ms);
    app.add_option("--max-teams", params.max_teams, "Maximum number of displayed teams")->check(CLI::Range(1, 64))->default_val(params.max_teams);
    app.add_option("--dedup", params.dedup, "Dedup policy: keep-newest | newest-of-two")->check(dedup_validator)->default_val(params.dedup);
}

[[noreturn]]
inline void fail(CLI::App& app, const CLI::ParseError& e) {
    app.exit(e, std::cout, std::cerr);
    std::exit(EXIT_FAILURE);
}

inline void apply_logging(const Params& params) {
    set_log_level(params.log_level);
    if (!set_log_file(params.log_file)) {
        std::exit(EXIT_FAILURE);
    }
}

} // namespace detail

// Options of the live client
[[nodiscard]]
inline Params configure_client(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--host", params.host, "Broadcast server host[:port]")->check(host_validator)->default_val(params.host);
    app.add_flag("--secure", params.secure, "Use wss:// instead of ws://");
    app.add_option("--url", params.url, "Full WebSocket endpoint (overrides --host/--secure)")->check(ws_url_validator);
    app.add_option("-t,--token", params.token, "Access token sent on every (re)connect")->required();
    app.add_option("--reconnect-ms", params.reconnect_ms, "Delay before reconnecting after a lost connection")->check(CLI::Range(1, 600000))->default_val(params.reconnect_ms);
    app.add_option("--connect-timeout-ms", params.timeout_ms, "Deadline for one connection attempt, upgrade included")->check(CLI::Range(1, 600000))->default_val(params.timeout_ms);
    detail::add_common_options(app, params);

    app.footer(
        "Each reconciled snapshot is printed as a diff.\n"
        "Reconnection is automatic until Ctrl+C."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        detail::fail(app, e);
    }

    detail::apply_logging(params);
    return params;
}

// Options of the replay tool
[[nodiscard]]
inline Params configure_replay(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-f,--file", params.file, "Snapshot payloads, one JSON object per line")->required()->check(CLI::ExistingFile);
    detail::add_common_options(app, params);

    app.footer(
        "A line is queued once the previous one was delivered, so none is deduplicated.\n"
        "Blank lines are skipped."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        detail::fail(app, e);
    }

    detail::apply_logging(params);
    return params;
}

} // namespace livestand::examples::cli
