#pragma once

#include <iostream>
#include <string>

#include "lcr/log/logger.hpp"


namespace livestand::examples {

    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Level level = Level::Info;
        if (!parse_level(log_level, level)) {
            std::cerr << "Unknown log level '" << log_level << "', using info\n";
        }
        Logger::instance().set_level(level);
    }

    // Redirects log output into a size-capped file
    inline bool set_log_file(const std::string& path) {
        if (path.empty()) {
            return true;
        }
        if (!lcr::log::Logger::instance().set_file(path)) {
            std::cerr << "Could not open log file '" << path << "'\n";
            return false;
        }
        return true;
    }

} // namespace livestand::examples
