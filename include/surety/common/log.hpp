#pragma once

#include <datapod/datapod.hpp>
#include <iostream>
#include <string>

namespace surety {

    enum class LogLevel : dp::u8 {
        Quiet = 0,
        Warn = 1, // invariant violations, failed automatic releases
        Info = 2, // postings and state transitions
    };

    inline void logWarn(LogLevel level, const std::string &msg) {
        if (level >= LogLevel::Warn)
            std::cerr << "[surety] WARN " << msg << std::endl;
    }

    inline void logInfo(LogLevel level, const std::string &msg) {
        if (level >= LogLevel::Info)
            std::cout << "[surety] " << msg << std::endl;
    }

} // namespace surety
