#include "Log.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace swash {

    LogProfile global_log_profile = LogProfile::normal;

    const char* log_profile_name(LogProfile profile) {
        switch (profile) {
            case LogProfile::quiet: return "quiet";
            case LogProfile::debug: return "debug";
            default:                return "normal";
        }
    }

    LogProfile parse_log_profile(const std::string& value, bool* valid) {
        std::string lowered = value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (valid) *valid = true;
        if (lowered == "quiet") return LogProfile::quiet;
        if (lowered == "normal") return LogProfile::normal;
        if (lowered == "debug") return LogProfile::debug;

        if (valid) *valid = false;
        return LogProfile::normal;
    }

    void log_message(LogProfile level, const std::string& message) {
        if (!log_at_least(level)) return;
        std::clog << "[swash] " << message << std::endl;
    }
}
