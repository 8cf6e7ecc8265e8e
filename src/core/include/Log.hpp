#pragma once
#include <string>

namespace swash {

    enum class LogProfile : int { quiet = 0, normal = 1, debug = 2 };

    extern LogProfile global_log_profile;

    // True when the current profile is at least as verbose as `level`
    inline bool log_at_least(LogProfile level) {
        return static_cast<int>(global_log_profile) >= static_cast<int>(level);
    }

    inline bool log_normal_enabled() { return log_at_least(LogProfile::normal); }
    inline bool log_debug_enabled() { return log_at_least(LogProfile::debug); }

    const char* log_profile_name(LogProfile profile);

    // "quiet", "normal" or "debug", any case. Unknown input gives normal and clears *valid
    LogProfile parse_log_profile(const std::string& value, bool* valid = nullptr);

    // Writes "[swash] message" to std::clog when `level` is enabled
    void log_message(LogProfile level, const std::string& message);
}
