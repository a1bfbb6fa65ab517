#ifndef VITAL_LOG_LEVEL_HPP
#define VITAL_LOG_LEVEL_HPP

#include <cctype>
#include <cstring>
#include <istream>
#include <ostream>
#include <string>

namespace vital {
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        ERROR
    };

    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "trace";
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO: return "info";
            case LogLevel::ERROR: return "error";
            default: return "unknown";
        }
    }

    /// Case-insensitive lookup of one of the canonical level names.
    /// Returns false and leaves @p out untouched for anything else,
    /// including surrounding whitespace.
    inline bool parseLevel(const std::string &text, LogLevel &out) {
        static const LogLevel kLevels[] = {
            LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO, LogLevel::ERROR
        };

        for (LogLevel candidate : kLevels) {
            const char *name = getLevelString(candidate);
            if (text.size() != std::strlen(name)) continue;

            bool match = true;
            for (size_t i = 0; i < text.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(text[i])) != name[i]) {
                    match = false;
                    break;
                }
            }
            if (match) {
                out = candidate;
                return true;
            }
        }
        return false;
    }

    inline std::ostream &operator<<(std::ostream &os, LogLevel level) {
        return os << getLevelString(level);
    }

    /// Reads one whitespace-delimited token. Unknown text sets failbit.
    inline std::istream &operator>>(std::istream &is, LogLevel &level) {
        std::string token;
        if (!(is >> token)) return is;

        LogLevel parsed = LogLevel::TRACE;
        if (parseLevel(token, parsed)) {
            level = parsed;
        } else {
            is.setstate(std::ios_base::failbit);
        }
        return is;
    }
} // namespace vital

#endif // VITAL_LOG_LEVEL_HPP
