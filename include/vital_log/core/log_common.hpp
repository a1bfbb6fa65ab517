#ifndef VITAL_LOG_COMMON_HPP
#define VITAL_LOG_COMMON_HPP

#include <string>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <memory>
#include <unordered_map>
#include <utility>

namespace vital {
    /// Optional per-event metadata. Rendered with keys sorted ascending.
    typedef std::unordered_map<std::string, std::string> Kvs;

namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    inline bool toUtc(std::time_t t, std::tm &out) {
#ifdef _WIN32
        return gmtime_s(&out, &t) == 0;
#else
        return gmtime_r(&t, &out) != nullptr;
#endif
    }
} // namespace detail

    /// RFC 3339 UTC timestamp with a fixed nine-digit fraction,
    /// e.g. 2024-03-01T12:30:45.123456789Z.
    inline std::string formatTimestamp(const std::chrono::system_clock::time_point &time) {
        auto sinceEpoch = std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch());
        long long secs = sinceEpoch.count() / 1000000000LL;
        long long nanos = sinceEpoch.count() % 1000000000LL;
        // Pre-epoch instants: borrow a second so the fraction stays positive.
        if (nanos < 0) {
            nanos += 1000000000LL;
            secs -= 1;
        }

        std::tm tm = {};
        if (!detail::toUtc(static_cast<std::time_t>(secs), tm)) {
            return "0000-00-00T00:00:00.000000000Z";
        }

        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%09lldZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, nanos);
        return std::string(buf);
    }
} // namespace vital

#endif // VITAL_LOG_COMMON_HPP
