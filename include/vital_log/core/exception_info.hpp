#ifndef VITAL_LOG_EXCEPTION_INFO_HPP
#define VITAL_LOG_EXCEPTION_INFO_HPP

#include <exception>

namespace vital {
namespace detail {

    inline const char* safeWhat(const std::exception& ex) {
        const char* msg = ex.what();
        return msg ? msg : "(no message)";
    }

} // namespace detail
} // namespace vital

#endif // VITAL_LOG_EXCEPTION_INFO_HPP
