#ifndef VITAL_LOG_COMPLETION_STATUS_HPP
#define VITAL_LOG_COMPLETION_STATUS_HPP

#include <ostream>

namespace vital {
    /// Terminal outcome of a job, reported through emitComplete().
    enum class CompletionStatus {
        Success,
        ValidationError,
        Panic,
        Error,
        Junk
    };

    inline const char *getCompletionStatusString(CompletionStatus status) {
        switch (status) {
            case CompletionStatus::Success: return "success";
            case CompletionStatus::ValidationError: return "validation_error";
            case CompletionStatus::Panic: return "panic";
            case CompletionStatus::Error: return "error";
            case CompletionStatus::Junk: return "junk";
            default: return "unknown";
        }
    }

    inline std::ostream &operator<<(std::ostream &os, CompletionStatus status) {
        return os << getCompletionStatusString(status);
    }
} // namespace vital

#endif // VITAL_LOG_COMPLETION_STATUS_HPP
