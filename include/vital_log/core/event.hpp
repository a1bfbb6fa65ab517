#ifndef VITAL_LOG_EVENT_HPP
#define VITAL_LOG_EVENT_HPP

#include "completion_status.hpp"
#include "log_common.hpp"
#include <string>
#include <chrono>
#include <cstdint>

namespace vital {
    enum class EventKind {
        Event,
        EventErr,
        Timing,
        Complete
    };

    /// One emission, as handed from a sink to its formatter.
    ///
    /// @note kvs is borrowed from the caller and only valid for the
    ///       duration of the emit call that built the record. nullptr
    ///       means no metadata was attached.
    struct Event {
        EventKind kind;
        std::chrono::system_clock::time_point timestamp;
        std::string job;
        std::string event;
        std::string error;
        std::int64_t nanos;
        CompletionStatus status;
        const Kvs *kvs;

        Event()
            : kind(EventKind::Event)
            , nanos(0)
            , status(CompletionStatus::Success)
            , kvs(nullptr) {}
    };
} // namespace vital

#endif // VITAL_LOG_EVENT_HPP
