#ifndef VITAL_LOG_SINK_INTERFACE_HPP
#define VITAL_LOG_SINK_INTERFACE_HPP

#include "../core/completion_status.hpp"
#include "../core/log_common.hpp"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>

namespace vital {
    /// The contract an event-dispatch facility calls for every attached
    /// backend. A null kvs pointer means no metadata was attached; the
    /// reference overloads are shorthand for metadata that is present.
    ///
    /// The nullptr overloads make a bare `{}` metadata argument ambiguous,
    /// so it cannot silently mean "absent". Write `Kvs{}` for empty metadata.
    class ISink {
    public:
        virtual ~ISink() = default;

        virtual void emitEvent(const std::string &job, const std::string &event,
                               const Kvs *kvs) = 0;

        virtual void emitEventErr(const std::string &job, const std::string &event,
                                  const std::exception &err, const Kvs *kvs) = 0;

        virtual void emitTiming(const std::string &job, const std::string &event,
                                std::int64_t nanos, const Kvs *kvs) = 0;

        virtual void emitComplete(const std::string &job, CompletionStatus status,
                                  std::int64_t nanos, const Kvs *kvs) = 0;

        void emitEvent(const std::string &job, const std::string &event) {
            emitEvent(job, event, nullptr);
        }

        void emitEvent(const std::string &job, const std::string &event, const Kvs &kvs) {
            emitEvent(job, event, &kvs);
        }

        void emitEvent(const std::string &job, const std::string &event, std::nullptr_t) {
            emitEvent(job, event, static_cast<const Kvs *>(nullptr));
        }

        void emitEventErr(const std::string &job, const std::string &event,
                          const std::exception &err) {
            emitEventErr(job, event, err, nullptr);
        }

        void emitEventErr(const std::string &job, const std::string &event,
                          const std::exception &err, const Kvs &kvs) {
            emitEventErr(job, event, err, &kvs);
        }

        void emitEventErr(const std::string &job, const std::string &event,
                          const std::exception &err, std::nullptr_t) {
            emitEventErr(job, event, err, static_cast<const Kvs *>(nullptr));
        }

        void emitTiming(const std::string &job, const std::string &event, std::int64_t nanos) {
            emitTiming(job, event, nanos, nullptr);
        }

        void emitTiming(const std::string &job, const std::string &event,
                        std::int64_t nanos, const Kvs &kvs) {
            emitTiming(job, event, nanos, &kvs);
        }

        void emitTiming(const std::string &job, const std::string &event,
                        std::int64_t nanos, std::nullptr_t) {
            emitTiming(job, event, nanos, static_cast<const Kvs *>(nullptr));
        }

        void emitComplete(const std::string &job, CompletionStatus status, std::int64_t nanos) {
            emitComplete(job, status, nanos, nullptr);
        }

        void emitComplete(const std::string &job, CompletionStatus status,
                          std::int64_t nanos, const Kvs &kvs) {
            emitComplete(job, status, nanos, &kvs);
        }

        void emitComplete(const std::string &job, CompletionStatus status,
                          std::int64_t nanos, std::nullptr_t) {
            emitComplete(job, status, nanos, static_cast<const Kvs *>(nullptr));
        }
    };
} // namespace vital

#endif // VITAL_LOG_SINK_INTERFACE_HPP
