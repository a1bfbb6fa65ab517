#ifndef VITAL_LOG_LINE_FORMATTER_HPP
#define VITAL_LOG_LINE_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "line_detail.hpp"
#include "../core/log_common.hpp"
#include <string>

namespace vital {
    /// Default human-readable layout:
    ///
    ///   [<ts>]: job:<job> event:<event>[ err:<e>][ time:<d>][ kvs:[...]]
    ///   [<ts>]: job:<job> status:<status> time:<d>[ kvs:[...]]
    ///
    /// Values are copied verbatim. Callers must not embed '[', ']' or
    /// newlines if they want the line to stay machine-splittable.
    class LineFormatter : public IFormatter {
    public:
        std::string format(const Event &event) const override {
            std::string out;
            out.reserve(96 + event.job.size() + event.event.size() + event.error.size());

            out += '[';
            out += formatTimestamp(event.timestamp);
            out += "]: job:";
            out += event.job;

            if (event.kind == EventKind::Complete) {
                out += " status:";
                out += getCompletionStatusString(event.status);
            } else {
                out += " event:";
                out += event.event;
            }

            if (event.kind == EventKind::EventErr) {
                out += " err:";
                out += event.error;
            }

            if (event.kind == EventKind::Timing || event.kind == EventKind::Complete) {
                out += " time:";
                out += detail::line::formatDuration(event.nanos);
            }

            detail::line::appendKvs(out, event.kvs);
            out += '\n';
            return out;
        }
    };
} // namespace vital

#endif // VITAL_LOG_LINE_FORMATTER_HPP
