#ifndef VITAL_LOG_WRITER_SINK_HPP
#define VITAL_LOG_WRITER_SINK_HPP

#include "sink_interface.hpp"
#include "../core/event.hpp"
#include "../core/exception_info.hpp"
#include "../core/log_level.hpp"
#include "../formatter/line_formatter.hpp"
#include "../transport/stream_transport.hpp"
#include <chrono>
#include <cstdio>
#include <functional>
#include <memory>
#include <ostream>
#include <stdexcept>

namespace vital {

    class WriterSinkConfiguration;

    /// Sink that renders each event as one human-readable line and writes
    /// it through a transport in a single call.
    ///
    /// @code
    ///   vital::WriterSink out(std::cout);
    ///   vital::WriterSink file(vital::detail::make_unique<vital::FileTransport>("jobs.log"),
    ///                          vital::LogLevel::INFO);
    ///   file.emitTiming("import", "fetch", 34567890, kvs);
    /// @endcode
    ///
    /// Events are logged unless their metadata carries a "level" key that
    /// parses to a level below the sink's threshold. Unparseable levels are
    /// logged.
    ///
    /// Formatter and transport failures never reach the caller; they are
    /// passed to the write-error handler, which by default prints a warning
    /// on stderr.
    ///
    /// The sink holds no mutable state and takes no locks. Concurrent
    /// emission is as safe as the transport's write().
    class WriterSink : public ISink {
    public:
        /// Receives a failed write and the size of the line that was attempted.
        /// Must not throw.
        using WriteErrorHandler = std::function<void(const WriteResult&, std::size_t)>;

        static WriterSinkConfiguration configure();

        explicit WriterSink(std::unique_ptr<ITransport> transport,
                            LogLevel level = LogLevel::INFO,
                            std::unique_ptr<IFormatter> formatter = nullptr,
                            WriteErrorHandler onWriteError = defaultWriteErrorHandler())
            : m_transport(std::move(transport))
            , m_formatter(std::move(formatter))
            , m_level(level)
            , m_onWriteError(std::move(onWriteError)) {
            if (!m_transport) {
                throw std::invalid_argument("WriterSink requires a transport");
            }
            if (!m_formatter) {
                m_formatter = detail::make_unique<LineFormatter>();
            }
        }

        /// Writes to a caller-owned stream, which must outlive the sink.
        explicit WriterSink(std::ostream &stream, LogLevel level = LogLevel::INFO)
            : WriterSink(detail::make_unique<StreamTransport>(stream), level) {}

        WriterSink(const WriterSink &) = delete;
        WriterSink &operator=(const WriterSink &) = delete;

        using ISink::emitEvent;
        using ISink::emitEventErr;
        using ISink::emitTiming;
        using ISink::emitComplete;

        void emitEvent(const std::string &job, const std::string &event,
                       const Kvs *kvs) override {
            if (!shouldLogEvent(kvs)) return;

            Event e = makeEvent(EventKind::Event, job, kvs);
            e.event = event;
            dispatch(e);
        }

        void emitEventErr(const std::string &job, const std::string &event,
                          const std::exception &err, const Kvs *kvs) override {
            if (!shouldLogEvent(kvs)) return;

            Event e = makeEvent(EventKind::EventErr, job, kvs);
            e.event = event;
            e.error = detail::safeWhat(err);
            dispatch(e);
        }

        void emitTiming(const std::string &job, const std::string &event,
                        std::int64_t nanos, const Kvs *kvs) override {
            if (!shouldLogEvent(kvs)) return;

            Event e = makeEvent(EventKind::Timing, job, kvs);
            e.event = event;
            e.nanos = nanos;
            dispatch(e);
        }

        void emitComplete(const std::string &job, CompletionStatus status,
                          std::int64_t nanos, const Kvs *kvs) override {
            if (!shouldLogEvent(kvs)) return;

            Event e = makeEvent(EventKind::Complete, job, kvs);
            e.status = status;
            e.nanos = nanos;
            dispatch(e);
        }

        /// True unless kvs["level"] names a level below the threshold.
        bool shouldLogEvent(const Kvs *kvs) const {
            if (!kvs) return true;

            auto it = kvs->find("level");
            if (it == kvs->end()) return true;

            LogLevel eventLevel = LogLevel::TRACE;
            if (!parseLevel(it->second, eventLevel)) {
                // unknown level text: log it rather than lose it
                return true;
            }
            return eventLevel >= m_level;
        }

        bool shouldLogEvent(const Kvs &kvs) const {
            return shouldLogEvent(&kvs);
        }

        LogLevel level() const { return m_level; }

        const IFormatter &formatter() const { return *m_formatter; }

        ITransport &transport() const { return *m_transport; }

        static WriteErrorHandler defaultWriteErrorHandler() {
            return [](const WriteResult &result, std::size_t attempted) {
                std::fprintf(stderr, "[VitalLog][WriterSink] WARNING: write failed after %zu of %zu bytes: %s\n",
                             result.written, attempted, result.error.c_str());
            };
        }

    private:
        std::unique_ptr<ITransport> m_transport;
        std::unique_ptr<IFormatter> m_formatter;
        const LogLevel m_level;
        const WriteErrorHandler m_onWriteError;

        static Event makeEvent(EventKind kind, const std::string &job, const Kvs *kvs) {
            Event e;
            e.kind = kind;
            e.timestamp = std::chrono::system_clock::now();
            e.job = job;
            e.kvs = kvs;
            return e;
        }

        /// A throwing formatter is reported like a failed write with nothing
        /// attempted.
        void dispatch(const Event &e) {
            std::string line;
            WriteResult result;
            try {
                line = m_formatter->format(e);
                result = m_transport->write(line);
            } catch (const std::exception &ex) {
                result = WriteResult::failure(0, detail::safeWhat(ex));
            }

            if (!result.ok() && m_onWriteError) {
                m_onWriteError(result, line.size());
            }
        }
    };

} // namespace vital

#include "writer_sink_configuration.hpp"

namespace vital {
    inline WriterSinkConfiguration WriterSink::configure() {
        return WriterSinkConfiguration();
    }
} // namespace vital

#endif // VITAL_LOG_WRITER_SINK_HPP
