#ifndef VITAL_LOG_WRITER_SINK_CONFIGURATION_HPP
#define VITAL_LOG_WRITER_SINK_CONFIGURATION_HPP

// This header is included by writer_sink.hpp AFTER the WriterSink class
// definition.  It must not be included directly; include vital_log.hpp instead.

#include "../core/log_common.hpp"
#include "../core/log_level.hpp"
#include "../formatter/formatter_interface.hpp"
#include "../transport/transport_interface.hpp"

#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace vital {

    /// Fluent builder for a WriterSink.
    ///
    /// Usage:
    /// @code
    ///   auto sink = WriterSink::configure()
    ///       .minLevel(LogLevel::DEBUG)
    ///       .writeTo<FileTransport>("jobs.log")
    ///       .onWriteError(nullptr)
    ///       .build();
    /// @endcode
    class WriterSinkConfiguration {
    public:
        WriterSinkConfiguration()
            : m_minLevel(LogLevel::INFO)
            , m_onWriteError(WriterSink::defaultWriteErrorHandler())
            , m_built(false) {}

        WriterSinkConfiguration(const WriterSinkConfiguration&) = delete;
        WriterSinkConfiguration& operator=(const WriterSinkConfiguration&) = delete;
        WriterSinkConfiguration(WriterSinkConfiguration&&) = default;
        WriterSinkConfiguration& operator=(WriterSinkConfiguration&&) = default;

        WriterSinkConfiguration& minLevel(LogLevel level) {
            m_minLevel = level;
            return *this;
        }

        /// Construct the transport in place.  SFINAE: only viable when
        /// TransportType is constructible from Args.
        template<typename TransportType, typename... Args>
        typename std::enable_if<
            std::is_base_of<ITransport, TransportType>::value &&
            std::is_constructible<TransportType, Args...>::value,
            WriterSinkConfiguration&
        >::type
        writeTo(Args&&... args) {
            m_transport = detail::make_unique<TransportType>(std::forward<Args>(args)...);
            return *this;
        }

        WriterSinkConfiguration& writeTo(std::unique_ptr<ITransport> transport) {
            if (!transport) {
                throw std::invalid_argument("writeTo() requires a non-null transport");
            }
            m_transport = std::move(transport);
            return *this;
        }

        template<typename FormatterType, typename... Args>
        typename std::enable_if<
            std::is_base_of<IFormatter, FormatterType>::value,
            WriterSinkConfiguration&
        >::type
        formatter(Args&&... args) {
            m_formatter = detail::make_unique<FormatterType>(std::forward<Args>(args)...);
            return *this;
        }

        /// Pass nullptr to drop failed writes without any diagnostic.
        WriterSinkConfiguration& onWriteError(WriterSink::WriteErrorHandler handler) {
            m_onWriteError = std::move(handler);
            return *this;
        }

        /// @throws std::logic_error if no transport was given or if called
        ///         more than once.
        std::unique_ptr<WriterSink> build() {
            if (m_built) {
                throw std::logic_error("WriterSinkConfiguration::build() called more than once");
            }
            if (!m_transport) {
                throw std::logic_error("WriterSinkConfiguration::build() requires writeTo()");
            }
            m_built = true;
            return detail::make_unique<WriterSink>(std::move(m_transport), m_minLevel,
                                                   std::move(m_formatter),
                                                   std::move(m_onWriteError));
        }

    private:
        LogLevel m_minLevel;
        std::unique_ptr<ITransport> m_transport;
        std::unique_ptr<IFormatter> m_formatter;
        WriterSink::WriteErrorHandler m_onWriteError;
        bool m_built;
    };

} // namespace vital

#endif // VITAL_LOG_WRITER_SINK_CONFIGURATION_HPP
