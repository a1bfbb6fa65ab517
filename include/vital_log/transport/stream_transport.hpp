#ifndef VITAL_LOG_STREAM_TRANSPORT_HPP
#define VITAL_LOG_STREAM_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <exception>
#include <ios>
#include <mutex>
#include <ostream>

namespace vital {
    /// Writes to a caller-owned std::ostream. The stream must outlive
    /// the transport.
    ///
    /// @note Writes are serialized per instance. Two StreamTransports
    ///       wrapping the same stream do not share a lock.
    class StreamTransport : public ITransport {
    public:
        explicit StreamTransport(std::ostream &stream) : m_stream(stream) {}

        WriteResult write(const std::string &bytes) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            return writeLocked(m_stream, bytes);
        }

        /// Shared by the console transports, which hold their own locks.
        ///
        /// A failed write clears the stream state before returning, so the
        /// next write is attempted afresh once the fault has gone away.
        static WriteResult writeLocked(std::ostream &stream, const std::string &bytes) {
            try {
                stream.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
                stream.flush();
            } catch (const std::exception &e) {
                // ios_base::failure when the caller enabled stream exceptions
                WriteResult result = WriteResult::failure(0, e.what());
                stream.clear();
                return result;
            }
            if (!stream) {
                stream.clear();
                return WriteResult::failure(0, "stream is in a failed state");
            }
            return WriteResult::success(bytes.size());
        }

    private:
        std::ostream &m_stream;
        std::mutex m_mutex;
    };
} // namespace vital

#endif // VITAL_LOG_STREAM_TRANSPORT_HPP
