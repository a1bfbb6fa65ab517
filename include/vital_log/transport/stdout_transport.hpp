#ifndef VITAL_LOG_STDOUT_TRANSPORT_HPP
#define VITAL_LOG_STDOUT_TRANSPORT_HPP

#include "stream_transport.hpp"
#include <iostream>
#include <mutex>

namespace vital {
    /// @note All StdoutTransport instances share a single mutex so that
    ///       concurrent writes to stdout are serialized.  StderrTransport
    ///       has its own independent mutex, so stdout and stderr writes
    ///       may interleave at the terminal level.
    class StdoutTransport : public ITransport {
    public:
        WriteResult write(const std::string &bytes) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            return StreamTransport::writeLocked(std::cout, bytes);
        }

    private:
        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

    /// @note All StderrTransport instances share a single mutex so that
    ///       concurrent writes to stderr are serialized.
    class StderrTransport : public ITransport {
    public:
        WriteResult write(const std::string &bytes) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            return StreamTransport::writeLocked(std::cerr, bytes);
        }

    private:
        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };
} // namespace vital

#endif // VITAL_LOG_STDOUT_TRANSPORT_HPP
