#ifndef VITAL_LOG_FILE_TRANSPORT_HPP
#define VITAL_LOG_FILE_TRANSPORT_HPP

#include "stream_transport.hpp"
#include <cstdio>
#include <fstream>
#include <mutex>

namespace vital {
    /// Appends to a file opened at construction. If the open fails the
    /// failure is reported once on stderr and every write fails.
    class FileTransport : public ITransport {
    public:
        explicit FileTransport(const std::string &filename) : m_filename(filename) {
            m_file.open(filename, std::ios::out | std::ios::app | std::ios::binary);
            if (!m_file.is_open()) {
                std::fprintf(stderr, "[VitalLog][FileTransport] WARNING: failed to open file: %s\n",
                             filename.c_str());
            }
        }

        WriteResult write(const std::string &bytes) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_file.is_open()) {
                return WriteResult::failure(0, "file not open: " + m_filename);
            }
            return StreamTransport::writeLocked(m_file, bytes);
        }

        const std::string &filename() const { return m_filename; }

        bool isOpen() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_file.is_open();
        }

    private:
        std::string m_filename;
        std::ofstream m_file;
        mutable std::mutex m_mutex;
    };
} // namespace vital

#endif // VITAL_LOG_FILE_TRANSPORT_HPP
