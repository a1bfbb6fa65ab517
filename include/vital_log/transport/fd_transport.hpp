#ifndef VITAL_LOG_FD_TRANSPORT_HPP
#define VITAL_LOG_FD_TRANSPORT_HPP

#ifndef _WIN32

#include "transport_interface.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>

namespace vital {

    /// Writes straight to a POSIX file descriptor with a single ::write()
    /// per line, so lines from several processes appending to the same
    /// O_APPEND file do not tear. The descriptor is not owned.
    ///
    /// A short write is reported as a failure; the remainder is not
    /// retried, since a second write could interleave with another writer.
    class FdTransport : public ITransport {
    public:
        explicit FdTransport(int fd) : m_fd(fd) {}

        WriteResult write(const std::string& bytes) override {
            ssize_t n;
            do {
                n = ::write(m_fd, bytes.data(), bytes.size());
            } while (n < 0 && errno == EINTR);

            if (n < 0) {
                return WriteResult::failure(0, std::strerror(errno));
            }
            if (static_cast<std::size_t>(n) != bytes.size()) {
                return WriteResult::failure(static_cast<std::size_t>(n), "short write");
            }
            return WriteResult::success(bytes.size());
        }

        int fd() const { return m_fd; }

    private:
        int m_fd;
    };

} // namespace vital

#endif // !_WIN32

#endif // VITAL_LOG_FD_TRANSPORT_HPP
