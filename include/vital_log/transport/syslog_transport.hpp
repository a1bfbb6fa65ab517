#ifndef VITAL_LOG_SYSLOG_TRANSPORT_HPP
#define VITAL_LOG_SYSLOG_TRANSPORT_HPP

#ifndef _WIN32

#include "transport_interface.hpp"
#include <syslog.h>
#include <string>
#include <mutex>
#include <atomic>
#include <cstring>
#include <cstdio>

namespace vital {

    /// Configuration options for SyslogTransport.
    struct SyslogOptions {
        int facility_;  ///< syslog facility (LOG_USER, LOG_LOCAL0, etc.)
        int logopt_;    ///< openlog() options (LOG_PID, LOG_NDELAY, etc.)
        int priority_;  ///< priority every line is sent at

        SyslogOptions()
            : facility_(LOG_USER)
            , logopt_(LOG_PID | LOG_NDELAY)
            , priority_(LOG_INFO) {}

        SyslogOptions& setFacility(int f) { facility_ = f; return *this; }
        SyslogOptions& setLogopt(int o) { logopt_ = o; return *this; }
        SyslogOptions& setPriority(int p) { priority_ = p; return *this; }
    };

    /// Transport that forwards each line to the POSIX syslog daemon.
    ///
    /// Lines are sent at a single fixed priority; the sink has already
    /// applied its level threshold. The trailing newline is stripped since
    /// syslog frames messages itself. syslog() reports no errors, so every
    /// write succeeds.
    ///
    /// @note openlog() is a process-global call. Only one SyslogTransport per
    ///       process is recommended. Multiple instances will overwrite each
    ///       other's ident.
    class SyslogTransport : public ITransport {
        static std::atomic<int>& instanceRefCount() {
            static std::atomic<int> count(0);
            return count;
        }

        /// Most syslog implementations keep the pointer passed to openlog()
        /// without copying it, so the ident lives in a process-global buffer.
        static const size_t kMaxIdentLen = 255;
        static char* globalIdent() {
            static char buf[kMaxIdentLen + 1] = {0};
            return buf;
        }
        static std::mutex& identMutex() {
            static std::mutex m;
            return m;
        }

    public:
        explicit SyslogTransport(const std::string& ident,
                                 SyslogOptions opts = SyslogOptions())
            : m_opts(opts)
        {
            std::lock_guard<std::mutex> lock(identMutex());
            if (instanceRefCount().fetch_add(1, std::memory_order_relaxed) > 0) {
                std::fprintf(stderr, "[VitalLog][SyslogTransport] WARNING: multiple SyslogTransport "
                                     "instances detected. openlog() is process-global; "
                                     "the last-created instance's ident will be used "
                                     "for all syslog output.\n");
            }
            if (ident.size() > kMaxIdentLen) {
                std::fprintf(stderr, "[VitalLog][SyslogTransport] WARNING: ident \"%s\" "
                                     "truncated to %zu characters\n",
                             ident.c_str(), kMaxIdentLen);
            }
            // the buffer holds kMaxIdentLen characters plus the terminator
            std::strncpy(globalIdent(), ident.c_str(), kMaxIdentLen);
            globalIdent()[kMaxIdentLen] = '\0';
            openlog(globalIdent(), m_opts.logopt_, m_opts.facility_);
        }

        ~SyslogTransport() noexcept {
            std::lock_guard<std::mutex> lock(identMutex());
            if (instanceRefCount().fetch_sub(1, std::memory_order_relaxed) == 1) {
                closelog();
            }
        }

        SyslogTransport(const SyslogTransport&) = delete;
        SyslogTransport& operator=(const SyslogTransport&) = delete;

        WriteResult write(const std::string& bytes) override {
            std::string message = stripNewline(bytes);

            std::lock_guard<std::mutex> lock(identMutex());
            syslog(m_opts.priority_, "%s", message.c_str());
            return WriteResult::success(bytes.size());
        }

        /// The ident openlog() was last given, after truncation.
        static std::string currentIdent() {
            std::lock_guard<std::mutex> lock(identMutex());
            return std::string(globalIdent());
        }

        static constexpr size_t maxIdentLength() { return kMaxIdentLen; }

        /// Public and static for testability.
        static std::string stripNewline(const std::string& line) {
            size_t end = line.size();
            while (end > 0 && (line[end - 1] == '\n' || line[end - 1] == '\r')) --end;
            return line.substr(0, end);
        }

        const SyslogOptions& options() const { return m_opts; }

    private:
        SyslogOptions m_opts;
    };

} // namespace vital

#endif // !_WIN32

#endif // VITAL_LOG_SYSLOG_TRANSPORT_HPP
