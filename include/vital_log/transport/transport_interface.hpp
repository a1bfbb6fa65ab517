#ifndef VITAL_LOG_TRANSPORT_INTERFACE_HPP
#define VITAL_LOG_TRANSPORT_INTERFACE_HPP

#include <cstddef>
#include <string>
#include <utility>

namespace vital {

    /// Outcome of one transport write. A short write is a failure.
    struct WriteResult {
        std::size_t written;
        std::string error;

        WriteResult() : written(0) {}
        WriteResult(std::size_t n, std::string err)
            : written(n), error(std::move(err)) {}

        bool ok() const { return error.empty(); }

        static WriteResult success(std::size_t n) { return WriteResult(n, std::string()); }
        static WriteResult failure(std::size_t n, std::string err) {
            return WriteResult(n, err.empty() ? std::string("unknown error") : std::move(err));
        }
    };

    /// The "write bytes, possibly fail" capability a sink writes through.
    /// One call carries one complete line.
    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual WriteResult write(const std::string& bytes) = 0;
    };

} // namespace vital

#endif // VITAL_LOG_TRANSPORT_INTERFACE_HPP
