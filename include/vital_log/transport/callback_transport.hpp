#ifndef VITAL_LOG_CALLBACK_TRANSPORT_HPP
#define VITAL_LOG_CALLBACK_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <functional>
#include <string>
#include <utility>

namespace vital {

    /// Transport that hands each rendered line to a user-provided callback.
    ///
    /// @note The callback is called **without** a lock. If the callback
    ///       accesses shared state, the user is responsible for thread
    ///       safety inside the callback.
    /// @note An empty callback behaves like a write to a closed stream.
    class CallbackTransport : public ITransport {
    public:
        using Callback = std::function<WriteResult(const std::string&)>;

        explicit CallbackTransport(Callback cb) : m_callback(std::move(cb)) {}

        WriteResult write(const std::string& bytes) override {
            if (!m_callback) {
                return WriteResult::failure(0, "no callback installed");
            }
            return m_callback(bytes);
        }

    private:
        Callback m_callback;
    };

} // namespace vital

#endif // VITAL_LOG_CALLBACK_TRANSPORT_HPP
