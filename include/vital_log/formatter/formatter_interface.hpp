#ifndef VITAL_LOG_FORMATTER_INTERFACE_HPP
#define VITAL_LOG_FORMATTER_INTERFACE_HPP

#include "../core/event.hpp"
#include <string>

namespace vital {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        /// Renders one complete line, trailing newline included.
        virtual std::string format(const Event &event) const = 0;
    };
} // namespace vital

#endif // VITAL_LOG_FORMATTER_INTERFACE_HPP
