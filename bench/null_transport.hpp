#pragma once
#include "vital_log/transport/transport_interface.hpp"

namespace vital {

class NullTransport : public ITransport {
public:
    WriteResult write(const std::string& bytes) override {
        return WriteResult::success(bytes.size());
    }
};

} // namespace vital
