// custom_transport.cpp
//
// Demonstrates a custom transport, a custom write-error handler and the
// fluent builder.
//
// A transport receives one complete line per call and reports how much
// of it was written. Failures never reach the code that emitted the event.
//
// Compile: g++ -std=c++11 -I include examples/custom_transport.cpp -o custom_transport -pthread

#include "vital_log.hpp"
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

// ---------------------------------------------------------------
// In-memory transport with a fixed byte budget. Once the budget is
// spent every write fails.
// ---------------------------------------------------------------
class BudgetTransport : public vital::ITransport {
public:
    explicit BudgetTransport(size_t budget) : m_budget(budget) {}

    vital::WriteResult write(const std::string& bytes) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (bytes.size() > m_budget) {
            return vital::WriteResult::failure(0, "budget exhausted");
        }
        m_budget -= bytes.size();
        m_lines.push_back(bytes);
        return vital::WriteResult::success(bytes.size());
    }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lines;
    }

private:
    mutable std::mutex m_mutex;
    size_t m_budget;
    std::vector<std::string> m_lines;
};

int main() {
    auto transport = vital::detail::make_unique<BudgetTransport>(200);
    BudgetTransport* raw = transport.get();

    size_t dropped = 0;
    auto sink = vital::WriterSink::configure()
        .minLevel(vital::LogLevel::DEBUG)
        .writeTo(std::move(transport))
        .onWriteError([&dropped](const vital::WriteResult& r, size_t attempted) {
            ++dropped;
            std::cerr << "dropped " << attempted << " bytes: " << r.error << '\n';
        })
        .build();

    for (int i = 0; i < 5; ++i) {
        sink->emitTiming("batch", "step", 1500 + i * 1000000,
                         vital::Kvs{{"step", std::to_string(i)}});
    }

    for (const auto& line : raw->lines()) {
        std::cout << line;
    }
    std::cout << dropped << " lines dropped\n";
    return 0;
}
