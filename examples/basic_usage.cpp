// basic_usage.cpp
//
// Emits one of each event kind to stdout.
//
// Compile: g++ -std=c++11 -I include examples/basic_usage.cpp -o basic_usage -pthread

#include "vital_log.hpp"
#include <iostream>
#include <stdexcept>

int main() {
    vital::WriterSink sink(std::cout, vital::LogLevel::INFO);

    sink.emitEvent("import", "started");

    vital::Kvs kvs;
    kvs["source"] = "s3://bucket/feed.csv";
    kvs["rows"] = "1204";
    sink.emitTiming("import", "fetch", 34567890, kvs);

    try {
        throw std::runtime_error("row 17: missing column 'id'");
    } catch (const std::exception& e) {
        sink.emitEventErr("import", "parse", e, kvs);
    }

    // Tagged below the threshold: dropped.
    sink.emitEvent("import", "row_detail", vital::Kvs{{"level", "debug"}});

    sink.emitComplete("import", vital::CompletionStatus::ValidationError, 41200000);
    return 0;
}
