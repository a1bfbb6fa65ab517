// filtering.cpp
//
// Shows how a sink's threshold interacts with the "level" metadata key.
// Untagged events and events with unknown level text are always written.
//
// Compile: g++ -std=c++11 -I include examples/filtering.cpp -o filtering -pthread

#include "vital_log.hpp"
#include <iostream>

int main() {
    vital::WriterSink sink(std::cout, vital::LogLevel::ERROR);

    const char* tags[] = {"trace", "debug", "info", "error", "ERROR", "eror", ""};
    for (const char* tag : tags) {
        vital::Kvs kvs;
        kvs["level"] = tag;
        std::cout << "level=\"" << tag << "\" -> "
                  << (sink.shouldLogEvent(kvs) ? "written" : "dropped") << '\n';
        sink.emitEvent("filter-demo", "tagged", kvs);
    }

    sink.emitEvent("filter-demo", "untagged");

    vital::LogLevel parsed = vital::LogLevel::TRACE;
    if (vital::parseLevel("Debug", parsed)) {
        std::cout << "parsed " << parsed << '\n';
    }
    return 0;
}
