#ifndef VITAL_LOG_LINE_DETAIL_HPP
#define VITAL_LOG_LINE_DETAIL_HPP

#include "../core/log_common.hpp"
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace vital {
namespace detail {
namespace line {

    /// Duration in exactly one unit chosen by magnitude:
    ///   n > 2,000,000  -> "<n / 1e6> ms"
    ///   n > 2,000      -> "<n / 1e3> μs"
    ///   otherwise      -> "<n> ns"
    /// Integer division, no rounding.
    inline std::string formatDuration(std::int64_t nanos) {
        if (nanos > 2000000) {
            return std::to_string(nanos / 1000000) + " ms";
        }
        if (nanos > 2000) {
            return std::to_string(nanos / 1000) + " \xCE\xBCs"; // U+03BC
        }
        return std::to_string(nanos) + " ns";
    }

    /// Appends " kvs:[k1:v1 k2:v2]" with keys in ascending order.
    /// A null map appends nothing; an empty map appends " kvs:[]".
    inline void appendKvs(std::string &out, const Kvs *kvs) {
        if (!kvs) return;

        std::vector<const Kvs::value_type *> entries;
        entries.reserve(kvs->size());
        for (const auto &kv : *kvs) {
            entries.push_back(&kv);
        }
        std::sort(entries.begin(), entries.end(),
                  [](const Kvs::value_type *a, const Kvs::value_type *b) {
                      return a->first < b->first;
                  });

        out += " kvs:[";
        for (size_t i = 0; i < entries.size(); ++i) {
            if (i != 0) out += ' ';
            out += entries[i]->first;
            out += ':';
            out += entries[i]->second;
        }
        out += ']';
    }

} // namespace line
} // namespace detail
} // namespace vital

#endif // VITAL_LOG_LINE_DETAIL_HPP
