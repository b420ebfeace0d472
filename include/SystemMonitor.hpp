#pragma once
#include <atomic>
#include <cstddef>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace data_assistance {

struct TelemetryData {
    // Process
    std::size_t ram_usage_mb = 0;

    // Latency of the most recent call
    double ingest_latency_ms = 0.0;
    double query_latency_ms = 0.0;
    double embedding_latency_ms = 0.0;

    // Totals since start
    long long ingest_count = 0;
    long long query_count = 0;
    long long chunks_indexed = 0;

    nlohmann::json to_json() const {
        return {
            {"ram_usage_mb", ram_usage_mb},
            {"ingest_latency_ms", ingest_latency_ms},
            {"query_latency_ms", query_latency_ms},
            {"embedding_latency_ms", embedding_latency_ms},
            {"ingest_count", ingest_count},
            {"query_count", query_count},
            {"chunks_indexed", chunks_indexed}
        };
    }
};

class SystemMonitor {
public:
    // Global Atomic Metrics
    inline static std::atomic<double> global_ingest_latency_ms{0.0};
    inline static std::atomic<double> global_query_latency_ms{0.0};
    inline static std::atomic<double> global_embedding_latency_ms{0.0};
    inline static std::atomic<long long> global_ingest_count{0};
    inline static std::atomic<long long> global_query_count{0};
    inline static std::atomic<long long> global_chunks_indexed{0};

    static TelemetryData get_latest_snapshot() {
        TelemetryData snapshot;
        snapshot.ram_usage_mb = resident_memory_mb();
        snapshot.ingest_latency_ms = global_ingest_latency_ms.load();
        snapshot.query_latency_ms = global_query_latency_ms.load();
        snapshot.embedding_latency_ms = global_embedding_latency_ms.load();
        snapshot.ingest_count = global_ingest_count.load();
        snapshot.query_count = global_query_count.load();
        snapshot.chunks_indexed = global_chunks_indexed.load();
        return snapshot;
    }

private:
    // Second field of /proc/self/statm is the resident set in pages.
    static std::size_t resident_memory_mb() {
        std::ifstream statm("/proc/self/statm");
        std::size_t size_pages = 0, resident_pages = 0;
        if (!(statm >> size_pages >> resident_pages)) return 0;
        const long page_size = sysconf(_SC_PAGESIZE);
        if (page_size <= 0) return 0;
        return resident_pages * static_cast<std::size_t>(page_size) / 1024 / 1024;
    }
};

} // namespace data_assistance
