#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pattern_library.hpp"

namespace data_assistance {

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 5003;
};

struct EmbeddingConfig {
    std::string provider = "hashing";   // hashing | remote
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta/models/";
    std::string model = "text-embedding-004";
    int dimension = 768;
    std::vector<std::string> keys;
    int max_retries = 4;
    std::size_t cache_size = 1000;
    std::chrono::seconds cache_ttl{3600};
    bool serialize_calls = false;
};

struct IndexConfig {
    std::string type = "flat";          // flat | hnsw
    std::string persist_directory;       // empty: in-memory only
    int hnsw_m = 32;
    int ef_construction = 40;
    int ef_search = 16;
};

// Re-ranking multipliers, overridable under retrieval.rerank in config.json.
struct RerankWeights {
    std::map<QueryType, std::map<std::string, double>> affinity = {
        {QueryType::Descriptive, {{"statistical_summary", 1.5}, {"column_group", 1.2}}},
        {QueryType::Correlation, {{"correlation_matrix", 1.8}, {"statistical_summary", 1.3}}},
        {QueryType::Visualization, {{"column_group", 1.4}, {"correlation_matrix", 1.3}}},
    };
    double variable_overlap_bonus = 1.3;

    // 1.0 when the pair has no configured multiplier.
    double affinity_for(QueryType type, const std::string& chunk_type) const;
};

struct RetrievalConfig {
    std::size_t row_chunk_size = 100;
    int default_top_k = 5;
    RerankWeights rerank;
};

struct ServiceConfig {
    ServerConfig server;
    std::string log_level = "info";
    EmbeddingConfig embedding;
    IndexConfig index;
    RetrievalConfig retrieval;

    // @throws ConfigError on unreadable files, malformed JSON or invalid values.
    static ServiceConfig load(const std::string& path);
    static ServiceConfig from_json(const nlohmann::json& j);

    // Searches the usual locations for config.json; defaults when none exists.
    static ServiceConfig discover();

    void validate() const;
};

} // namespace data_assistance
