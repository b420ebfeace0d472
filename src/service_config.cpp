#include "service_config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace data_assistance {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* const kKeyEnvVar = "DATA_ASSISTANCE_EMBEDDING_KEY";

RerankWeights parse_rerank(const json& j, RerankWeights weights) {
    weights.variable_overlap_bonus = j.value("variable_overlap_bonus", weights.variable_overlap_bonus);
    if (!j.contains("affinity")) return weights;

    for (const auto& [type_name, table] : j["affinity"].items()) {
        auto type = query_type_from_string(type_name);
        if (!type) throw ConfigError("unknown query type in rerank.affinity: " + type_name);
        weights.affinity[*type] = table.get<std::map<std::string, double>>();
    }
    return weights;
}

} // namespace

double RerankWeights::affinity_for(QueryType type, const std::string& chunk_type) const {
    auto by_type = affinity.find(type);
    if (by_type == affinity.end()) return 1.0;
    auto it = by_type->second.find(chunk_type);
    return it == by_type->second.end() ? 1.0 : it->second;
}

ServiceConfig ServiceConfig::from_json(const json& j) {
    ServiceConfig cfg;
    try {
        if (j.contains("server")) {
            const auto& s = j["server"];
            cfg.server.host = s.value("host", cfg.server.host);
            cfg.server.port = s.value("port", cfg.server.port);
        }

        cfg.log_level = j.value("log_level", cfg.log_level);

        if (j.contains("embedding")) {
            const auto& e = j["embedding"];
            cfg.embedding.provider = e.value("provider", cfg.embedding.provider);
            cfg.embedding.base_url = e.value("base_url", cfg.embedding.base_url);
            cfg.embedding.model = e.value("model", cfg.embedding.model);
            cfg.embedding.dimension = e.value("dimension", cfg.embedding.dimension);
            cfg.embedding.keys = e.value("keys", cfg.embedding.keys);
            cfg.embedding.max_retries = e.value("max_retries", cfg.embedding.max_retries);
            cfg.embedding.cache_size = e.value("cache_size", cfg.embedding.cache_size);
            cfg.embedding.cache_ttl = std::chrono::seconds(
                e.value("cache_ttl_seconds", static_cast<long long>(cfg.embedding.cache_ttl.count())));
            cfg.embedding.serialize_calls = e.value("serialize_calls", cfg.embedding.serialize_calls);
        }

        if (j.contains("index")) {
            const auto& i = j["index"];
            cfg.index.type = i.value("type", cfg.index.type);
            cfg.index.persist_directory = i.value("persist_directory", cfg.index.persist_directory);
            cfg.index.hnsw_m = i.value("hnsw_m", cfg.index.hnsw_m);
            cfg.index.ef_construction = i.value("ef_construction", cfg.index.ef_construction);
            cfg.index.ef_search = i.value("ef_search", cfg.index.ef_search);
        }

        if (j.contains("retrieval")) {
            const auto& r = j["retrieval"];
            const long long row_chunk_size =
                r.value("row_chunk_size", static_cast<long long>(cfg.retrieval.row_chunk_size));
            if (row_chunk_size <= 0) throw ConfigError("retrieval.row_chunk_size must be positive");
            cfg.retrieval.row_chunk_size = static_cast<std::size_t>(row_chunk_size);
            cfg.retrieval.default_top_k = r.value("default_top_k", cfg.retrieval.default_top_k);
            if (r.contains("rerank")) cfg.retrieval.rerank = parse_rerank(r["rerank"], cfg.retrieval.rerank);
        }
    } catch (const json::exception& e) {
        throw ConfigError(e.what());
    }

    if (const char* env_key = std::getenv(kKeyEnvVar)) {
        if (*env_key) cfg.embedding.keys.emplace_back(env_key);
    }

    cfg.validate();
    return cfg;
}

ServiceConfig ServiceConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("cannot open " + path);
    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
    auto cfg = from_json(j);
    spdlog::info("Configuration loaded from {}", path);
    return cfg;
}

ServiceConfig ServiceConfig::discover() {
    const std::vector<std::string> search_paths = {
        "config.json",
        "../config.json",
        "build/config.json",
        "../../config.json"
    };

    for (const auto& path : search_paths) {
        if (fs::exists(path)) return load(path);
    }

    spdlog::warn("No config.json found; using built-in defaults");
    return from_json(json::object());
}

void ServiceConfig::validate() const {
    if (server.port <= 0 || server.port > 65535) throw ConfigError("server.port out of range");
    if (embedding.provider != "hashing" && embedding.provider != "remote") {
        throw ConfigError("embedding.provider must be 'hashing' or 'remote'");
    }
    if (embedding.dimension <= 0) throw ConfigError("embedding.dimension must be positive");
    if (embedding.max_retries <= 0) throw ConfigError("embedding.max_retries must be positive");
    if (index.type != "flat" && index.type != "hnsw") throw ConfigError("index.type must be 'flat' or 'hnsw'");
    if (index.hnsw_m <= 0 || index.ef_construction <= 0 || index.ef_search <= 0) {
        throw ConfigError("index HNSW parameters must be positive");
    }
    if (retrieval.row_chunk_size == 0) throw ConfigError("retrieval.row_chunk_size must be positive");
    if (retrieval.default_top_k <= 0) throw ConfigError("retrieval.default_top_k must be positive");
    if (retrieval.rerank.variable_overlap_bonus <= 0.0) {
        throw ConfigError("retrieval.rerank.variable_overlap_bonus must be positive");
    }
    for (const auto& [type, table] : retrieval.rerank.affinity) {
        for (const auto& [chunk_type, weight] : table) {
            if (weight <= 0.0) throw ConfigError("rerank multiplier for " + chunk_type + " must be positive");
        }
    }
}

} // namespace data_assistance
