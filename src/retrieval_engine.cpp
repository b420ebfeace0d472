#include "retrieval_engine.hpp"
#include "errors.hpp"
#include "LogManager.hpp"
#include "SystemMonitor.hpp"
#include <algorithm>
#include <ctime>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace data_assistance {

using json = nlohmann::json;

namespace {

bool expired(const Deadline& deadline) {
    return deadline && std::chrono::steady_clock::now() >= *deadline;
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

std::string iso8601_utc_now() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> chunk_variables(const json& metadata) {
    auto it = metadata.find("variables");
    if (it == metadata.end() || !it->is_array()) return {};
    std::vector<std::string> vars;
    for (const auto& v : *it) {
        if (v.is_string()) vars.push_back(v.get<std::string>());
    }
    return vars;
}

} // namespace

json RankedChunk::to_json() const {
    return {
        {"id", id},
        {"content", content},
        {"chunk_type", chunk_type},
        {"variables", variables},
        {"metadata", metadata},
        {"distance", distance},
        {"score", score}
    };
}

json QueryResult::to_json() const {
    json ranked_json = json::array();
    for (const auto& r : ranked) ranked_json.push_back(r.to_json());
    return {{"chunks", chunks}, {"ranked", ranked_json}, {"intent", intent.to_json()}};
}

std::string collection_name_for(const std::string& session_id) {
    if (session_id.empty()) throw std::invalid_argument("session id must not be empty");
    return "session_" + session_id;
}

std::string augment_query(const std::string& query, const QueryIntent& intent) {
    std::string augmented = query;

    augmented += patterns::augmentation_phrase(intent.type);

    if (!intent.variables.empty()) {
        augmented += " variables: " + join(intent.variables, " ");
    }
    if (!intent.statistical_tests.empty()) {
        augmented += " statistical tests: " + join(intent.statistical_tests, " ");
    }
    return augmented;
}

double score_candidate(const SearchCandidate& candidate, const QueryIntent& intent, const RerankWeights& weights) {
    double score = 1.0 - static_cast<double>(candidate.distance);

    const std::string chunk_type = candidate.metadata.value("chunk_type", "");
    score *= weights.affinity_for(intent.type, chunk_type);

    if (!intent.variables.empty()) {
        // Intent variables are lower case; column names keep their casing.
        const auto vars = chunk_variables(candidate.metadata);
        const bool overlap = std::any_of(vars.begin(), vars.end(), [&](const std::string& v) {
            return std::binary_search(intent.variables.begin(), intent.variables.end(), to_lower(v));
        });
        if (overlap) score *= weights.variable_overlap_bonus;
    }
    return score;
}

std::vector<RankedChunk> rerank(const std::vector<SearchCandidate>& candidates,
                                const QueryIntent& intent,
                                const RerankWeights& weights) {
    std::vector<RankedChunk> ranked;
    ranked.reserve(candidates.size());
    for (const auto& c : candidates) {
        ranked.push_back({
            c.id,
            c.document,
            c.metadata.value("chunk_type", ""),
            chunk_variables(c.metadata),
            c.metadata.value("metadata", json::object()),
            static_cast<double>(c.distance),
            score_candidate(c, intent, weights)
        });
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });
    return ranked;
}

RetrievalEngine::RetrievalEngine(std::shared_ptr<VectorIndexStore> store,
                                 std::shared_ptr<EmbeddingProvider> embedder,
                                 RetrievalConfig config)
    : store_(std::move(store)), embedder_(std::move(embedder)), config_(std::move(config)) {
    if (!store_ || !embedder_) throw std::invalid_argument("RetrievalEngine needs a store and an embedding provider");
}

std::vector<VectorRecord> RetrievalEngine::embed_chunks(const std::vector<DataChunk>& chunks, const Deadline& deadline) {
    std::vector<VectorRecord> records;
    records.reserve(chunks.size());

    auto start = std::chrono::steady_clock::now();
    for (const auto& chunk : chunks) {
        if (expired(deadline)) throw TimeoutError("embedding chunks");

        std::vector<float> vector;
        try {
            vector = embedder_->embed(chunk.content);
        } catch (const std::exception& e) {
            spdlog::warn("Skipping {} chunk {}: {}", chunk.chunk_type, chunk.id, e.what());
            continue;
        }

        records.push_back({
            chunk.id,
            std::move(vector),
            chunk.content,
            json{
                {"chunk_type", chunk.chunk_type},
                {"variables", chunk.variables},
                {"data_types", chunk.data_types},
                {"statistical_context", chunk.statistical_context},
                {"metadata", chunk.metadata}
            }
        });
    }

    if (!chunks.empty()) {
        SystemMonitor::global_embedding_latency_ms.store(elapsed_ms(start) / static_cast<double>(chunks.size()));
    }
    return records;
}

std::string RetrievalEngine::ingest(const std::string& session_id,
                                    const Dataset& dataset,
                                    const std::string& filename,
                                    Deadline deadline,
                                    std::optional<std::size_t> row_chunk_size) {
    auto start = std::chrono::steady_clock::now();
    const std::string name = collection_name_for(session_id);

    store_->delete_collection(name);

    auto chunks = chunker_.chunk(dataset, row_chunk_size.value_or(config_.row_chunk_size));
    if (chunks.empty()) throw IngestionError("no chunks produced for session " + session_id);

    auto records = embed_chunks(chunks, deadline);
    if (records.empty()) throw IngestionError("every chunk failed to embed for session " + session_id);
    if (expired(deadline)) throw TimeoutError("ingesting session " + session_id);

    json metadata = {
        {"session_id", session_id},
        {"filename", filename},
        {"created_at", iso8601_utc_now()},
        {"row_count", dataset.row_count()},
        {"column_count", dataset.column_count()}
    };
    auto handle = store_->create_collection(name, metadata);

    try {
        if (expired(deadline)) throw TimeoutError("ingesting session " + session_id);
        if (!store_->insert(handle, records)) throw IngestionError("store rejected chunks for session " + session_id);
    } catch (const DataAssistanceException&) {
        store_->delete_collection(name);
        throw;
    }

    double duration = elapsed_ms(start);
    SystemMonitor::global_ingest_latency_ms.store(duration);
    SystemMonitor::global_ingest_count.fetch_add(1);
    SystemMonitor::global_chunks_indexed.fetch_add(static_cast<long long>(records.size()));

    spdlog::info("Indexed session {} ({}): {} of {} chunks in {:.2f} ms",
                 session_id, filename, records.size(), chunks.size(), duration);
    return name;
}

QueryResult RetrievalEngine::query(const std::string& session_id,
                                   const std::string& text,
                                   int top_k,
                                   Deadline deadline) {
    auto start = std::chrono::steady_clock::now();
    if (top_k <= 0) throw std::invalid_argument("top_k must be positive");

    auto handle = store_->get_collection(collection_name_for(session_id));

    QueryResult result;
    result.intent = classifier_.classify(text);

    std::vector<float> query_vector;
    try {
        query_vector = embedder_->embed(augment_query(text, result.intent));
    } catch (const EmbeddingError&) {
        throw;
    } catch (const std::exception& e) {
        throw EmbeddingError(e.what());
    }
    if (expired(deadline)) throw TimeoutError("querying session " + session_id);

    auto candidates = store_->query(handle, query_vector, top_k);
    result.ranked = rerank(candidates, result.intent, config_.rerank);
    for (const auto& r : result.ranked) result.chunks.push_back(r.content);

    double duration = elapsed_ms(start);
    SystemMonitor::global_query_latency_ms.store(duration);
    SystemMonitor::global_query_count.fetch_add(1);

    LogManager::instance().add_log({
        static_cast<long long>(std::time(nullptr)),
        session_id,
        text,
        to_string(result.intent.type),
        result.intent.confidence,
        result.chunks.size(),
        duration
    });

    spdlog::info("Query on session {}: {} ({:.2f}) with {} results in {:.2f} ms",
                 session_id, to_string(result.intent.type), result.intent.confidence,
                 result.chunks.size(), duration);
    return result;
}

bool RetrievalEngine::delete_session(const std::string& session_id) {
    const std::string name = collection_name_for(session_id);
    try {
        if (store_->delete_collection(name)) {
            spdlog::info("Deleted collection for session {}", session_id);
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Error deleting collection for session {}: {}", session_id, e.what());
        return false;
    }
}

std::optional<CollectionInfo> RetrievalEngine::info(const std::string& session_id) {
    const std::string name = collection_name_for(session_id);
    try {
        auto handle = store_->get_collection(name);
        return CollectionInfo{name, store_->count(handle), handle->metadata()};
    } catch (const NotFoundError&) {
        return std::nullopt;
    }
}

std::vector<CollectionInfo> RetrievalEngine::list_collections() {
    return store_->list_collections();
}

} // namespace data_assistance
