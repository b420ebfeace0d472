#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "data_chunker.hpp"
#include "dataset.hpp"
#include "embedding_service.hpp"
#include "query_classifier.hpp"
#include "service_config.hpp"
#include "vector_index_store.hpp"

namespace data_assistance {

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

struct RankedChunk {
    std::string id;
    std::string content;
    std::string chunk_type;
    std::vector<std::string> variables;
    nlohmann::json metadata;
    double distance;
    double score;

    nlohmann::json to_json() const;
};

struct QueryResult {
    std::vector<std::string> chunks;      // contents, best first
    std::vector<RankedChunk> ranked;      // same order, with scores
    QueryIntent intent;

    nlohmann::json to_json() const;
};

// "session_<id>". @throws std::invalid_argument for an empty id.
std::string collection_name_for(const std::string& session_id);

// Query text plus the type phrase, "variables: ..." and "statistical tests: ...".
std::string augment_query(const std::string& query, const QueryIntent& intent);

// (1 - distance) x chunk-type affinity x variable overlap bonus.
double score_candidate(const SearchCandidate& candidate, const QueryIntent& intent, const RerankWeights& weights);

// Stable: equal scores keep the store's order.
std::vector<RankedChunk> rerank(const std::vector<SearchCandidate>& candidates,
                                const QueryIntent& intent,
                                const RerankWeights& weights);

/**
 * Session-scoped ingest and intent-aware retrieval. One collection per
 * session; the store and embedding provider are injected and shared.
 */
class RetrievalEngine {
public:
    RetrievalEngine(std::shared_ptr<VectorIndexStore> store,
                    std::shared_ptr<EmbeddingProvider> embedder,
                    RetrievalConfig config = {});

    /**
     * Replaces the session's collection with chunks of `dataset`.
     * @throws IngestionError when nothing could be chunked, embedded or stored.
     * @throws TimeoutError when the deadline passes; nothing is left behind.
     */
    std::string ingest(const std::string& session_id,
                       const Dataset& dataset,
                       const std::string& filename = "dataset.csv",
                       Deadline deadline = std::nullopt,
                       std::optional<std::size_t> row_chunk_size = std::nullopt);

    /**
     * @throws NotFoundError when the session has no collection.
     * @throws EmbeddingError when the query cannot be embedded.
     * @throws TimeoutError
     */
    QueryResult query(const std::string& session_id,
                      const std::string& text,
                      int top_k = 5,
                      Deadline deadline = std::nullopt);

    // True when the session has no collection afterwards.
    bool delete_session(const std::string& session_id);

    std::optional<CollectionInfo> info(const std::string& session_id);

    std::vector<CollectionInfo> list_collections();

    QueryIntent classify(const std::string& text) const { return classifier_.classify(text); }

    const RetrievalConfig& config() const { return config_; }

private:
    std::shared_ptr<VectorIndexStore> store_;
    std::shared_ptr<EmbeddingProvider> embedder_;
    RetrievalConfig config_;
    QueryClassifier classifier_;
    DataChunker chunker_;

    std::vector<VectorRecord> embed_chunks(const std::vector<DataChunk>& chunks, const Deadline& deadline);
};

} // namespace data_assistance
