#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace data_assistance {

struct VectorRecord {
    std::string id;
    std::vector<float> vector;
    std::string document;
    nlohmann::json metadata = nlohmann::json::object();
};

struct SearchCandidate {
    std::string id;
    std::string document;
    nlohmann::json metadata;
    float distance = 1.0f;   // cosine distance, 1 - cos(query, vector)
};

struct CollectionInfo {
    std::string name;
    std::size_t count = 0;
    nlohmann::json metadata;

    nlohmann::json to_json() const {
        return nlohmann::json{{"name", name}, {"count", count}, {"metadata", metadata}};
    }
};

class VectorCollection {
public:
    virtual ~VectorCollection() = default;
    virtual const std::string& name() const = 0;
    virtual const nlohmann::json& metadata() const = 0;
};

using CollectionHandle = std::shared_ptr<VectorCollection>;

/**
 * Named collections of (id, vector, document, metadata) records with
 * nearest-neighbour search. Collections are isolated from one another;
 * implementations must allow concurrent use from multiple sessions.
 */
class VectorIndexStore {
public:
    virtual ~VectorIndexStore() = default;

    // @throws IngestionError when the name is taken or the collection cannot be created.
    virtual CollectionHandle create_collection(const std::string& name, const nlohmann::json& metadata) = 0;

    // False when no collection of that name existed.
    virtual bool delete_collection(const std::string& name) = 0;

    virtual bool insert(const CollectionHandle& handle, const std::vector<VectorRecord>& records) = 0;

    /**
     * Nearest neighbours, closest first. `where` is an object of metadata
     * key -> value pairs that a candidate must all match exactly.
     */
    virtual std::vector<SearchCandidate> query(const CollectionHandle& handle,
                                               const std::vector<float>& query_vector,
                                               int top_k,
                                               const std::optional<nlohmann::json>& where = std::nullopt) = 0;

    // @throws NotFoundError
    virtual CollectionHandle get_collection(const std::string& name) = 0;

    virtual std::size_t count(const CollectionHandle& handle) = 0;

    virtual std::vector<CollectionInfo> list_collections() = 0;
};

} // namespace data_assistance
