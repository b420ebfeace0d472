#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "service_config.hpp"
#include "vector_index_store.hpp"

// Forward declare FAISS Index
namespace faiss { struct Index; }

namespace data_assistance {

class FaissCollection : public VectorCollection {
public:
    FaissCollection(std::string name, nlohmann::json metadata, int dimension, const IndexConfig& config);
    ~FaissCollection() override; // defined in .cpp where faiss::Index is complete

    const std::string& name() const override { return name_; }
    const nlohmann::json& metadata() const override { return metadata_; }
    int dimension() const { return dimension_; }

    // @throws std::invalid_argument on a dimension mismatch.
    void add(const std::vector<VectorRecord>& records);

    std::vector<SearchCandidate> search(const std::vector<float>& query_vector, int k,
                                        const std::optional<nlohmann::json>& where) const;

    std::size_t count() const;

    void save(const std::filesystem::path& dir) const;
    static std::shared_ptr<FaissCollection> load(const std::filesystem::path& dir, const IndexConfig& config);

private:
    struct StoredRecord {
        std::string id;
        std::string document;
        nlohmann::json metadata;
    };

    std::string name_;
    nlohmann::json metadata_;
    int dimension_;
    std::unique_ptr<faiss::Index> index_;
    std::vector<StoredRecord> records_;   // position == FAISS label
    mutable std::shared_mutex mutex_;
};

/**
 * In-process VectorIndexStore backed by one FAISS index per collection.
 * With a persist directory every insert is written to
 * `<dir>/<name>/{faiss.index,collection.json}` and lookups fall back to disk.
 */
class FaissVectorStore : public VectorIndexStore {
public:
    explicit FaissVectorStore(int dimension, IndexConfig config = {});

    CollectionHandle create_collection(const std::string& name, const nlohmann::json& metadata) override;
    bool delete_collection(const std::string& name) override;
    bool insert(const CollectionHandle& handle, const std::vector<VectorRecord>& records) override;
    std::vector<SearchCandidate> query(const CollectionHandle& handle,
                                       const std::vector<float>& query_vector,
                                       int top_k,
                                       const std::optional<nlohmann::json>& where = std::nullopt) override;
    CollectionHandle get_collection(const std::string& name) override;
    std::size_t count(const CollectionHandle& handle) override;
    std::vector<CollectionInfo> list_collections() override;

private:
    int dimension_;
    IndexConfig config_;
    std::unordered_map<std::string, std::shared_ptr<FaissCollection>> collections_;
    mutable std::shared_mutex mutex_;

    bool persistent() const { return !config_.persist_directory.empty(); }
    std::filesystem::path collection_dir(const std::string& name) const;
    std::shared_ptr<FaissCollection> as_faiss(const CollectionHandle& handle) const;
    std::shared_ptr<FaissCollection> load_from_disk(const std::string& name) const;
};

} // namespace data_assistance
