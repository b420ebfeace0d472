#include "faiss_vector_store.hpp"
#include "errors.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace data_assistance {

namespace {

const char* const kIndexFile = "faiss.index";
const char* const kCollectionFile = "collection.json";

std::unique_ptr<faiss::Index> make_index(int dimension, const IndexConfig& config) {
    if (config.type == "hnsw") {
        auto idx = std::make_unique<faiss::IndexHNSWFlat>(dimension, config.hnsw_m, faiss::METRIC_INNER_PRODUCT);
        idx->hnsw.efConstruction = config.ef_construction;
        idx->hnsw.efSearch = config.ef_search;
        return idx;
    }
    return std::make_unique<faiss::IndexFlatIP>(dimension);
}

bool matches_filter(const json& metadata, const json& where) {
    for (const auto& [key, expected] : where.items()) {
        auto it = metadata.find(key);
        if (it == metadata.end() || *it != expected) return false;
    }
    return true;
}

} // namespace

// --- FaissCollection ---

FaissCollection::FaissCollection(std::string name, json metadata, int dimension, const IndexConfig& config)
    : name_(std::move(name)),
      metadata_(std::move(metadata)),
      dimension_(dimension),
      index_(make_index(dimension, config)) {}

FaissCollection::~FaissCollection() = default;

void FaissCollection::add(const std::vector<VectorRecord>& records) {
    if (records.empty()) return;

    std::vector<float> vectors_flat;
    vectors_flat.reserve(records.size() * static_cast<size_t>(dimension_));
    for (const auto& rec : records) {
        if (static_cast<int>(rec.vector.size()) != dimension_) {
            throw std::invalid_argument("record " + rec.id + " has " + std::to_string(rec.vector.size()) +
                                        " dims, collection expects " + std::to_string(dimension_));
        }
        vectors_flat.insert(vectors_flat.end(), rec.vector.begin(), rec.vector.end());
    }

    const auto num_to_add = static_cast<faiss::idx_t>(records.size());
    faiss::fvec_renorm_L2(dimension_, num_to_add, vectors_flat.data());

    std::unique_lock lock(mutex_);
    index_->add(num_to_add, vectors_flat.data());
    for (const auto& rec : records) {
        records_.push_back({rec.id, rec.document, rec.metadata});
    }
}

std::vector<SearchCandidate> FaissCollection::search(const std::vector<float>& query_vector, int k,
                                                     const std::optional<json>& where) const {
    if (k <= 0) return {};
    if (static_cast<int>(query_vector.size()) != dimension_) {
        throw std::invalid_argument("query has " + std::to_string(query_vector.size()) +
                                    " dims, collection expects " + std::to_string(dimension_));
    }

    std::vector<float> query_copy = query_vector;
    faiss::fvec_renorm_L2(dimension_, 1, query_copy.data());

    std::shared_lock lock(mutex_);
    const auto total = index_->ntotal;
    if (total == 0) return {};

    // A filtered search ranks the whole collection and truncates afterwards.
    const bool filtered = where && !where->empty();
    const faiss::idx_t n = filtered ? total : std::min<faiss::idx_t>(k, total);

    std::vector<float> scores(static_cast<size_t>(n));
    std::vector<faiss::idx_t> indices(static_cast<size_t>(n));
    index_->search(1, query_copy.data(), n, scores.data(), indices.data());

    std::vector<SearchCandidate> results;
    for (faiss::idx_t i = 0; i < n && static_cast<int>(results.size()) < k; ++i) {
        const auto label = indices[static_cast<size_t>(i)];
        if (label < 0 || label >= static_cast<faiss::idx_t>(records_.size())) continue;

        const auto& rec = records_[static_cast<size_t>(label)];
        if (filtered && !matches_filter(rec.metadata, *where)) continue;

        results.push_back({rec.id, rec.document, rec.metadata, 1.0f - scores[static_cast<size_t>(i)]});
    }
    return results;
}

std::size_t FaissCollection::count() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

void FaissCollection::save(const fs::path& dir) const {
    fs::create_directories(dir);

    std::shared_lock lock(mutex_);
    faiss::write_index(index_.get(), (dir / kIndexFile).string().c_str());

    json records = json::array();
    for (const auto& rec : records_) {
        records.push_back({{"id", rec.id}, {"document", rec.document}, {"metadata", rec.metadata}});
    }
    json doc = {
        {"name", name_},
        {"metadata", metadata_},
        {"dimension", dimension_},
        {"records", records}
    };

    std::ofstream meta_file(dir / kCollectionFile);
    if (!meta_file) throw std::runtime_error("cannot write " + (dir / kCollectionFile).string());
    meta_file << doc.dump(2, ' ', false, json::error_handler_t::replace);
}

std::shared_ptr<FaissCollection> FaissCollection::load(const fs::path& dir, const IndexConfig& config) {
    std::ifstream meta_file(dir / kCollectionFile);
    if (!meta_file) throw std::runtime_error("cannot read " + (dir / kCollectionFile).string());
    json doc = json::parse(meta_file);

    auto collection = std::make_shared<FaissCollection>(
        doc.at("name").get<std::string>(), doc.value("metadata", json::object()),
        doc.at("dimension").get<int>(), config);

    // reset() deletes the empty index and takes ownership of the loaded one
    collection->index_.reset(faiss::read_index((dir / kIndexFile).string().c_str()));

    for (const auto& rec : doc.at("records")) {
        collection->records_.push_back({
            rec.at("id").get<std::string>(),
            rec.value("document", ""),
            rec.value("metadata", json::object())
        });
    }

    if (collection->index_->ntotal != static_cast<faiss::idx_t>(collection->records_.size())) {
        throw std::runtime_error("index and record count disagree in " + dir.string());
    }
    spdlog::info("Loaded collection '{}' with {} vectors from {}",
                 collection->name_, collection->index_->ntotal, dir.string());
    return collection;
}

// --- FaissVectorStore ---

FaissVectorStore::FaissVectorStore(int dimension, IndexConfig config)
    : dimension_(dimension), config_(std::move(config)) {
    if (dimension_ <= 0) throw std::invalid_argument("vector dimension must be positive");
    if (persistent()) fs::create_directories(config_.persist_directory);
}

fs::path FaissVectorStore::collection_dir(const std::string& name) const {
    std::string safe;
    safe.reserve(name.size());
    for (unsigned char c : name) {
        safe += (std::isalnum(c) || c == '_' || c == '-') ? static_cast<char>(c) : '_';
    }
    return fs::path(config_.persist_directory) / safe;
}

std::shared_ptr<FaissCollection> FaissVectorStore::as_faiss(const CollectionHandle& handle) const {
    auto collection = std::dynamic_pointer_cast<FaissCollection>(handle);
    if (!collection) throw std::invalid_argument("handle does not belong to a FAISS store");
    return collection;
}

std::shared_ptr<FaissCollection> FaissVectorStore::load_from_disk(const std::string& name) const {
    if (!persistent()) return nullptr;
    const auto dir = collection_dir(name);
    if (!fs::exists(dir / kCollectionFile)) return nullptr;

    auto collection = FaissCollection::load(dir, config_);
    if (collection->name() != name) return nullptr;
    return collection;
}

CollectionHandle FaissVectorStore::create_collection(const std::string& name, const json& metadata) {
    std::unique_lock lock(mutex_);
    if (collections_.count(name) || (persistent() && fs::exists(collection_dir(name) / kCollectionFile))) {
        throw IngestionError("collection '" + name + "' already exists");
    }

    auto collection = std::make_shared<FaissCollection>(name, metadata, dimension_, config_);
    if (persistent()) {
        try {
            collection->save(collection_dir(name));
        } catch (const std::exception& e) {
            throw IngestionError("cannot persist collection '" + name + "': " + e.what());
        }
    }
    collections_[name] = collection;
    spdlog::debug("Created collection '{}' ({} index)", name, config_.type);
    return collection;
}

bool FaissVectorStore::delete_collection(const std::string& name) {
    std::unique_lock lock(mutex_);
    bool existed = collections_.erase(name) > 0;

    if (persistent()) {
        const auto dir = collection_dir(name);
        if (fs::exists(dir)) {
            fs::remove_all(dir);
            existed = true;
        }
    }
    if (existed) spdlog::debug("Deleted collection '{}'", name);
    return existed;
}

bool FaissVectorStore::insert(const CollectionHandle& handle, const std::vector<VectorRecord>& records) {
    auto collection = as_faiss(handle);
    try {
        collection->add(records);
        if (persistent()) {
            std::shared_lock lock(mutex_);
            // A collection deleted in the meantime must not be resurrected on disk.
            if (collections_.count(collection->name())) collection->save(collection_dir(collection->name()));
        }
    } catch (const std::exception& e) {
        spdlog::error("Insert into '{}' failed: {}", collection->name(), e.what());
        return false;
    }
    spdlog::info("Added {} vectors to '{}'. Total: {}", records.size(), collection->name(), collection->count());
    return true;
}

std::vector<SearchCandidate> FaissVectorStore::query(const CollectionHandle& handle,
                                                     const std::vector<float>& query_vector,
                                                     int top_k,
                                                     const std::optional<json>& where) {
    if (where && !where->is_object()) throw std::invalid_argument("metadata filter must be a JSON object");
    return as_faiss(handle)->search(query_vector, top_k, where);
}

CollectionHandle FaissVectorStore::get_collection(const std::string& name) {
    {
        std::shared_lock lock(mutex_);
        auto it = collections_.find(name);
        if (it != collections_.end()) return it->second;
    }

    std::unique_lock lock(mutex_);
    auto it = collections_.find(name);
    if (it != collections_.end()) return it->second;

    std::shared_ptr<FaissCollection> loaded;
    try {
        loaded = load_from_disk(name);
    } catch (const std::exception& e) {
        spdlog::error("Cannot load collection '{}': {}", name, e.what());
    }
    if (!loaded) throw NotFoundError("collection '" + name + "'");

    collections_[name] = loaded;
    return loaded;
}

std::size_t FaissVectorStore::count(const CollectionHandle& handle) {
    return as_faiss(handle)->count();
}

std::vector<CollectionInfo> FaissVectorStore::list_collections() {
    std::vector<std::string> names;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [name, _] : collections_) names.push_back(name);
    }

    if (persistent()) {
        for (const auto& entry : fs::directory_iterator(config_.persist_directory)) {
            if (!entry.is_directory() || !fs::exists(entry.path() / kCollectionFile)) continue;
            try {
                std::ifstream meta_file(entry.path() / kCollectionFile);
                auto name = json::parse(meta_file).at("name").get<std::string>();
                if (std::find(names.begin(), names.end(), name) == names.end()) names.push_back(name);
            } catch (const json::exception& e) {
                spdlog::warn("Skipping unreadable collection in {}: {}", entry.path().string(), e.what());
            }
        }
    }

    std::vector<CollectionInfo> infos;
    for (const auto& name : names) {
        try {
            auto handle = get_collection(name);
            infos.push_back({name, count(handle), handle->metadata()});
        } catch (const NotFoundError&) {
            // deleted concurrently
        }
    }
    std::sort(infos.begin(), infos.end(), [](const auto& a, const auto& b) { return a.name < b.name; });
    return infos;
}

} // namespace data_assistance
