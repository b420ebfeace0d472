#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "cache_manager.hpp"
#include "KeyManager.hpp"
#include "service_config.hpp"

namespace data_assistance {

std::string utf8_safe_substr(const std::string& str, size_t length);

/**
 * Maps text to a fixed-length vector. Implementations must be deterministic
 * for identical input and must not keep per-call state.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    // @throws EmbeddingError when no vector can be produced.
    virtual std::vector<float> embed(const std::string& text) = 0;
    virtual int dimension() const = 0;
    virtual std::string name() const = 0;
};

// Feature-hashing bag of words (unigrams and bigrams), L2 normalised.
// Runs in-process and needs no model files or network.
class HashingEmbedder : public EmbeddingProvider {
public:
    explicit HashingEmbedder(int dimension = 384);

    std::vector<float> embed(const std::string& text) override;
    int dimension() const override { return dimension_; }
    std::string name() const override { return "hashing"; }

    static std::vector<std::string> tokenize(const std::string& text);

private:
    int dimension_;
};

// Remote embedding endpoint in the Gemini embedContent format.
class EmbeddingService : public EmbeddingProvider {
public:
    EmbeddingService(const EmbeddingConfig& config, std::shared_ptr<KeyManager> key_manager);

    std::vector<float> embed(const std::string& text) override;
    int dimension() const override { return config_.dimension; }
    std::string name() const override { return "remote:" + config_.model; }

private:
    EmbeddingConfig config_;
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<CacheManager> cache_manager_;

    std::string get_endpoint_url(const std::string& action) const;
    std::vector<float> checked(std::vector<float> embedding) const;
};

// Funnels every call through one mutex for providers whose backing model
// is not safe for concurrent use.
class SerializedEmbeddingProvider : public EmbeddingProvider {
public:
    explicit SerializedEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner)
        : inner_(std::move(inner)) {}

    std::vector<float> embed(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mtx_);
        return inner_->embed(text);
    }
    int dimension() const override { return inner_->dimension(); }
    std::string name() const override { return inner_->name(); }

private:
    std::shared_ptr<EmbeddingProvider> inner_;
    std::mutex mtx_;
};

std::shared_ptr<EmbeddingProvider> make_embedding_provider(const EmbeddingConfig& config);

} // namespace data_assistance
