#include "embedding_service.hpp"
#include "errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <chrono>
#include <thread>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace data_assistance {

using json = nlohmann::json;

namespace {

// Remote endpoints reject very long inputs; chunk descriptions are trimmed.
constexpr size_t kMaxRemoteInputBytes = 8000;
constexpr float kBigramWeight = 0.5f;

uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, const std::shared_ptr<KeyManager>& km, int max_retries) {
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if ((r.status_code == 429 || r.status_code == 503) && km) {
            spdlog::warn("Embedding API {} ({}). Rotating key and cooling down (attempt {}/{})",
                         r.status_code, (r.status_code == 429 ? "quota" : "overload"), i + 1, max_retries);
            km->report_rate_limit();
            std::this_thread::sleep_for(std::chrono::milliseconds(2000 + (i * 1000)));
            continue;
        }
        break;
    }
    return r;
}

} // namespace

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

// --- HashingEmbedder ---

HashingEmbedder::HashingEmbedder(int dimension) : dimension_(dimension) {
    if (dimension_ <= 0) throw EmbeddingError("hashing embedder dimension must be positive");
}

std::vector<std::string> HashingEmbedder::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '_') {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

std::vector<float> HashingEmbedder::embed(const std::string& text) {
    std::vector<float> vec(static_cast<size_t>(dimension_), 0.0f);
    const auto tokens = tokenize(text);
    const auto dim = static_cast<uint64_t>(dimension_);

    for (size_t i = 0; i < tokens.size(); ++i) {
        vec[fnv1a(tokens[i]) % dim] += 1.0f;
        if (i + 1 < tokens.size()) {
            vec[fnv1a(tokens[i] + " " + tokens[i + 1]) % dim] += kBigramWeight;
        }
    }

    double norm = 0.0;
    for (float v : vec) norm += static_cast<double>(v) * v;
    if (norm > 0.0) {
        const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& v : vec) v *= inv;
    }
    return vec;
}

// --- EmbeddingService ---

EmbeddingService::EmbeddingService(const EmbeddingConfig& config, std::shared_ptr<KeyManager> key_manager)
    : config_(config),
      key_manager_(std::move(key_manager)),
      cache_manager_(std::make_shared<CacheManager>(config.cache_size, config.cache_ttl)) {}

std::string EmbeddingService::get_endpoint_url(const std::string& action) const {
    std::string url = config_.base_url + config_.model + ":" + action;
    std::string key = key_manager_ ? key_manager_->get_current_key() : "";
    if (!key.empty()) url += "?key=" + key;
    return url;
}

std::vector<float> EmbeddingService::checked(std::vector<float> embedding) const {
    if (static_cast<int>(embedding.size()) != config_.dimension) {
        throw EmbeddingError("expected " + std::to_string(config_.dimension) +
                             " values, got " + std::to_string(embedding.size()));
    }
    return embedding;
}

std::vector<float> EmbeddingService::embed(const std::string& text) {
    if (auto cached = cache_manager_->get_embedding(text)) return *cached;

    const std::string payload = json{
        {"model", "models/" + config_.model},
        {"content", {{"parts", {{{"text", utf8_safe_substr(text, kMaxRemoteInputBytes)}}}}}}
    }.dump(-1, ' ', false, json::error_handler_t::replace);

    auto start = std::chrono::steady_clock::now();
    auto r = perform_request_with_retry([&]() {
        // URL rebuilt per attempt so a rotated key is picked up.
        return cpr::Post(cpr::Url{get_endpoint_url("embedContent")},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"}});
    }, key_manager_, config_.max_retries);
    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    if (r.status_code != 200) {
        spdlog::error("Embedding API error [{}]: {}", r.status_code, r.text);
        throw EmbeddingError("HTTP " + std::to_string(r.status_code) + " after retries");
    }

    std::vector<float> embedding;
    try {
        auto response_json = json::parse(r.text);
        embedding = response_json.at("embedding").at("values").get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw EmbeddingError(std::string("malformed response: ") + e.what());
    }

    embedding = checked(std::move(embedding));
    spdlog::debug("Remote embedding took {:.2f} ms", duration);
    cache_manager_->set_embedding(text, embedding);
    return embedding;
}

std::shared_ptr<EmbeddingProvider> make_embedding_provider(const EmbeddingConfig& config) {
    std::shared_ptr<EmbeddingProvider> provider;
    if (config.provider == "remote") {
        provider = std::make_shared<EmbeddingService>(config, std::make_shared<KeyManager>(config.keys));
    } else {
        provider = std::make_shared<HashingEmbedder>(config.dimension);
    }
    if (config.serialize_calls) {
        provider = std::make_shared<SerializedEmbeddingProvider>(provider);
    }
    spdlog::info("Embedding provider: {} ({} dims)", provider->name(), provider->dimension());
    return provider;
}

} // namespace data_assistance
