#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "embedding_service.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace data_assistance;
using Catch::Matchers::WithinAbs;

namespace {

double dot(const std::vector<float>& a, const std::vector<float>& b) {
    double s = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) s += static_cast<double>(a[i]) * b[i];
    return s;
}

class CountingProvider : public EmbeddingProvider {
public:
    std::vector<float> embed(const std::string&) override {
        ++calls;
        return {1.0f, 0.0f};
    }
    int dimension() const override { return 2; }
    std::string name() const override { return "counting"; }
    int calls = 0;
};

} // namespace

TEST_CASE("Hashing embedder", "[embedding]") {
    HashingEmbedder embedder(128);
    REQUIRE(embedder.dimension() == 128);
    REQUIRE(embedder.name() == "hashing");

    SECTION("Deterministic and unit length") {
        auto a = embedder.embed("Correlation between age and cholesterol");
        auto b = embedder.embed("Correlation between age and cholesterol");
        REQUIRE(a.size() == 128);
        REQUIRE(a == b);
        REQUIRE_THAT(dot(a, a), WithinAbs(1.0, 1e-5));
    }

    SECTION("Case and punctuation do not matter") {
        REQUIRE(embedder.embed("Mean AGE?") == embedder.embed("mean age"));
    }

    SECTION("Shared vocabulary means higher similarity") {
        auto query = embedder.embed("correlation of age and cholesterol");
        auto close = embedder.embed("correlation matrix age cholesterol");
        auto far = embedder.embed("the quick brown fox jumps over the lazy dog");
        REQUIRE(dot(query, close) > dot(query, far));
    }

    SECTION("Empty text gives the zero vector") {
        auto v = embedder.embed("");
        REQUIRE(std::all_of(v.begin(), v.end(), [](float x) { return x == 0.0f; }));
    }

    REQUIRE_THROWS_AS(HashingEmbedder(0), EmbeddingError);
}

TEST_CASE("Tokenizer", "[embedding]") {
    auto tokens = HashingEmbedder::tokenize("Blood_Pressure vs. BMI (kg/m2)");
    REQUIRE(tokens == std::vector<std::string>{"blood_pressure", "vs", "bmi", "kg", "m2"});
    REQUIRE(HashingEmbedder::tokenize("  ,; ").empty());
}

TEST_CASE("UTF-8 safe truncation", "[embedding]") {
    REQUIRE(utf8_safe_substr("hello", 10) == "hello");
    REQUIRE(utf8_safe_substr("hello", 3) == "hel");
    // "é" is two bytes; cutting through it drops the partial sequence
    REQUIRE(utf8_safe_substr("caf\xC3\xA9", 4) == "caf");
}

TEST_CASE("Serialized provider delegates", "[embedding]") {
    auto inner = std::make_shared<CountingProvider>();
    SerializedEmbeddingProvider serialized(inner);
    REQUIRE(serialized.embed("x") == std::vector<float>{1.0f, 0.0f});
    REQUIRE(serialized.dimension() == 2);
    REQUIRE(serialized.name() == "counting");
    REQUIRE(inner->calls == 1);
}

TEST_CASE("Provider factory", "[embedding]") {
    EmbeddingConfig config;
    config.dimension = 64;

    auto hashing = make_embedding_provider(config);
    REQUIRE(hashing->name() == "hashing");
    REQUIRE(hashing->dimension() == 64);

    config.serialize_calls = true;
    auto serialized = make_embedding_provider(config);
    REQUIRE(dynamic_cast<SerializedEmbeddingProvider*>(serialized.get()) != nullptr);
    REQUIRE(serialized->embed("abc").size() == 64);
}

TEST_CASE("Remote embedding failures surface as EmbeddingError", "[embedding]") {
    EmbeddingConfig config;
    config.provider = "remote";
    config.base_url = "http://127.0.0.1:1/models/";
    config.max_retries = 1;

    EmbeddingService service(config, std::make_shared<KeyManager>(std::vector<std::string>{}));
    REQUIRE(service.dimension() == config.dimension);
    REQUIRE_THROWS_AS(service.embed("unreachable"), EmbeddingError);
}
