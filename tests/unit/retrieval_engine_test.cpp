#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "errors.hpp"
#include "faiss_vector_store.hpp"
#include "LogManager.hpp"
#include "retrieval_engine.hpp"
#include "SystemMonitor.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace data_assistance;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {

constexpr int kDim = 64;

SearchCandidate candidate(const std::string& id, float distance, const std::string& chunk_type,
                          std::vector<std::string> variables = {}) {
    return {id, "content " + id, json{{"chunk_type", chunk_type}, {"variables", variables}}, distance};
}

QueryIntent intent_of(QueryType type, std::vector<std::string> variables = {}) {
    QueryIntent intent;
    intent.type = type;
    intent.variables = std::move(variables);
    return intent;
}

// Hashing embedder that can be told to fail on matching input.
class FlakyEmbedder : public EmbeddingProvider {
public:
    std::vector<float> embed(const std::string& text) override {
        if (fail_all || (!fail_on.empty() && text.find(fail_on) != std::string::npos)) {
            throw EmbeddingError("refusing '" + text.substr(0, 20) + "'");
        }
        return inner_.embed(text);
    }
    int dimension() const override { return kDim; }
    std::string name() const override { return "flaky"; }

    std::atomic<bool> fail_all{false};
    std::string fail_on;

private:
    HashingEmbedder inner_{kDim};
};

Dataset small_dataset(std::size_t rows = 12) {
    Dataset ds;
    std::vector<double> age, chol;
    std::vector<std::string> sex;
    for (std::size_t i = 0; i < rows; ++i) {
        age.push_back(30.0 + static_cast<double>(i));
        chol.push_back(180.0 + 2.0 * static_cast<double>(i) + static_cast<double>(i % 3));
        sex.push_back(i % 2 ? "M" : "F");
    }
    ds.add_numeric_column("age", age);
    ds.add_numeric_column("cholesterol", chol);
    ds.add_categorical_column("sex", sex);
    return ds;
}

} // namespace

TEST_CASE("Scoring applies affinity and variable bonus", "[rerank]") {
    RerankWeights w;

    auto base = score_candidate(candidate("x", 0.4f, "row_group"), intent_of(QueryType::Descriptive), w);
    REQUIRE_THAT(base, WithinAbs(0.6, 1e-6));

    auto summary = score_candidate(candidate("x", 0.4f, "statistical_summary"), intent_of(QueryType::Descriptive), w);
    REQUIRE_THAT(summary, WithinAbs(0.6 * 1.5, 1e-6));

    auto corr = score_candidate(candidate("x", 0.4f, "correlation_matrix", {"Age", "bmi"}),
                                intent_of(QueryType::Correlation, {"age"}), w);
    REQUIRE_THAT(corr, WithinAbs(0.6 * 1.8 * 1.3, 1e-6));

    auto no_overlap = score_candidate(candidate("x", 0.4f, "correlation_matrix", {"bmi"}),
                                      intent_of(QueryType::Correlation, {"age"}), w);
    REQUIRE_THAT(no_overlap, WithinAbs(0.6 * 1.8, 1e-6));

    auto unknown = score_candidate(candidate("x", 0.4f, "column_group"), intent_of(QueryType::Temporal), w);
    REQUIRE_THAT(unknown, WithinAbs(0.6, 1e-6));
}

TEST_CASE("Re-ranking is monotonic in similarity for equal multipliers", "[rerank]") {
    RerankWeights w;
    std::vector<SearchCandidate> candidates = {
        candidate("far", 0.9f, "row_group"),
        candidate("near", 0.1f, "row_group"),
        candidate("mid", 0.5f, "row_group"),
    };
    auto ranked = rerank(candidates, intent_of(QueryType::Comparison), w);
    REQUIRE(ranked.size() == 3);
    REQUIRE(ranked[0].id == "near");
    REQUIRE(ranked[1].id == "mid");
    REQUIRE(ranked[2].id == "far");
    for (std::size_t i = 1; i < ranked.size(); ++i) {
        REQUIRE(ranked[i - 1].score >= ranked[i].score);
    }
}

TEST_CASE("Re-ranking promotes preferred chunk types and is stable", "[rerank]") {
    RerankWeights w;
    std::vector<SearchCandidate> candidates = {
        candidate("rows", 0.30f, "row_group"),
        candidate("corr", 0.50f, "correlation_matrix"),
        candidate("tie1", 0.60f, "column_group"),
        candidate("tie2", 0.60f, "column_group"),
    };
    auto ranked = rerank(candidates, intent_of(QueryType::Correlation), w);
    REQUIRE(ranked[0].id == "corr");   // 0.5 * 1.8 = 0.9 beats 0.7
    REQUIRE(ranked[1].id == "rows");
    REQUIRE(ranked[2].id == "tie1");
    REQUIRE(ranked[3].id == "tie2");
    REQUIRE(ranked[0].chunk_type == "correlation_matrix");
}

TEST_CASE("Query augmentation", "[rerank]") {
    auto intent = intent_of(QueryType::Correlation, {"age", "cholesterol"});
    intent.statistical_tests = {"correlation"};

    REQUIRE(augment_query("q", intent) ==
            "q correlation relationship association linear regression"
            " variables: age cholesterol statistical tests: correlation");

    auto plain = augment_query("q", intent_of(QueryType::Comparison));
    REQUIRE(plain == "q comparison group difference statistical test");
}

TEST_CASE("Collection naming", "[engine]") {
    REQUIRE(collection_name_for("abc") == "session_abc");
    REQUIRE_THROWS_AS(collection_name_for(""), std::invalid_argument);
}

TEST_CASE("Engine ingest, query, info and delete", "[engine]") {
    auto store = std::make_shared<FaissVectorStore>(kDim);
    auto embedder = std::make_shared<FlakyEmbedder>();
    RetrievalEngine engine(store, embedder);

    SECTION("Happy path") {
        auto name = engine.ingest("s1", small_dataset(), "heart.csv");
        REQUIRE(name == "session_s1");

        auto info = engine.info("s1");
        REQUIRE(info.has_value());
        REQUIRE(info->name == "session_s1");
        // 1 row chunk, numeric + categorical + medical column chunks, summary, correlation
        REQUIRE(info->count == 6);
        REQUIRE(info->metadata.at("filename") == "heart.csv");
        REQUIRE(info->metadata.at("row_count") == 12);
        REQUIRE(info->metadata.at("column_count") == 3);
        REQUIRE_THAT(info->metadata.at("created_at").get<std::string>(), ContainsSubstring("T"));

        auto before = LogManager::instance().size();
        auto result = engine.query("s1", "What is the correlation between age and cholesterol?", 3);
        REQUIRE(result.intent.type == QueryType::Correlation);
        REQUIRE(result.chunks.size() == 3);
        REQUIRE(result.ranked.size() == 3);
        REQUIRE(result.chunks[0] == result.ranked[0].content);
        REQUIRE(LogManager::instance().size() >= std::min<std::size_t>(before + 1, LogManager::kMaxEntries));
        REQUIRE(LogManager::instance().get_logs_json()[0].at("session_id") == "s1");

        auto telemetry = SystemMonitor::get_latest_snapshot();
        REQUIRE(telemetry.query_count >= 1);
        REQUIRE(telemetry.ingest_count >= 1);
        REQUIRE(telemetry.to_json().contains("query_latency_ms"));

        auto j = result.to_json();
        REQUIRE(j.at("intent").at("type") == "correlation");
        REQUIRE(j.at("chunks").size() == 3);
    }

    SECTION("Query without a collection") {
        REQUIRE_THROWS_AS(engine.query("nobody", "mean age"), NotFoundError);
        REQUIRE_FALSE(engine.info("nobody").has_value());
    }

    SECTION("Ingest, delete, query") {
        engine.ingest("s2", small_dataset());
        REQUIRE(engine.delete_session("s2"));
        REQUIRE_THROWS_AS(engine.query("s2", "mean age"), NotFoundError);
        REQUIRE_FALSE(engine.info("s2").has_value());
        // idempotent
        REQUIRE(engine.delete_session("s2"));
        REQUIRE(engine.delete_session("never-existed"));
    }

    SECTION("Re-ingest replaces the previous chunks") {
        engine.ingest("s3", small_dataset(12));
        auto first_ids = std::set<std::string>();
        for (const auto& r : engine.query("s3", "mean age", 50).ranked) first_ids.insert(r.id);

        engine.ingest("s3", small_dataset(30), "second.csv", std::nullopt, 10);
        auto listed = engine.list_collections();
        REQUIRE(listed.size() == 1);
        REQUIRE(listed[0].metadata.at("filename") == "second.csv");

        auto second = engine.query("s3", "mean age", 50).ranked;
        // 3 row chunks of 10 rows, 3 column chunks, summary, correlation
        REQUIRE(second.size() == 8);
        for (const auto& r : second) REQUIRE(first_ids.count(r.id) == 0);
    }

    SECTION("Chunks that fail to embed are skipped") {
        embedder->fail_on = "Correlation Analysis";
        engine.ingest("s4", small_dataset());
        REQUIRE(engine.info("s4")->count == 5);
    }

    SECTION("Every chunk failing is an ingestion failure") {
        embedder->fail_all = true;
        REQUIRE_THROWS_AS(engine.ingest("s5", small_dataset()), IngestionError);
        REQUIRE_FALSE(engine.info("s5").has_value());
    }

    SECTION("Expired deadline leaves nothing behind") {
        auto past = std::chrono::steady_clock::now() - std::chrono::seconds(1);
        REQUIRE_THROWS_AS(engine.ingest("s6", small_dataset(), "late.csv", past), TimeoutError);
        REQUIRE_FALSE(engine.info("s6").has_value());

        engine.ingest("s7", small_dataset());
        REQUIRE_THROWS_AS(engine.query("s7", "mean age", 5, past), TimeoutError);
    }

    SECTION("Query embedding failure") {
        engine.ingest("s8", small_dataset());
        embedder->fail_all = true;
        REQUIRE_THROWS_AS(engine.query("s8", "mean age"), EmbeddingError);
    }

    SECTION("Empty dataset indexes only its summary") {
        REQUIRE(engine.ingest("empty", Dataset{}) == "session_empty");
        auto info = engine.info("empty");
        REQUIRE(info.has_value());
        REQUIRE(info->count == 1);
        auto result = engine.query("empty", "give me an overview");
        REQUIRE(result.ranked.size() == 1);
        REQUIRE(result.ranked[0].chunk_type == "statistical_summary");
    }

    SECTION("Invalid top_k") {
        engine.ingest("s9", small_dataset());
        REQUIRE_THROWS_AS(engine.query("s9", "mean age", 0), std::invalid_argument);
    }

    SECTION("Classification passthrough") {
        REQUIRE(engine.classify("hello").type == QueryType::Descriptive);
    }
}

TEST_CASE("Engine requires its collaborators", "[engine]") {
    REQUIRE_THROWS_AS(RetrievalEngine(nullptr, std::make_shared<HashingEmbedder>(kDim)), std::invalid_argument);
}
