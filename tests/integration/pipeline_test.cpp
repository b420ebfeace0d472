/** \file pipeline_test.cpp
 *  \brief CSV upload through retrieval with the in-process embedder and a flat FAISS store.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "dataset.hpp"
#include "embedding_service.hpp"
#include "errors.hpp"
#include "faiss_vector_store.hpp"
#include "retrieval_engine.hpp"
#include <algorithm>
#include <filesystem>
#include <map>
#include <memory>
#include <sstream>
#include <string>

using namespace data_assistance;
using Catch::Matchers::ContainsSubstring;
namespace fs = std::filesystem;

namespace {

constexpr int kDim = 384;

// 250 patients, five numeric columns; cholesterol tracks age closely.
std::string clinical_csv() {
    std::ostringstream csv;
    csv << "age,cholesterol,bmi,glucose,heart_rate\n";
    for (int i = 0; i < 250; ++i) {
        int age = 20 + (i * 37 % 60);
        int cholesterol = 150 + 2 * age + ((i * 13 % 21) - 10);
        double bmi = 18 + (i * 7 % 150) / 10.0;
        int glucose = 70 + (i * 11 % 90);
        int heart_rate = 60 + (i * 17 % 40);
        csv << age << ',' << cholesterol << ',' << bmi << ',' << glucose << ',' << heart_rate << '\n';
    }
    return csv.str();
}

std::map<std::string, int> chunk_type_counts(const QueryResult& result) {
    std::map<std::string, int> counts;
    for (const auto& r : result.ranked) counts[r.chunk_type]++;
    return counts;
}

} // namespace

TEST_CASE("Clinical dataset end to end", "[pipeline]") {
    auto dataset = Dataset::from_csv_string(clinical_csv());
    REQUIRE(dataset.row_count() == 250);
    REQUIRE(dataset.numeric_column_indices().size() == 5);

    auto store = std::make_shared<FaissVectorStore>(kDim);
    RetrievalEngine engine(store, std::make_shared<HashingEmbedder>(kDim));

    REQUIRE(engine.ingest("clinic", dataset, "clinic.csv") == "session_clinic");

    // 3 row chunks, numeric and medical column chunks, summary, correlation
    auto info = engine.info("clinic");
    REQUIRE(info.has_value());
    REQUIRE(info->count == 7);

    auto result = engine.query("clinic", "What is the correlation between age and cholesterol?", 10);

    SECTION("Intent") {
        REQUIRE(result.intent.type == QueryType::Correlation);
        const auto& vars = result.intent.variables;
        REQUIRE(std::find(vars.begin(), vars.end(), "age") != vars.end());
        REQUIRE(std::find(vars.begin(), vars.end(), "cholesterol") != vars.end());
    }

    SECTION("Every chunk comes back and the correlation matrix ranks first") {
        REQUIRE(result.chunks.size() == 7);
        auto counts = chunk_type_counts(result);
        REQUIRE(counts["row_group"] == 3);
        REQUIRE(counts["column_group"] == 2);
        REQUIRE(counts["statistical_summary"] == 1);
        REQUIRE(counts["correlation_matrix"] == 1);

        REQUIRE(result.ranked.front().chunk_type == "correlation_matrix");
        REQUIRE_THAT(result.chunks.front(), ContainsSubstring("age ↔ cholesterol"));
        for (std::size_t i = 1; i < result.ranked.size(); ++i) {
            REQUIRE(result.ranked[i - 1].score >= result.ranked[i].score);
        }
    }

    SECTION("Delete ends the session") {
        REQUIRE(engine.delete_session("clinic"));
        REQUIRE_THROWS_AS(engine.query("clinic", "mean age"), NotFoundError);
        REQUIRE(engine.list_collections().empty());
    }
}

TEST_CASE("Sessions survive a restart with a persistent store", "[pipeline]") {
    const fs::path dir = fs::temp_directory_path() / "data_assistance_pipeline_test";
    fs::remove_all(dir);

    IndexConfig config;
    config.persist_directory = dir.string();
    auto embedder = std::make_shared<HashingEmbedder>(kDim);
    auto dataset = Dataset::from_csv_string(clinical_csv());

    {
        RetrievalEngine engine(std::make_shared<FaissVectorStore>(kDim, config), embedder);
        engine.ingest("persisted", dataset, "clinic.csv");
    }

    RetrievalEngine restarted(std::make_shared<FaissVectorStore>(kDim, config), embedder);
    auto info = restarted.info("persisted");
    REQUIRE(info.has_value());
    REQUIRE(info->count == 7);
    REQUIRE(info->metadata.at("filename") == "clinic.csv");

    auto result = restarted.query("persisted", "What is the correlation between age and cholesterol?", 10);
    REQUIRE(result.ranked.front().chunk_type == "correlation_matrix");

    REQUIRE(restarted.delete_session("persisted"));
    fs::remove_all(dir);
}
