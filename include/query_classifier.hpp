#pragma once
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pattern_library.hpp"

namespace data_assistance {

struct QueryIntent {
    QueryType type = QueryType::Descriptive;
    std::vector<std::string> variables;          // sorted, unique
    std::vector<std::string> operations;         // vocabulary order
    nlohmann::json filters = nlohmann::json::object();
    double confidence = 0.5;
    std::vector<std::string> statistical_tests;  // vocabulary order
    std::optional<std::string> visualization_type;

    nlohmann::json to_json() const;
    static QueryIntent from_json(const nlohmann::json& j);
};

bool operator==(const QueryIntent& a, const QueryIntent& b);

// Confidence reported when no category pattern matches.
constexpr double kFallbackConfidence = 0.5;

// Longer queries are classified on their leading bytes; std::regex recursion
// grows with input length.
constexpr std::size_t kMaxQueryChars = 4096;

class QueryClassifier {
public:
    QueryClassifier();

    // Never throws. Worst case is the descriptive fallback intent.
    QueryIntent classify(const std::string& query) const noexcept;

private:
    struct CompiledCategory {
        QueryType type;
        std::vector<std::regex> patterns;
    };
    struct CompiledNamed {
        std::string name;
        std::regex pattern;
    };

    std::vector<CompiledCategory> categories_;
    std::vector<std::regex> variable_patterns_;
    std::vector<CompiledNamed> operation_patterns_;
    std::vector<CompiledNamed> test_patterns_;
    std::vector<CompiledNamed> visualization_patterns_;
    std::regex age_filter_;
    std::regex gender_filter_;
    std::regex group_filter_;

    QueryIntent classify_lowered(const std::string& query_lower) const;
    std::vector<std::string> extract_variables(const std::string& query_lower) const;
    std::vector<std::string> extract_operations(const std::string& query_lower) const;
    nlohmann::json extract_filters(const std::string& query_lower) const;
};

std::string to_lower(std::string text);

} // namespace data_assistance
