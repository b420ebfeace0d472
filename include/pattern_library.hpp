#pragma once
#include <optional>
#include <string>
#include <vector>

namespace data_assistance {

enum class QueryType {
    Descriptive,
    Inferential,
    Correlation,
    Visualization,
    Comparison,
    Predictive,
    Temporal,
    Distribution,
    Outlier,
    Summary
};

std::string to_string(QueryType type);
std::optional<QueryType> query_type_from_string(const std::string& name);

struct NamedPattern {
    std::string name;
    std::string pattern;
};

struct CategoryPatterns {
    QueryType type;
    std::vector<std::string> patterns;
};

// Static regex vocabularies. Every pattern is lower case and is matched
// against lower-cased text with ECMAScript syntax.
namespace patterns {

// Category groups in tie-break precedence order: the first-defined category
// wins when two categories have the same number of matching patterns.
const std::vector<CategoryPatterns>& category_table();

const std::vector<std::string>& variable_patterns();
const std::vector<NamedPattern>& operation_patterns();
const std::vector<NamedPattern>& statistical_test_patterns();

// Priority order: the first family that matches is the visualization type.
const std::vector<NamedPattern>& visualization_patterns();

extern const char* const kAgeFilter;
extern const char* const kGenderFilter;
extern const char* const kGroupFilter;

// Boilerplate appended to a query of the given type before it is embedded.
const std::string& augmentation_phrase(QueryType type);

// Column-name fragments that put a column into the domain ("medical") group.
const std::vector<std::string>& domain_column_vocabulary();

} // namespace patterns
} // namespace data_assistance
