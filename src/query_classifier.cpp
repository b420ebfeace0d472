#include "query_classifier.hpp"
#include "embedding_service.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace data_assistance {

using json = nlohmann::json;

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::optimize;

std::regex compile(const std::string& pattern) {
    return std::regex(pattern, kRegexFlags);
}

} // namespace

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

json QueryIntent::to_json() const {
    json j = {
        {"type", to_string(type)},
        {"variables", variables},
        {"operations", operations},
        {"filters", filters},
        {"confidence", confidence},
        {"statistical_tests", statistical_tests},
        {"visualization_type", nullptr}
    };
    if (visualization_type) j["visualization_type"] = *visualization_type;
    return j;
}

QueryIntent QueryIntent::from_json(const json& j) {
    QueryIntent intent;
    intent.type = query_type_from_string(j.value("type", "descriptive")).value_or(QueryType::Descriptive);
    intent.variables = j.value("variables", std::vector<std::string>{});
    intent.operations = j.value("operations", std::vector<std::string>{});
    intent.filters = j.value("filters", json::object());
    intent.confidence = j.value("confidence", kFallbackConfidence);
    intent.statistical_tests = j.value("statistical_tests", std::vector<std::string>{});
    if (j.contains("visualization_type") && j["visualization_type"].is_string()) {
        intent.visualization_type = j["visualization_type"].get<std::string>();
    }
    return intent;
}

bool operator==(const QueryIntent& a, const QueryIntent& b) {
    return a.type == b.type &&
           a.variables == b.variables &&
           a.operations == b.operations &&
           a.filters == b.filters &&
           a.confidence == b.confidence &&
           a.statistical_tests == b.statistical_tests &&
           a.visualization_type == b.visualization_type;
}

QueryClassifier::QueryClassifier()
    : age_filter_(compile(patterns::kAgeFilter)),
      gender_filter_(compile(patterns::kGenderFilter)),
      group_filter_(compile(patterns::kGroupFilter))
{
    for (const auto& category : patterns::category_table()) {
        CompiledCategory compiled{category.type, {}};
        for (const auto& p : category.patterns) compiled.patterns.push_back(compile(p));
        categories_.push_back(std::move(compiled));
    }
    for (const auto& p : patterns::variable_patterns()) variable_patterns_.push_back(compile(p));
    for (const auto& p : patterns::operation_patterns()) operation_patterns_.push_back({p.name, compile(p.pattern)});
    for (const auto& p : patterns::statistical_test_patterns()) test_patterns_.push_back({p.name, compile(p.pattern)});
    for (const auto& p : patterns::visualization_patterns()) visualization_patterns_.push_back({p.name, compile(p.pattern)});
}

QueryIntent QueryClassifier::classify(const std::string& query) const noexcept {
    try {
        if (query.size() > kMaxQueryChars) {
            spdlog::debug("Classifying first {} of {} bytes", kMaxQueryChars, query.size());
            return classify_lowered(to_lower(utf8_safe_substr(query, kMaxQueryChars)));
        }
        return classify_lowered(to_lower(query));
    } catch (const std::exception& e) {
        // std::regex may throw on pathological input (error_complexity/error_stack).
        spdlog::warn("Query classification degraded to fallback: {}", e.what());
    }
    return QueryIntent{};
}

QueryIntent QueryClassifier::classify_lowered(const std::string& query_lower) const {
    QueryIntent intent;

    // 1-3. Per-category match counts; strict '>' keeps the earlier category on ties.
    int total = 0;
    int best_count = 0;
    for (const auto& category : categories_) {
        int count = 0;
        for (const auto& re : category.patterns) {
            if (std::regex_search(query_lower, re)) ++count;
        }
        total += count;
        if (count > best_count) {
            best_count = count;
            intent.type = category.type;
        }
    }
    if (total > 0) {
        intent.confidence = static_cast<double>(best_count) / total;
    } else {
        intent.type = QueryType::Descriptive;
        intent.confidence = kFallbackConfidence;
    }

    intent.variables = extract_variables(query_lower);
    intent.operations = extract_operations(query_lower);
    intent.filters = extract_filters(query_lower);

    for (const auto& test : test_patterns_) {
        if (std::regex_search(query_lower, test.pattern)) intent.statistical_tests.push_back(test.name);
    }

    for (const auto& viz : visualization_patterns_) {
        if (std::regex_search(query_lower, viz.pattern)) {
            intent.visualization_type = viz.name;
            break;
        }
    }
    return intent;
}

std::vector<std::string> QueryClassifier::extract_variables(const std::string& query_lower) const {
    std::set<std::string> found;
    for (const auto& re : variable_patterns_) {
        for (auto it = std::sregex_iterator(query_lower.begin(), query_lower.end(), re);
             it != std::sregex_iterator(); ++it) {
            found.insert((*it)[1].str());
        }
    }
    return {found.begin(), found.end()};
}

std::vector<std::string> QueryClassifier::extract_operations(const std::string& query_lower) const {
    std::vector<std::string> operations;
    for (const auto& op : operation_patterns_) {
        if (std::regex_search(query_lower, op.pattern)) operations.push_back(op.name);
    }
    return operations;
}

json QueryClassifier::extract_filters(const std::string& query_lower) const {
    json filters = json::object();
    std::smatch match;

    if (std::regex_search(query_lower, match, age_filter_)) {
        try {
            filters["age"] = std::stoll(match[1].str());
        } catch (const std::out_of_range&) {
            spdlog::debug("Ignoring out-of-range age filter '{}'", match[1].str());
        }
    }

    if (std::regex_search(query_lower, match, gender_filter_)) {
        filters["gender"] = match[1].str();
    }

    if (std::regex_search(query_lower, match, group_filter_)) {
        filters["group"] = match[1].str();
    }
    return filters;
}

} // namespace data_assistance
