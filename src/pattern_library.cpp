#include "pattern_library.hpp"
#include <array>
#include <utility>

namespace data_assistance {

namespace {

const std::array<std::pair<QueryType, const char*>, 10> kTypeNames = {{
    {QueryType::Descriptive, "descriptive"},
    {QueryType::Inferential, "inferential"},
    {QueryType::Correlation, "correlation"},
    {QueryType::Visualization, "visualization"},
    {QueryType::Comparison, "comparison"},
    {QueryType::Predictive, "predictive"},
    {QueryType::Temporal, "temporal"},
    {QueryType::Distribution, "distribution"},
    {QueryType::Outlier, "outlier"},
    {QueryType::Summary, "summary"},
}};

} // namespace

std::string to_string(QueryType type) {
    for (const auto& [t, name] : kTypeNames) {
        if (t == type) return name;
    }
    return "descriptive";
}

std::optional<QueryType> query_type_from_string(const std::string& name) {
    for (const auto& [t, n] : kTypeNames) {
        if (name == n) return t;
    }
    return std::nullopt;
}

namespace patterns {

const char* const kAgeFilter = R"(age\s*[><=]\s*(\d+))";
const char* const kGenderFilter = R"(\b(male|female|men|women)\b)";
const char* const kGroupFilter = R"(group\s*[=:]\s*["']?([^"']+)["']?)";

const std::vector<CategoryPatterns>& category_table() {
    static const std::vector<CategoryPatterns> table = {
        {QueryType::Descriptive, {
            R"(\b(describe|summary|overview|statistics|mean|average|median|mode|std|variance|distribution)\b)",
            R"(\b(what is|what are|show me|tell me about|describe)\b)",
            R"(\b(characteristics|profile|basic stats|descriptive)\b)",
        }},
        {QueryType::Inferential, {
            R"(\b(test|hypothesis|significance|p-value|confidence|interval)\b)",
            R"(\b(ttest|anova|chi-square|regression|correlation test)\b)",
            R"(\b(difference|association|relationship|effect)\b)",
        }},
        {QueryType::Correlation, {
            // "correlat" is a stem: correlate, correlated, correlation...
            R"(\b(correlat\w*|relationship|association|connect)\b)",
            R"(\b(relate|link|depend|influence|affect)\b)",
            R"(\b(between|among|with)\b.*\b(and|&)\b)",
        }},
        {QueryType::Visualization, {
            R"(\b(plot|graph|chart|visualize|show|display)\b)",
            R"(\b(histogram|scatter|bar|line|box|heatmap)\b)",
            R"(\b(trend|pattern|distribution)\b)",
        }},
        {QueryType::Comparison, {
            R"(\b(compare|contrast|difference|versus|vs|against)\b)",
            R"(\b(group|category|segment|cohort)\b)",
            R"(\b(higher|lower|greater|less|more|fewer)\b)",
        }},
        {QueryType::Predictive, {
            R"(\b(predict|forecast|model|estimate|project)\b)",
            R"(\b(future|outcome|result|prognosis)\b)",
            R"(\b(regression|machine learning|ml|classification)\b)",
        }},
        {QueryType::Temporal, {
            R"(\b(time|temporal|trend|over time|longitudinal)\b)",
            R"(\b(before|after|during|period|season)\b)",
            R"(\b(change|evolution|progression|development)\b)",
        }},
    };
    return table;
}

const std::vector<std::string>& variable_patterns() {
    static const std::vector<std::string> table = {
        R"(\b(age|gender|sex|height|weight|bmi|income|salary|education|experience)\b)",
        R"(\b(score|rating|price|cost|value|amount|quantity|count)\b)",
        R"(\b(blood_pressure|heart_rate|temperature|cholesterol|glucose)\b)",
        R"(\b(treatment|medication|therapy|intervention|group|category)\b)",
    };
    return table;
}

const std::vector<NamedPattern>& operation_patterns() {
    static const std::vector<NamedPattern> table = {
        {"mean", R"(\b(mean|average|avg)\b)"},
        {"median", R"(\b(median|middle)\b)"},
        {"mode", R"(\b(mode|most common)\b)"},
        {"std", R"(\b(standard deviation|std|variability)\b)"},
        {"var", R"(\b(variance|var)\b)"},
        {"min", R"(\b(minimum|min|lowest)\b)"},
        {"max", R"(\b(maximum|max|highest)\b)"},
        {"sum", R"(\b(sum|total|add)\b)"},
        {"count", R"(\b(count|number|frequency)\b)"},
        {"correlation", R"(\b(correlation|relate|associate)\b)"},
        {"regression", R"(\b(regression|predict|model)\b)"},
    };
    return table;
}

const std::vector<NamedPattern>& statistical_test_patterns() {
    static const std::vector<NamedPattern> table = {
        {"ttest", R"(\b(t-test|ttest|paired|unpaired|independent|student)\b)"},
        {"anova", R"(\b(anova|analysis of variance|f-test|one-way|two-way)\b)"},
        {"chi_square", R"(\b(chi-square|chi2|contingency|independence)\b)"},
        {"correlation", R"(\b(correlation|pearson|spearman|kendall)\b)"},
        {"regression", R"(\b(regression|linear|logistic|multiple)\b)"},
        {"nonparametric", R"(\b(mann-whitney|wilcoxon|kruskal|friedman)\b)"},
    };
    return table;
}

const std::vector<NamedPattern>& visualization_patterns() {
    static const std::vector<NamedPattern> table = {
        {"histogram", R"(\b(histogram|distribution|frequency)\b)"},
        {"scatter", R"(\b(scatter|relationship|correlation)\b)"},
        {"bar", R"(\b(bar|category|group|count)\b)"},
        {"line", R"(\b(line|trend|time|temporal)\b)"},
        {"box", R"(\b(box|quartile|outlier|spread)\b)"},
        {"heatmap", R"(\b(heatmap|correlation matrix|intensity)\b)"},
    };
    return table;
}

const std::string& augmentation_phrase(QueryType type) {
    static const std::array<std::pair<QueryType, std::string>, 10> phrases = {{
        {QueryType::Descriptive, " statistical summary descriptive statistics mean median mode standard deviation"},
        {QueryType::Inferential, " hypothesis testing statistical significance p-value confidence interval"},
        {QueryType::Correlation, " correlation relationship association linear regression"},
        {QueryType::Visualization, " plot graph chart visualization data display"},
        {QueryType::Comparison, " comparison group difference statistical test"},
        {QueryType::Predictive, " prediction modeling machine learning regression classification"},
        {QueryType::Temporal, " time trend change over time temporal pattern"},
        {QueryType::Distribution, " distribution histogram frequency spread skewness"},
        {QueryType::Outlier, " outlier extreme values quartile range anomaly"},
        {QueryType::Summary, " dataset overview summary statistics shape missing values"},
    }};
    for (const auto& [t, phrase] : phrases) {
        if (t == type) return phrase;
    }
    return phrases[0].second;
}

const std::vector<std::string>& domain_column_vocabulary() {
    static const std::vector<std::string> vocabulary = {
        "age", "gender", "sex", "height", "weight", "bmi", "blood_pressure",
        "heart_rate", "temperature", "cholesterol", "glucose", "medication",
        "treatment", "diagnosis", "outcome", "survival", "mortality"
    };
    return vocabulary;
}

} // namespace patterns
} // namespace data_assistance
