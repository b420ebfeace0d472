#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace data_assistance {
namespace stats {

struct NumericSummary {
    std::size_t count = 0;
    double mean = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double q25 = 0.0;
    double median = 0.0;
    double q75 = 0.0;
    double max = 0.0;
};

using ValueCounts = std::vector<std::pair<std::string, std::size_t>>;

// NaN for empty input.
double mean(const std::vector<double>& values);

// Sample standard deviation (n - 1 denominator); NaN below two values.
double sample_std(const std::vector<double>& values);

// Linear interpolation between closest ranks; `sorted` must be ascending.
double quantile(const std::vector<double>& sorted, double q);

NumericSummary summarize(std::vector<double> values);

// Count-descending; equal counts keep first-appearance order.
ValueCounts value_counts(const std::vector<std::string>& values);

// Smallest of the most frequent values, or nullopt for empty input.
std::optional<std::string> mode(const std::vector<std::string>& values);

std::size_t unique_count(const std::vector<std::string>& values);

/**
 * Pearson correlation over the rows where neither side is missing.
 * Returns NaN with fewer than two complete pairs or zero variance.
 */
double pearson(const std::vector<double>& x, const std::vector<uint8_t>& x_missing,
               const std::vector<double>& y, const std::vector<uint8_t>& y_missing);

// Fixed-point rendering that prints "nan" for NaN values.
std::string format_fixed(double value, int precision);

} // namespace stats
} // namespace data_assistance
