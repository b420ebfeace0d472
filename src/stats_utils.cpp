#include "stats_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_map>
#include <spdlog/fmt/fmt.h>

namespace data_assistance {
namespace stats {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return kNaN;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double sample_std(const std::vector<double>& values) {
    if (values.size() < 2) return kNaN;
    double m = mean(values);
    double acc = 0.0;
    for (double v : values) acc += (v - m) * (v - m);
    return std::sqrt(acc / static_cast<double>(values.size() - 1));
}

double quantile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return kNaN;
    double pos = q * static_cast<double>(sorted.size() - 1);
    auto lo = static_cast<std::size_t>(std::floor(pos));
    auto hi = static_cast<std::size_t>(std::ceil(pos));
    double frac = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

NumericSummary summarize(std::vector<double> values) {
    NumericSummary s;
    s.count = values.size();
    s.mean = mean(values);
    s.stddev = sample_std(values);
    std::sort(values.begin(), values.end());
    s.min = values.empty() ? kNaN : values.front();
    s.max = values.empty() ? kNaN : values.back();
    s.q25 = quantile(values, 0.25);
    s.median = quantile(values, 0.50);
    s.q75 = quantile(values, 0.75);
    return s;
}

ValueCounts value_counts(const std::vector<std::string>& values) {
    ValueCounts counts;
    std::unordered_map<std::string, std::size_t> slot;
    for (const auto& v : values) {
        auto it = slot.find(v);
        if (it == slot.end()) {
            slot.emplace(v, counts.size());
            counts.emplace_back(v, 1);
        } else {
            counts[it->second].second++;
        }
    }
    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return counts;
}

std::optional<std::string> mode(const std::vector<std::string>& values) {
    auto counts = value_counts(values);
    if (counts.empty()) return std::nullopt;
    std::size_t top = counts.front().second;
    std::string best = counts.front().first;
    for (const auto& [value, count] : counts) {
        if (count != top) break;
        if (value < best) best = value;
    }
    return best;
}

std::size_t unique_count(const std::vector<std::string>& values) {
    return value_counts(values).size();
}

double pearson(const std::vector<double>& x, const std::vector<uint8_t>& x_missing,
               const std::vector<double>& y, const std::vector<uint8_t>& y_missing) {
    std::size_t n = std::min(x.size(), y.size());
    std::vector<double> xs, ys;
    xs.reserve(n);
    ys.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        bool missing = (i < x_missing.size() && x_missing[i]) || (i < y_missing.size() && y_missing[i]);
        if (missing) continue;
        xs.push_back(x[i]);
        ys.push_back(y[i]);
    }
    if (xs.size() < 2) return kNaN;

    double mx = mean(xs);
    double my = mean(ys);
    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (std::size_t i = 0; i < xs.size(); ++i) {
        double dx = xs[i] - mx;
        double dy = ys[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx == 0.0 || syy == 0.0) return kNaN;
    double r = sxy / std::sqrt(sxx * syy);
    return std::clamp(r, -1.0, 1.0);
}

std::string format_fixed(double value, int precision) {
    if (std::isnan(value)) return "nan";
    return fmt::format("{:.{}f}", value, precision);
}

} // namespace stats
} // namespace data_assistance
