#include "data_chunker.hpp"
#include "pattern_library.hpp"
#include "query_classifier.hpp"
#include "stats_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <functional>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace data_assistance {

using json = nlohmann::json;

namespace {

constexpr std::size_t kSampleRows = 3;
constexpr std::size_t kRowCategoryTop = 3;
constexpr std::size_t kColumnCategoryTop = 5;

// Pandas-style text table: left column holds row labels, cells right-aligned.
std::string render_table(const std::vector<std::string>& row_labels,
                         const std::vector<std::string>& col_labels,
                         const std::vector<std::vector<std::string>>& cells) {
    size_t label_width = 0;
    for (const auto& l : row_labels) label_width = std::max(label_width, l.size());

    std::vector<size_t> widths(col_labels.size());
    for (size_t c = 0; c < col_labels.size(); ++c) {
        widths[c] = col_labels[c].size();
        for (const auto& row : cells) {
            if (c < row.size()) widths[c] = std::max(widths[c], row[c].size());
        }
    }

    std::ostringstream out;
    out << std::string(label_width, ' ');
    for (size_t c = 0; c < col_labels.size(); ++c) {
        out << "  " << std::string(widths[c] - col_labels[c].size(), ' ') << col_labels[c];
    }
    for (size_t r = 0; r < row_labels.size(); ++r) {
        out << "\n" << row_labels[r] << std::string(label_width - row_labels[r].size(), ' ');
        for (size_t c = 0; c < col_labels.size(); ++c) {
            const std::string& cell = (r < cells.size() && c < cells[r].size()) ? cells[r][c] : "";
            out << "  " << std::string(widths[c] - cell.size(), ' ') << cell;
        }
    }
    return out.str();
}

// {'a': 3, 'b': 1}
std::string render_counts(const stats::ValueCounts& counts, size_t limit) {
    std::string out = "{";
    for (size_t i = 0; i < std::min(limit, counts.size()); ++i) {
        if (i) out += ", ";
        out += fmt::format("'{}': {}", counts[i].first, counts[i].second);
    }
    return out + "}";
}

std::string render_list(const stats::ValueCounts& counts, size_t limit) {
    std::string out = "[";
    for (size_t i = 0; i < std::min(limit, counts.size()); ++i) {
        if (i) out += ", ";
        out += fmt::format("'{}'", counts[i].first);
    }
    return out + "]";
}

std::string title_case(const std::string& word) {
    std::string out = word;
    if (!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

std::string describe_table(const Dataset& ds, const std::vector<size_t>& numeric) {
    std::vector<std::string> col_labels;
    std::vector<stats::NumericSummary> summaries;
    for (size_t idx : numeric) {
        col_labels.push_back(ds.columns()[idx].name);
        summaries.push_back(stats::summarize(ds.columns()[idx].present_numbers()));
    }
    const std::vector<std::string> row_labels = {"count", "mean", "std", "min", "25%", "50%", "75%", "max"};
    std::vector<std::vector<std::string>> cells(row_labels.size());
    for (const auto& s : summaries) {
        const double values[] = {static_cast<double>(s.count), s.mean, s.stddev, s.min, s.q25, s.median, s.q75, s.max};
        for (size_t r = 0; r < row_labels.size(); ++r) {
            cells[r].push_back(stats::format_fixed(values[r], 6));
        }
    }
    return render_table(row_labels, col_labels, cells);
}

json describe_json(const stats::NumericSummary& s) {
    return json{
        {"count", s.count}, {"mean", s.mean}, {"std", s.stddev}, {"min", s.min},
        {"25%", s.q25}, {"50%", s.median}, {"75%", s.q75}, {"max", s.max}
    };
}

std::vector<std::vector<double>> correlation_matrix(const Dataset& ds, const std::vector<size_t>& numeric) {
    std::vector<std::vector<double>> m(numeric.size(), std::vector<double>(numeric.size(), 1.0));
    for (size_t i = 0; i < numeric.size(); ++i) {
        const auto& a = ds.columns()[numeric[i]];
        for (size_t j = i; j < numeric.size(); ++j) {
            const auto& b = ds.columns()[numeric[j]];
            double r = stats::pearson(a.numbers, a.missing, b.numbers, b.missing);
            m[i][j] = r;
            m[j][i] = r;
        }
    }
    return m;
}

json correlation_json(const Dataset& ds, const std::vector<size_t>& numeric,
                      const std::vector<std::vector<double>>& m) {
    json out = json::object();
    for (size_t i = 0; i < numeric.size(); ++i) {
        json row = json::object();
        for (size_t j = 0; j < numeric.size(); ++j) {
            row[ds.columns()[numeric[j]].name] = m[i][j];
        }
        out[ds.columns()[numeric[i]].name] = row;
    }
    return out;
}

std::vector<std::string> names_of(const Dataset& ds, const std::vector<size_t>& indices) {
    std::vector<std::string> names;
    for (size_t idx : indices) names.push_back(ds.columns()[idx].name);
    return names;
}

std::map<std::string, std::string> dtypes_of(const Dataset& ds, const std::vector<size_t>& indices) {
    std::map<std::string, std::string> out;
    for (size_t idx : indices) out[ds.columns()[idx].name] = ds.columns()[idx].dtype;
    return out;
}

DataChunk make_chunk(const std::string& type, std::string content) {
    DataChunk chunk;
    chunk.id = generate_uuid4();
    chunk.chunk_type = type;
    chunk.content = std::move(content);
    return chunk;
}

} // namespace

std::string generate_uuid4() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t high = dis(gen);
    uint64_t low = dis(gen);
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<uint32_t>(high >> 32),
                  static_cast<uint16_t>(high >> 16),
                  static_cast<uint16_t>(high),
                  static_cast<uint16_t>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return buf;
}

json DataChunk::to_json() const {
    return json{
        {"id", id},
        {"content", content},
        {"chunk_type", chunk_type},
        {"variables", variables},
        {"data_types", data_types},
        {"statistical_context", statistical_context},
        {"metadata", metadata}
    };
}

DataChunk DataChunk::from_json(const json& j) {
    DataChunk chunk;
    chunk.id = j.value("id", "");
    chunk.content = j.value("content", "");
    chunk.chunk_type = j.value("chunk_type", "");
    chunk.variables = j.value("variables", std::vector<std::string>{});
    chunk.data_types = j.value("data_types", std::map<std::string, std::string>{});
    chunk.statistical_context = j.value("statistical_context", json::object());
    chunk.metadata = j.value("metadata", json::object());
    return chunk;
}

bool DataChunker::is_domain_column(const std::string& column_name) {
    const std::string lower = to_lower(column_name);
    for (const auto& word : patterns::domain_column_vocabulary()) {
        if (lower.find(word) != std::string::npos) return true;
    }
    return false;
}

std::vector<DataChunk> DataChunker::chunk(const Dataset& dataset, std::size_t row_chunk_size) const {
    std::vector<DataChunk> chunks;

    const std::vector<std::pair<const char*, std::function<std::vector<DataChunk>()>>> strategies = {
        {"row", [&] { return create_row_chunks(dataset, row_chunk_size); }},
        {"column", [&] { return create_column_chunks(dataset); }},
        {"statistical", [&] { return create_statistical_chunks(dataset); }},
        {"correlation", [&] { return create_correlation_chunks(dataset); }},
    };

    for (const auto& [name, strategy] : strategies) {
        try {
            auto produced = strategy();
            chunks.insert(chunks.end(), std::make_move_iterator(produced.begin()),
                          std::make_move_iterator(produced.end()));
        } catch (const std::exception& e) {
            spdlog::warn("Chunking strategy '{}' failed: {}", name, e.what());
        }
    }

    spdlog::debug("Chunked dataset ({} rows, {} columns) into {} chunks",
                  dataset.row_count(), dataset.column_count(), chunks.size());
    return chunks;
}

std::vector<DataChunk> DataChunker::create_row_chunks(const Dataset& dataset, std::size_t row_chunk_size) const {
    if (row_chunk_size == 0) throw std::invalid_argument("row_chunk_size must be positive");

    std::vector<DataChunk> chunks;
    const size_t n = dataset.row_count();
    for (size_t start = 0; start < n; start += row_chunk_size) {
        Dataset group = dataset.slice(start, start + row_chunk_size);
        const size_t rows = group.row_count();
        auto numeric = group.numeric_column_indices();
        auto categorical = group.categorical_column_indices();

        std::string content = fmt::format("Data subset from rows {} to {}:\n\n", start, start + rows - 1);
        content += "Sample statistics:\n";

        json means = json::object(), stds = json::object(), mins = json::object(), maxs = json::object();
        for (size_t idx : numeric) {
            const auto& col = group.columns()[idx];
            auto s = stats::summarize(col.present_numbers());
            content += fmt::format("- {}: mean={}, std={}\n", col.name,
                                   stats::format_fixed(s.mean, 2), stats::format_fixed(s.stddev, 2));
            means[col.name] = s.mean;
            stds[col.name] = s.stddev;
            mins[col.name] = s.min;
            maxs[col.name] = s.max;
        }
        for (size_t idx : categorical) {
            const auto& col = group.columns()[idx];
            content += fmt::format("- {}: {}\n", col.name,
                                   render_counts(stats::value_counts(col.present_text()), kRowCategoryTop));
        }

        std::vector<std::string> row_labels;
        std::vector<std::vector<std::string>> cells;
        for (size_t r = 0; r < std::min(kSampleRows, rows); ++r) {
            row_labels.push_back(std::to_string(start + r));
            std::vector<std::string> row;
            for (const auto& col : group.columns()) row.push_back(col.cell_text(r));
            cells.push_back(std::move(row));
        }
        content += "\nSample data:\n" + render_table(row_labels, group.column_names(), cells);

        DataChunk chunk = make_chunk(chunk_types::kRowGroup, std::move(content));
        chunk.variables = group.column_names();
        chunk.data_types = group.dtypes();
        chunk.statistical_context = {
            {"row_count", rows},
            {"column_count", group.column_count()},
            {"missing_values", group.total_missing()},
            {"numeric_columns", numeric.size()},
            {"categorical_columns", categorical.size()}
        };
        if (!numeric.empty()) {
            chunk.statistical_context["numeric_stats"] = {
                {"means", means}, {"stds", stds}, {"mins", mins}, {"maxs", maxs}
            };
        }
        chunk.metadata = {
            {"start_row", start},
            {"end_row", start + rows},
            {"row_count", rows},
            {"chunk_index", start / row_chunk_size}
        };
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

std::vector<DataChunk> DataChunker::create_column_chunks(const Dataset& dataset) const {
    std::vector<size_t> domain;
    for (size_t i = 0; i < dataset.column_count(); ++i) {
        if (is_domain_column(dataset.columns()[i].name)) domain.push_back(i);
    }

    const std::vector<std::pair<std::vector<size_t>, std::string>> groups = {
        {dataset.numeric_column_indices(), "numeric"},
        {dataset.categorical_column_indices(), "categorical"},
        {domain, "medical"},
    };

    std::vector<DataChunk> chunks;
    for (const auto& [indices, group_name] : groups) {
        if (indices.empty()) continue;

        std::string content = title_case(group_name) + " variables analysis:\n\n";
        json numeric_means = json::object(), numeric_stds = json::object();
        json categorical_stats = json::object();
        std::vector<size_t> numeric_in_group;
        size_t missing_total = 0;

        for (size_t idx : indices) {
            const auto& col = dataset.columns()[idx];
            content += "Variable: " + col.name + "\n";
            content += "Type: " + col.dtype + "\n";
            if (col.is_numeric()) {
                auto s = stats::summarize(col.present_numbers());
                content += fmt::format("Range: {} to {}\n", stats::format_fixed(s.min, 2), stats::format_fixed(s.max, 2));
                content += fmt::format("Mean: {}, Std: {}\n", stats::format_fixed(s.mean, 2), stats::format_fixed(s.stddev, 2));
                numeric_means[col.name] = s.mean;
                numeric_stds[col.name] = s.stddev;
                numeric_in_group.push_back(idx);
            } else {
                auto present = col.present_text();
                auto counts = stats::value_counts(present);
                content += "Categories: " + render_list(counts, kColumnCategoryTop) + "\n";
                if (!counts.empty()) {
                    content += fmt::format("Most frequent: {} ({} occurrences)\n", counts.front().first, counts.front().second);
                }
                auto m = stats::mode(present);
                categorical_stats[col.name] = {
                    {"unique_count", counts.size()},
                    {"most_frequent", m ? json(*m) : json(nullptr)}
                };
            }
            content += fmt::format("Missing values: {}\n\n", col.missing_count());
            missing_total += col.missing_count();
        }

        DataChunk chunk = make_chunk(chunk_types::kColumnGroup, std::move(content));
        chunk.variables = names_of(dataset, indices);
        chunk.data_types = dtypes_of(dataset, indices);
        chunk.statistical_context = {
            {"column_count", indices.size()},
            {"total_values", indices.size() * dataset.row_count()},
            {"missing_values", missing_total}
        };
        if (!numeric_in_group.empty()) {
            json correlations = json::object();
            if (numeric_in_group.size() > 1) {
                correlations = correlation_json(dataset, numeric_in_group, correlation_matrix(dataset, numeric_in_group));
            }
            chunk.statistical_context["numeric_stats"] = {
                {"means", numeric_means}, {"stds", numeric_stds}, {"correlations", correlations}
            };
        }
        if (!categorical_stats.empty()) {
            chunk.statistical_context["categorical_stats"] = categorical_stats;
        }
        chunk.metadata = {
            {"group_type", group_name},
            {"column_count", indices.size()},
            {"medical_context", group_name == "medical"}
        };
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

std::vector<DataChunk> DataChunker::create_statistical_chunks(const Dataset& dataset) const {
    auto numeric = dataset.numeric_column_indices();
    auto categorical = dataset.categorical_column_indices();

    // dtype label -> column count, most common first
    stats::ValueCounts dtype_counts;
    {
        std::vector<std::string> labels;
        for (const auto& col : dataset.columns()) labels.push_back(col.dtype);
        dtype_counts = stats::value_counts(labels);
    }

    std::string content = "Comprehensive Dataset Statistical Summary:\n\n";
    content += fmt::format("Dataset shape: {} rows, {} columns\n", dataset.row_count(), dataset.column_count());
    content += "Data types: " + render_counts(dtype_counts, dtype_counts.size()) + "\n";
    content += fmt::format("Missing values: {} total\n\n", dataset.total_missing());

    if (!numeric.empty()) {
        content += "Numeric Variables Summary:\n" + describe_table(dataset, numeric) + "\n\n";
    }
    if (!categorical.empty()) {
        content += "Categorical Variables Summary:\n";
        for (size_t idx : categorical) {
            const auto& col = dataset.columns()[idx];
            content += fmt::format("- {}: {} unique values\n", col.name, stats::unique_count(col.present_text()));
        }
        content += "\n";
    }

    json missing = json::object();
    for (const auto& col : dataset.columns()) missing[col.name] = col.missing_count();

    DataChunk chunk = make_chunk(chunk_types::kStatisticalSummary, std::move(content));
    chunk.variables = dataset.column_names();
    chunk.data_types = dataset.dtypes();
    chunk.statistical_context = {
        {"dataset_shape", {dataset.row_count(), dataset.column_count()}},
        {"data_types", dataset.dtypes()},
        {"missing_values", missing}
    };

    if (!numeric.empty()) {
        json descriptive = json::object();
        for (size_t idx : numeric) {
            const auto& col = dataset.columns()[idx];
            descriptive[col.name] = describe_json(stats::summarize(col.present_numbers()));
        }
        chunk.statistical_context["descriptive_stats"] = descriptive;
        if (numeric.size() > 1) {
            chunk.statistical_context["correlation_matrix"] =
                correlation_json(dataset, numeric, correlation_matrix(dataset, numeric));
        }
    }

    if (!categorical.empty()) {
        json categorical_stats = json::object();
        for (size_t idx : categorical) {
            const auto& col = dataset.columns()[idx];
            auto counts = stats::value_counts(col.present_text());
            json value_counts = json::object();
            for (const auto& [value, count] : counts) value_counts[value] = count;
            categorical_stats[col.name] = {{"unique_count", counts.size()}, {"value_counts", value_counts}};
        }
        chunk.statistical_context["categorical_stats"] = categorical_stats;
    }

    chunk.metadata = {
        {"summary_type", "comprehensive"},
        {"includes_all_variables", true}
    };
    return {chunk};
}

std::vector<DataChunk> DataChunker::create_correlation_chunks(const Dataset& dataset) const {
    auto numeric = dataset.numeric_column_indices();
    if (numeric.size() <= 1) return {};

    auto names = names_of(dataset, numeric);
    auto matrix = correlation_matrix(dataset, numeric);

    json strong = json::array();
    std::string strong_text;
    for (size_t i = 0; i < numeric.size(); ++i) {
        for (size_t j = i + 1; j < numeric.size(); ++j) {
            double r = matrix[i][j];
            if (std::fabs(r) > kStrongCorrelationThreshold) {
                strong.push_back({{"var1", names[i]}, {"var2", names[j]}, {"correlation", r}});
                strong_text += fmt::format("- {} ↔ {}: {:.3f}\n", names[i], names[j], r);
            }
        }
    }

    std::string content = "Correlation Analysis:\n\n";
    if (!strong.empty()) {
        content += "Strong correlations (|r| > 0.5):\n" + strong_text;
    } else {
        content += "No strong correlations found (|r| > 0.5)\n";
    }

    std::vector<std::vector<std::string>> cells;
    for (const auto& row : matrix) {
        std::vector<std::string> rendered;
        for (double r : row) rendered.push_back(stats::format_fixed(r, 6));
        cells.push_back(std::move(rendered));
    }
    content += "\nCorrelation matrix:\n" + render_table(names, names, cells);

    DataChunk chunk = make_chunk(chunk_types::kCorrelationMatrix, std::move(content));
    chunk.variables = names;
    chunk.data_types = dtypes_of(dataset, numeric);
    chunk.statistical_context = {
        {"correlation_matrix", correlation_json(dataset, numeric, matrix)},
        {"strong_correlations", strong}
    };
    chunk.metadata = {
        {"analysis_type", "correlation"},
        {"variable_count", numeric.size()}
    };
    return {chunk};
}

} // namespace data_assistance
