#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "dataset.hpp"

namespace data_assistance {

namespace chunk_types {
inline const std::string kRowGroup = "row_group";
inline const std::string kColumnGroup = "column_group";
inline const std::string kStatisticalSummary = "statistical_summary";
inline const std::string kCorrelationMatrix = "correlation_matrix";
} // namespace chunk_types

struct DataChunk {
    std::string id;
    std::string content;
    std::string chunk_type;
    std::vector<std::string> variables;
    std::map<std::string, std::string> data_types;
    nlohmann::json statistical_context = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json to_json() const;
    static DataChunk from_json(const nlohmann::json& j);
};

// Random (version 4) UUID string.
std::string generate_uuid4();

// |r| above which a variable pair is listed as a strong correlation.
constexpr double kStrongCorrelationThreshold = 0.5;

class DataChunker {
public:
    static constexpr std::size_t kDefaultRowChunkSize = 100;

    /**
     * Runs all four strategies (row groups, column groups, statistical
     * summary, correlation matrix) and concatenates their chunks in that order.
     * A strategy that throws is logged and skipped; the others still run.
     */
    std::vector<DataChunk> chunk(const Dataset& dataset,
                                 std::size_t row_chunk_size = kDefaultRowChunkSize) const;

    std::vector<DataChunk> create_row_chunks(const Dataset& dataset, std::size_t row_chunk_size) const;
    std::vector<DataChunk> create_column_chunks(const Dataset& dataset) const;
    std::vector<DataChunk> create_statistical_chunks(const Dataset& dataset) const;
    std::vector<DataChunk> create_correlation_chunks(const Dataset& dataset) const;

    static bool is_domain_column(const std::string& column_name);
};

} // namespace data_assistance
