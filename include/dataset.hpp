#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace data_assistance {

enum class ColumnType { Numeric, Categorical };

using MissingMask = std::vector<uint8_t>;

struct Column {
    std::string name;
    ColumnType type = ColumnType::Categorical;
    std::string dtype = "object";   // int64 | float64 | object
    std::vector<double> numbers;     // numeric storage, NaN where missing
    std::vector<std::string> text;   // categorical storage, empty where missing
    MissingMask missing;

    bool is_numeric() const { return type == ColumnType::Numeric; }
    std::size_t size() const { return missing.size(); }
    std::size_t missing_count() const;

    std::vector<double> present_numbers() const;
    std::vector<std::string> present_text() const;

    // Display form of one cell ("NaN" when missing).
    std::string cell_text(std::size_t row) const;
};

class Dataset {
public:
    Dataset() = default;

    /**
     * Parses CSV with a header row. Quoted fields, embedded newlines, a UTF-8
     * BOM and CRLF line endings are accepted. Short rows are padded with
     * missing values.
     * @throws DatasetError when a row has more fields than the header or the
     *         header is absent.
     */
    static Dataset from_csv(std::istream& is, char delimiter = ',');
    static Dataset from_csv_string(const std::string& text, char delimiter = ',');
    static Dataset from_csv_file(const std::string& path, char delimiter = ',');

    // NaN entries are recorded as missing.
    void add_numeric_column(const std::string& name, std::vector<double> values);
    void add_categorical_column(const std::string& name, std::vector<std::string> values,
                                MissingMask missing = {});

    std::size_t row_count() const noexcept { return row_count_; }
    std::size_t column_count() const noexcept { return columns_.size(); }
    bool empty() const noexcept { return columns_.empty() || row_count_ == 0; }

    const std::vector<Column>& columns() const noexcept { return columns_; }
    const Column& column(const std::string& name) const;
    int find_column(const std::string& name) const;

    std::vector<std::size_t> numeric_column_indices() const;
    std::vector<std::size_t> categorical_column_indices() const;
    std::vector<std::string> column_names() const;

    // Rows [begin, end), clamped to the row count.
    Dataset slice(std::size_t begin, std::size_t end) const;

    std::size_t total_missing() const;
    std::map<std::string, std::string> dtypes() const;

    // Upload preview: columns, shape, head rows, dtypes, null counts, describe.
    nlohmann::json preview(std::size_t head_rows = 5) const;

private:
    void append_column(Column column);

    std::size_t row_count_ = 0;
    std::vector<Column> columns_;
};

} // namespace data_assistance
