#include "dataset.hpp"
#include "errors.hpp"
#include "stats_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <unordered_set>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace data_assistance {

using json = nlohmann::json;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const std::unordered_set<std::string> kMissingTokens = {
    "", "NA", "N/A", "NaN", "nan", "null", "NULL", "None", "#N/A"
};

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Digits only, and within the int64 range.
bool is_integer_token(const std::string& s) {
    size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    errno = 0;
    std::strtoll(s.c_str(), nullptr, 10);
    return errno != ERANGE;
}

// [-2^63, 2^63): the doubles that convert to long long without overflow.
bool fits_int64(double v) {
    return v >= -9223372036854775808.0 && v < 9223372036854775808.0;
}

bool parse_number(const std::string& s, double& out) {
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end != begin + s.size() || errno == ERANGE) return false;
    out = v;
    return true;
}

// Splits CSV text into records. Quotes follow RFC 4180 ("" inside a quoted
// field is a literal quote); blank lines are skipped.
std::vector<std::vector<std::string>> tokenize_csv(const std::string& text, char delimiter) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;

    auto end_field = [&]() {
        record.push_back(field_quoted ? field : trim(field));
        field.clear();
        field_quoted = false;
    };
    auto end_record = [&]() {
        end_field();
        bool blank = record.size() == 1 && record[0].empty();
        if (!blank) records.push_back(std::move(record));
        record.clear();
    };

    size_t i = 0;
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

    for (; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }
        if (c == '"' && trim(field).empty()) {
            field.clear();
            in_quotes = true;
            field_quoted = true;
        } else if (c == delimiter) {
            end_field();
        } else if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            end_record();
        } else if (c == '\n') {
            end_record();
        } else {
            field += c;
        }
    }
    if (in_quotes) throw DatasetError("unterminated quoted field");
    if (!field.empty() || field_quoted || !record.empty()) end_record();
    return records;
}

std::vector<std::string> normalize_header(const std::vector<std::string>& raw) {
    std::vector<std::string> header;
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < raw.size(); ++i) {
        std::string name = raw[i].empty() ? "Unnamed: " + std::to_string(i) : raw[i];
        std::string candidate = name;
        for (int suffix = 1; seen.count(candidate); ++suffix) {
            candidate = name + "." + std::to_string(suffix);
        }
        seen.insert(candidate);
        header.push_back(candidate);
    }
    return header;
}

Column infer_column(const std::string& name, const std::vector<std::string>& cells) {
    Column col;
    col.name = name;
    col.missing.resize(cells.size(), 0);

    bool numeric = !cells.empty();
    bool integral = true;
    std::vector<double> numbers(cells.size(), kNaN);
    for (size_t r = 0; r < cells.size(); ++r) {
        if (kMissingTokens.count(cells[r])) {
            col.missing[r] = 1;
            integral = false;
            continue;
        }
        double v = 0.0;
        if (!parse_number(cells[r], v)) {
            numeric = false;
            break;
        }
        numbers[r] = v;
        if (!is_integer_token(cells[r]) || !fits_int64(v)) integral = false;
    }

    if (numeric) {
        col.type = ColumnType::Numeric;
        col.dtype = integral ? "int64" : "float64";
        col.numbers = std::move(numbers);
    } else {
        col.type = ColumnType::Categorical;
        col.dtype = "object";
        col.text.resize(cells.size());
        for (size_t r = 0; r < cells.size(); ++r) {
            col.missing[r] = kMissingTokens.count(cells[r]) ? 1 : 0;
            if (!col.missing[r]) col.text[r] = cells[r];
        }
    }
    return col;
}

} // namespace

size_t Column::missing_count() const {
    return static_cast<size_t>(std::count(missing.begin(), missing.end(), uint8_t{1}));
}

std::vector<double> Column::present_numbers() const {
    std::vector<double> out;
    if (!is_numeric()) return out;
    out.reserve(numbers.size());
    for (size_t i = 0; i < numbers.size(); ++i) {
        if (!missing[i]) out.push_back(numbers[i]);
    }
    return out;
}

std::vector<std::string> Column::present_text() const {
    std::vector<std::string> out;
    if (is_numeric()) return out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (!missing[i]) out.push_back(text[i]);
    }
    return out;
}

std::string Column::cell_text(size_t row) const {
    if (row >= size() || missing[row]) return "NaN";
    if (!is_numeric()) return text[row];
    if (dtype == "int64") return fmt::format("{}", static_cast<long long>(numbers[row]));
    return fmt::format("{}", numbers[row]);
}

Dataset Dataset::from_csv(std::istream& is, char delimiter) {
    std::string text((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    auto records = tokenize_csv(text, delimiter);
    if (records.empty()) throw DatasetError("CSV input has no header row");

    auto header = normalize_header(records.front());
    const size_t width = header.size();
    std::vector<std::vector<std::string>> cells(width);
    for (size_t r = 1; r < records.size(); ++r) {
        const auto& rec = records[r];
        if (rec.size() > width) {
            throw DatasetError(fmt::format("row {} has {} fields, expected {}", r, rec.size(), width));
        }
        for (size_t c = 0; c < width; ++c) {
            cells[c].push_back(c < rec.size() ? rec[c] : "");
        }
    }

    Dataset ds;
    for (size_t c = 0; c < width; ++c) {
        ds.append_column(infer_column(header[c], cells[c]));
    }
    ds.row_count_ = records.size() - 1;
    spdlog::debug("Parsed CSV: {} rows x {} columns", ds.row_count_, width);
    return ds;
}

Dataset Dataset::from_csv_string(const std::string& text, char delimiter) {
    std::istringstream ss(text);
    return from_csv(ss, delimiter);
}

Dataset Dataset::from_csv_file(const std::string& path, char delimiter) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) throw DatasetError("cannot open " + path);
    return from_csv(f, delimiter);
}

void Dataset::add_numeric_column(const std::string& name, std::vector<double> values) {
    Column col;
    col.name = name;
    col.type = ColumnType::Numeric;
    col.missing.resize(values.size(), 0);
    bool integral = true;
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i])) {
            col.missing[i] = 1;
            integral = false;
        } else if (!fits_int64(values[i]) || values[i] != std::floor(values[i])) {
            integral = false;
        }
    }
    col.dtype = integral ? "int64" : "float64";
    col.numbers = std::move(values);
    append_column(std::move(col));
}

void Dataset::add_categorical_column(const std::string& name, std::vector<std::string> values,
                                     MissingMask missing) {
    if (!missing.empty() && missing.size() != values.size()) {
        throw DatasetError("missing mask size mismatch for column " + name);
    }
    Column col;
    col.name = name;
    col.type = ColumnType::Categorical;
    col.dtype = "object";
    col.missing = missing.empty() ? MissingMask(values.size(), 0) : std::move(missing);
    col.text = std::move(values);
    append_column(std::move(col));
}

void Dataset::append_column(Column column) {
    if (find_column(column.name) >= 0) {
        throw DatasetError("duplicate column " + column.name);
    }
    if (columns_.empty()) {
        row_count_ = column.size();
    } else if (column.size() != row_count_) {
        throw DatasetError(fmt::format("column {} has {} rows, expected {}",
                                       column.name, column.size(), row_count_));
    }
    columns_.push_back(std::move(column));
}

const Column& Dataset::column(const std::string& name) const {
    int idx = find_column(name);
    if (idx < 0) throw DatasetError("no column named " + name);
    return columns_[static_cast<size_t>(idx)];
}

int Dataset::find_column(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

std::vector<size_t> Dataset::numeric_column_indices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].is_numeric()) out.push_back(i);
    }
    return out;
}

std::vector<size_t> Dataset::categorical_column_indices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (!columns_[i].is_numeric()) out.push_back(i);
    }
    return out;
}

std::vector<std::string> Dataset::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& c : columns_) names.push_back(c.name);
    return names;
}

Dataset Dataset::slice(size_t begin, size_t end) const {
    end = std::min(end, row_count_);
    begin = std::min(begin, end);
    Dataset out;
    for (const auto& col : columns_) {
        Column part;
        part.name = col.name;
        part.type = col.type;
        part.dtype = col.dtype;
        part.missing.assign(col.missing.begin() + begin, col.missing.begin() + end);
        if (col.is_numeric()) {
            part.numbers.assign(col.numbers.begin() + begin, col.numbers.begin() + end);
        } else {
            part.text.assign(col.text.begin() + begin, col.text.begin() + end);
        }
        out.columns_.push_back(std::move(part));
    }
    out.row_count_ = end - begin;
    return out;
}

size_t Dataset::total_missing() const {
    size_t total = 0;
    for (const auto& c : columns_) total += c.missing_count();
    return total;
}

std::map<std::string, std::string> Dataset::dtypes() const {
    std::map<std::string, std::string> out;
    for (const auto& c : columns_) out[c.name] = c.dtype;
    return out;
}

json Dataset::preview(size_t head_rows) const {
    json head = json::array();
    for (size_t r = 0; r < std::min(head_rows, row_count_); ++r) {
        json row = json::object();
        for (const auto& c : columns_) {
            if (c.missing[r]) row[c.name] = nullptr;
            else if (c.is_numeric()) row[c.name] = c.numbers[r];
            else row[c.name] = c.text[r];
        }
        head.push_back(row);
    }

    json null_counts = json::object();
    json describe = json::object();
    for (const auto& c : columns_) {
        null_counts[c.name] = c.missing_count();
        if (!c.is_numeric()) continue;
        auto s = stats::summarize(c.present_numbers());
        describe[c.name] = {
            {"count", s.count}, {"mean", s.mean}, {"std", s.stddev}, {"min", s.min},
            {"25%", s.q25}, {"50%", s.median}, {"75%", s.q75}, {"max", s.max}
        };
    }

    return json{
        {"columns", column_names()},
        {"shape", {row_count_, columns_.size()}},
        {"head", head},
        {"dtypes", dtypes()},
        {"null_counts", null_counts},
        {"describe", describe}
    };
}

} // namespace data_assistance
