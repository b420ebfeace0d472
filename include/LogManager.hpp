#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace data_assistance {

struct QueryLog {
    long long timestamp;       // unix seconds
    std::string session_id;
    std::string query;
    std::string query_type;
    double confidence;
    std::size_t result_count;
    double duration_ms;
};

class LogManager {
public:
    static constexpr std::size_t kMaxEntries = 50;

    // Singleton access
    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const QueryLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kMaxEntries) {
            logs_.pop_front();
        }
    }

    std::size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

    nlohmann::json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        // Newest first
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"session_id", it->session_id},
                {"query", it->query},
                {"query_type", it->query_type},
                {"confidence", it->confidence},
                {"result_count", it->result_count},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

private:
    LogManager() {}
    std::deque<QueryLog> logs_;
    std::mutex mtx_;
};

} // namespace data_assistance
