#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "dataset.hpp"
#include "embedding_service.hpp"
#include "errors.hpp"
#include "faiss_vector_store.hpp"
#include "LogManager.hpp"
#include "retrieval_engine.hpp"
#include "service_config.hpp"
#include "SystemMonitor.hpp"

using json = nlohmann::json;
using namespace data_assistance;

namespace {

Deadline deadline_from_ms(long long timeout_ms) {
    if (timeout_ms <= 0) return std::nullopt;
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(json{{"error", message}}.dump(), "application/json");
}

// Runs a handler body and maps exceptions to HTTP status codes.
template <typename Fn>
void guarded(httplib::Response& res, Fn&& fn) {
    try {
        fn();
    } catch (const NotFoundError& e) {
        send_error(res, 404, e.what());
    } catch (const DatasetError& e) {
        send_error(res, 400, e.what());
    } catch (const EmbeddingError& e) {
        send_error(res, 502, e.what());
    } catch (const TimeoutError& e) {
        send_error(res, 504, e.what());
    } catch (const json::exception& e) {
        send_error(res, 400, std::string("Invalid JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        send_error(res, 400, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Request failed: {}", e.what());
        send_error(res, 500, e.what());
    }
}

} // namespace

class DataAssistanceServer {
public:
    explicit DataAssistanceServer(const ServiceConfig& config)
        : config_(config),
          server_()
    {
        auto embedder = make_embedding_provider(config_.embedding);
        auto store = std::make_shared<FaissVectorStore>(embedder->dimension(), config_.index);
        engine_ = std::make_shared<RetrievalEngine>(store, embedder, config_.retrieval);
        setup_routes();
    }

    bool run() {
        spdlog::info("Starting Data Assistance backend on {}:{}", config_.server.host, config_.server.port);
        return server_.listen(config_.server.host, config_.server.port);
    }

private:
    ServiceConfig config_;
    httplib::Server server_;
    std::shared_ptr<RetrievalEngine> engine_;

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/api/admin/telemetry", [](const httplib::Request&, httplib::Response& res) {
            json response = {
                {"metrics", SystemMonitor::get_latest_snapshot().to_json()},
                {"logs", LogManager::instance().get_logs_json()}
            };
            res.set_content(response.dump(), "application/json");
        });

        server_.Post("/sessions/:session_id/dataset", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&] { handle_ingest(req, res); });
        });

        server_.Post("/sessions/:session_id/query", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&] { handle_query(req, res); });
        });

        server_.Get("/sessions/:session_id", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&] {
                auto info = engine_->info(req.path_params.at("session_id"));
                res.set_content(info ? info->to_json().dump() : json::object().dump(), "application/json");
            });
        });

        server_.Delete("/sessions/:session_id", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&] {
                bool ok = engine_->delete_session(req.path_params.at("session_id"));
                res.set_content(json{{"success", ok}}.dump(), "application/json");
            });
        });

        server_.Get("/collections", [this](const httplib::Request&, httplib::Response& res) {
            guarded(res, [&] {
                json list = json::array();
                for (const auto& info : engine_->list_collections()) list.push_back(info.to_json());
                res.set_content(json{{"collections", list}}.dump(), "application/json");
            });
        });

        server_.Post("/classify", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&] {
                auto body = json::parse(req.body);
                std::string query = body.at("query").get<std::string>();
                res.set_content(engine_->classify(query).to_json().dump(), "application/json");
            });
        });
    }

    void handle_ingest(const httplib::Request& req, httplib::Response& res) {
        auto session_id = req.path_params.at("session_id");
        std::string filename = req.has_param("filename") ? req.get_param_value("filename") : "dataset.csv";

        std::optional<std::size_t> row_chunk_size;
        if (req.has_param("row_chunk_size")) {
            long long size = std::stoll(req.get_param_value("row_chunk_size"));
            if (size <= 0) throw std::invalid_argument("row_chunk_size must be positive");
            row_chunk_size = static_cast<std::size_t>(size);
        }
        Deadline deadline;
        if (req.has_param("timeout_ms")) deadline = deadline_from_ms(std::stoll(req.get_param_value("timeout_ms")));

        spdlog::info("Dataset upload for session {}: {} ({} bytes)", session_id, filename, req.body.size());

        auto dataset = Dataset::from_csv_string(req.body);
        if (dataset.empty()) throw DatasetError("uploaded file has no rows");

        auto collection = engine_->ingest(session_id, dataset, filename, deadline, row_chunk_size);
        auto info = engine_->info(session_id);

        res.set_content(json{
            {"collection", collection},
            {"chunk_count", info ? info->count : 0},
            {"preview", dataset.preview()}
        }.dump(), "application/json");
    }

    void handle_query(const httplib::Request& req, httplib::Response& res) {
        auto session_id = req.path_params.at("session_id");
        auto body = json::parse(req.body);

        std::string query = body.at("query").get<std::string>();
        int top_k = body.value("top_k", config_.retrieval.default_top_k);
        Deadline deadline = deadline_from_ms(body.value("timeout_ms", 0LL));

        auto result = engine_->query(session_id, query, top_k, deadline);
        res.set_content(result.to_json().dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    try {
        ServiceConfig config = argc > 1 ? ServiceConfig::load(argv[1]) : ServiceConfig::discover();
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        DataAssistanceServer server(config);
        if (!server.run()) {
            spdlog::error("Cannot listen on {}:{}", config.server.host, config.server.port);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("Startup failed: {}", e.what());
        return 1;
    }
    return 0;
}
