#pragma once
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <unordered_map>

#include "docqa_core/errors.hpp"
#include "docqa_core/services/qa_service.hpp"
#include "server.hpp"

namespace docqa_core {
class IngestionService;
}  // namespace docqa_core

namespace docqa_api {

struct ChunkingDefaults {
  size_t chunk_size = 1000;
  size_t chunk_overlap = 200;
};

class Routes {
 public:
  Routes(std::shared_ptr<docqa_core::IngestionService> ingestion_service,
         std::shared_ptr<docqa_core::QaService> qa_service,
         std::string vector_backend,
         std::string embedding_provider,
         ChunkingDefaults chunking = {});
  ~Routes();

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Cancels every running stream and waits for their threads to finish
  void shutdown_streams();

  static int status_for(docqa_core::ErrorKind kind);

 private:
  // One WebSocket connection; at most one question streams at a time
  struct StreamConnection {
    docqa_core::OwnerId owner_id = 0;
    std::mutex mutex;
    bool closed = false;
    std::shared_ptr<docqa_core::StreamingSession> session;
  };

  std::shared_ptr<docqa_core::IngestionService> ingestion_service_;
  std::shared_ptr<docqa_core::QaService> qa_service_;
  std::string vector_backend_;
  std::string embedding_provider_;
  ChunkingDefaults chunking_;

  std::mutex streams_mutex_;
  std::condition_variable streams_cv_;
  std::unordered_map<void *, std::shared_ptr<StreamConnection>> connections_;
  int running_streams_ = 0;
  bool accepting_streams_ = true;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_upload_document(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_delete_document(const crow::request &req, int64_t document_id);
  crow::response handle_delete_all(const crow::request &req);
  crow::response handle_ask(const crow::request &req);
  crow::response handle_history(const crow::request &req);
  crow::response handle_usage(const crow::request &req);

  // WebSocket handlers
  bool accept_stream(const crow::request &req, void **userdata);
  void handle_stream_message(crow::websocket::connection &conn, const std::string &data);
  void close_stream(crow::websocket::connection &conn, const std::string &reason);

  // Helper methods
  static std::optional<docqa_core::OwnerId> owner_from_request(const crow::request &req);
  static docqa_core::QuestionRequest parse_question(docqa_core::OwnerId owner_id,
                                                    const nlohmann::json &body);
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error, const std::string &kind = "");
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_error_json(const docqa_core::DocqaError &error);
};

}  // namespace docqa_api
