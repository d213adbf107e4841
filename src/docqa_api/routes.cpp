#include "docqa_api/routes.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "docqa_core/services/ingestion_service.hpp"

namespace docqa_api {

namespace {

nlohmann::json document_to_json(const docqa_core::Document &document) {
  nlohmann::json doc;
  doc["id"] = document.id;
  doc["filename"] = document.filename;
  doc["content_hash"] = document.content_hash;
  doc["chunk_count"] = document.chunk_count;
  doc["file_size"] = document.file_size;
  doc["created_at"] = docqa_core::DocumentStore::time_point_to_string(document.created_at);
  return doc;
}

nlohmann::json query_to_json(const docqa_core::QueryRecord &record) {
  nlohmann::json query;
  query["id"] = record.id;
  query["question"] = record.question;
  query["answer"] = record.answer;
  query["response_time"] = record.response_time_ms;
  query["chunks_used"] = record.chunks_used;
  query["backend"] = record.backend;
  query["created_at"] = docqa_core::DocumentStore::time_point_to_string(record.created_at);
  return query;
}

}  // namespace

Routes::Routes(std::shared_ptr<docqa_core::IngestionService> ingestion_service,
               std::shared_ptr<docqa_core::QaService> qa_service,
               std::string vector_backend,
               std::string embedding_provider,
               ChunkingDefaults chunking)
    : ingestion_service_(std::move(ingestion_service)),
      qa_service_(std::move(qa_service)),
      vector_backend_(std::move(vector_backend)),
      embedding_provider_(std::move(embedding_provider)),
      chunking_(chunking) {}

Routes::~Routes() {
  shutdown_streams();
}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_upload_document(req); });

  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::GET)(
          [this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/documents/<int>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, int64_t document_id) {
        return handle_delete_document(req, document_id);
      });

  // Tenant wipe
  CROW_ROUTE(app, "/data").methods(crow::HTTPMethod::DELETE)([this](const crow::request &req) {
    return handle_delete_all(req);
  });

  CROW_ROUTE(app, "/ask").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ask(req);
  });

  CROW_ROUTE(app, "/history")
  ([this](const crow::request &req) { return handle_history(req); });

  CROW_ROUTE(app, "/usage")
  ([this](const crow::request &req) { return handle_usage(req); });

  CROW_WEBSOCKET_ROUTE(app, "/ask/stream")
      .onaccept([this](const crow::request &req, void **userdata) {
        return accept_stream(req, userdata);
      })
      .onmessage([this](crow::websocket::connection &conn, const std::string &data,
                        bool /*is_binary*/) { handle_stream_message(conn, data); })
      .onclose([this](crow::websocket::connection &conn, const std::string &reason) {
        close_stream(conn, reason);
      });

  std::cout << "All routes registered successfully" << std::endl;
}

int Routes::status_for(docqa_core::ErrorKind kind) {
  switch (kind) {
    case docqa_core::ErrorKind::InvalidParameters:
      return 400;
    case docqa_core::ErrorKind::LimitExceeded:
      return 429;
    case docqa_core::ErrorKind::EmbeddingUnavailable:
    case docqa_core::ErrorKind::IndexUnavailable:
    case docqa_core::ErrorKind::GenerationBackendFailure:
      return 503;
    default:
      return 500;
  }
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Document QA API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  response["vector_backend"] = vector_backend_;
  response["embedding_provider"] = embedding_provider_;
  response["generation_chain"] = qa_service_->describe_chain();
  return create_json_response(response);
}

crow::response Routes::handle_upload_document(const crow::request &req) {
  auto owner_id = owner_from_request(req);
  if (!owner_id) {
    return create_json_response(create_error_response("Missing or invalid X-User-Id header"), 401);
  }
  try {
    auto body = parse_json_body(req.body);
    docqa_core::IngestRequest request;
    request.owner_id = *owner_id;
    request.filename = body.value("filename", std::string("untitled.txt"));
    request.text = body.value("text", std::string(""));
    request.chunking.target_size = body.value("chunk_size", chunking_.chunk_size);
    request.chunking.overlap = body.value("chunk_overlap", chunking_.chunk_overlap);

    std::cout << "Uploading '" << request.filename << "' for owner " << *owner_id << std::endl;
    docqa_core::IngestResult result = ingestion_service_->ingest(request);

    nlohmann::json data;
    data["document_id"] = result.document_id;
    data["chunk_count"] = result.chunk_count;
    data["content_hash"] = result.content_hash;
    data["duplicate"] = result.duplicate;
    return create_json_response(
        create_success_response(result.duplicate ? "Document already uploaded"
                                                 : "Document processed successfully",
                                data),
        result.duplicate ? 200 : 201);
  } catch (const docqa_core::DocqaError &e) {
    return create_error_json(e);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what(), "invalid_parameters"), 400);
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  auto owner_id = owner_from_request(req);
  if (!owner_id) {
    return create_json_response(create_error_response("Missing or invalid X-User-Id header"), 401);
  }
  try {
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &document : ingestion_service_->list_documents(*owner_id)) {
      documents.push_back(document_to_json(document));
    }
    nlohmann::json data;
    data["documents"] = documents;
    data["count"] = documents.size();
    return create_json_response(create_success_response("Documents retrieved successfully", data));
  } catch (const docqa_core::DocqaError &e) {
    return create_error_json(e);
  }
}

crow::response Routes::handle_delete_document(const crow::request &req, int64_t document_id) {
  auto owner_id = owner_from_request(req);
  if (!owner_id) {
    return create_json_response(create_error_response("Missing or invalid X-User-Id header"), 401);
  }
  try {
    std::cout << "Deleting document " << document_id << " for owner " << *owner_id << std::endl;
    if (!ingestion_service_->delete_document(*owner_id, document_id)) {
      return create_json_response(create_error_response("Document not found"), 404);
    }
    return create_json_response(create_success_response("Document deleted successfully"));
  } catch (const docqa_core::DocqaError &e) {
    return create_error_json(e);
  }
}

crow::response Routes::handle_delete_all(const crow::request &req) {
  auto owner_id = owner_from_request(req);
  if (!owner_id) {
    return create_json_response(create_error_response("Missing or invalid X-User-Id header"), 401);
  }
  try {
    const int removed = ingestion_service_->delete_all(*owner_id);
    nlohmann::json data;
    data["documents_removed"] = removed;
    return create_json_response(create_success_response("All user data deleted", data));
  } catch (const docqa_core::DocqaError &e) {
    return create_error_json(e);
  }
}

crow::response Routes::handle_ask(const crow::request &req) {
  auto owner_id = owner_from_request(req);
  if (!owner_id) {
    return create_json_response(create_error_response("Missing or invalid X-User-Id header"), 401);
  }
  try {
    docqa_core::QuestionRequest request = parse_question(*owner_id, parse_json_body(req.body));
    docqa_core::AnswerResult result = qa_service_->answer(request);

    nlohmann::json response;
    response["answer"] = result.answer;
    response["response_time"] = result.elapsed_ms;
    response["chunks_used"] = result.chunk_ids.size();
    response["chunk_ids"] = result.chunk_ids;
    response["backend"] = result.backend;
    nlohmann::json fallbacks = nlohmann::json::array();
    for (const auto &notice : result.fallbacks) {
      fallbacks.push_back({{"failed_backend", notice.failed_backend},
                           {"next_backend", notice.next_backend},
                           {"reason", notice.reason}});
    }
    response["fallbacks"] = fallbacks;
    return create_json_response(response);
  } catch (const docqa_core::DocqaError &e) {
    return create_error_json(e);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what(), "invalid_parameters"), 400);
  }
}

crow::response Routes::handle_history(const crow::request &req) {
  auto owner_id = owner_from_request(req);
  if (!owner_id) {
    return create_json_response(create_error_response("Missing or invalid X-User-Id header"), 401);
  }
  try {
    int limit = 20;
    if (const char *limit_param = req.url_params.get("limit")) {
      try {
        limit = std::stoi(limit_param);
      } catch (const std::exception &) {
        return create_json_response(
            create_error_response("Invalid limit: " + std::string(limit_param),
                                  "invalid_parameters"),
            400);
      }
    }
    nlohmann::json queries = nlohmann::json::array();
    for (const auto &record : qa_service_->history(*owner_id, limit)) {
      queries.push_back(query_to_json(record));
    }
    nlohmann::json data;
    data["queries"] = queries;
    data["count"] = queries.size();
    return create_json_response(create_success_response("History retrieved successfully", data));
  } catch (const docqa_core::DocqaError &e) {
    return create_error_json(e);
  }
}

crow::response Routes::handle_usage(const crow::request &req) {
  auto owner_id = owner_from_request(req);
  if (!owner_id) {
    return create_json_response(create_error_response("Missing or invalid X-User-Id header"), 401);
  }
  try {
    int hours = 24;
    if (const char *hours_param = req.url_params.get("hours")) {
      try {
        hours = std::stoi(hours_param);
      } catch (const std::exception &) {
        return create_json_response(
            create_error_response("Invalid hours: " + std::string(hours_param),
                                  "invalid_parameters"),
            400);
      }
    }
    auto usage = qa_service_->usage(*owner_id, std::chrono::hours(hours));
    nlohmann::json data;
    data["hours"] = hours;
    data["total_queries"] = usage.total_queries;
    data["avg_response_time_ms"] = usage.avg_response_time_ms;
    return create_json_response(create_success_response("Usage retrieved successfully", data));
  } catch (const docqa_core::DocqaError &e) {
    return create_error_json(e);
  }
}

// ============================================================================
// Streaming
// ============================================================================

bool Routes::accept_stream(const crow::request &req, void **userdata) {
  auto owner_id = owner_from_request(req);
  if (!owner_id) {
    std::cerr << "Rejecting stream: missing or invalid X-User-Id header" << std::endl;
    return false;
  }

  auto connection = std::make_shared<StreamConnection>();
  connection->owner_id = *owner_id;

  std::lock_guard<std::mutex> lock(streams_mutex_);
  if (!accepting_streams_) {
    return false;
  }
  connections_[connection.get()] = connection;
  *userdata = connection.get();
  return true;
}

void Routes::handle_stream_message(crow::websocket::connection &conn, const std::string &data) {
  std::shared_ptr<StreamConnection> connection;
  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = connections_.find(conn.userdata());
    if (it == connections_.end() || !accepting_streams_) {
      return;
    }
    connection = it->second;
  }

  auto send_error = [&conn](const std::string &kind, const std::string &message) {
    conn.send_text(docqa_core::StreamEvent::error(kind, message).to_json().dump());
  };

  std::shared_ptr<docqa_core::StreamingSession> session;
  try {
    auto body = nlohmann::json::parse(data);
    session = qa_service_->open_session(parse_question(connection->owner_id, body));
  } catch (const docqa_core::DocqaError &e) {
    send_error(docqa_core::to_string(e.kind()), e.what());
    return;
  } catch (const nlohmann::json::exception &e) {
    send_error("invalid_parameters", e.what());
    return;
  }

  {
    std::lock_guard<std::mutex> lock(connection->mutex);
    if (connection->session) {
      send_error("invalid_parameters", "a question is already streaming on this connection");
      return;
    }
    connection->session = session;
  }
  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    if (!accepting_streams_) {
      std::lock_guard<std::mutex> connection_lock(connection->mutex);
      connection->session.reset();
      return;
    }
    ++running_streams_;
  }

  // Sessions block on the consumer, so each one gets its own thread
  std::thread([this, connection, session, &conn] {
    session->run([connection, &conn](const docqa_core::StreamEvent &event) {
      std::lock_guard<std::mutex> lock(connection->mutex);
      if (connection->closed) {
        return false;
      }
      conn.send_text(event.to_json().dump());
      return true;
    });
    std::cout << "Stream for owner " << connection->owner_id << " ended: "
              << docqa_core::to_string(session->state()) << std::endl;
    {
      std::lock_guard<std::mutex> lock(connection->mutex);
      connection->session.reset();
    }
    std::lock_guard<std::mutex> lock(streams_mutex_);
    --running_streams_;
    streams_cv_.notify_all();
  }).detach();
}

void Routes::close_stream(crow::websocket::connection &conn, const std::string &reason) {
  std::shared_ptr<StreamConnection> connection;
  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = connections_.find(conn.userdata());
    if (it == connections_.end()) {
      return;
    }
    connection = it->second;
    connections_.erase(it);
  }
  std::shared_ptr<docqa_core::StreamingSession> session;
  {
    std::lock_guard<std::mutex> lock(connection->mutex);
    connection->closed = true;
    session = connection->session;
  }
  // The session's sink takes connection->mutex, so cancel outside it
  if (session) {
    std::cout << "Client closed stream (" << reason << "), cancelling" << std::endl;
    session->cancel();
  }
}

void Routes::shutdown_streams() {
  std::unique_lock<std::mutex> lock(streams_mutex_);
  accepting_streams_ = false;
  std::vector<std::shared_ptr<docqa_core::StreamingSession>> running;
  for (auto &entry : connections_) {
    std::lock_guard<std::mutex> connection_lock(entry.second->mutex);
    entry.second->closed = true;
    if (entry.second->session) {
      running.push_back(entry.second->session);
    }
  }
  connections_.clear();
  for (auto &session : running) {
    session->cancel();
  }
  running.clear();
  streams_cv_.wait(lock, [this] { return running_streams_ == 0; });
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<docqa_core::OwnerId> Routes::owner_from_request(const crow::request &req) {
  const std::string header = req.get_header_value("X-User-Id");
  if (header.empty()) {
    return std::nullopt;
  }
  try {
    size_t parsed = 0;
    const long long owner_id = std::stoll(header, &parsed);
    if (parsed != header.size() || owner_id <= 0) {
      return std::nullopt;
    }
    return owner_id;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

docqa_core::QuestionRequest Routes::parse_question(docqa_core::OwnerId owner_id,
                                                   const nlohmann::json &body) {
  docqa_core::QuestionRequest request;
  request.owner_id = owner_id;
  request.question = body.value("question", std::string(""));
  if (body.contains("top_k")) {
    const int top_k = body.at("top_k").get<int>();
    if (top_k <= 0) {
      throw docqa_core::InvalidParametersError("top_k must be positive");
    }
    request.top_k = static_cast<size_t>(top_k);
  }
  if (body.contains("max_context_length")) {
    const int max_length = body.at("max_context_length").get<int>();
    if (max_length <= 0) {
      throw docqa_core::InvalidParametersError("max_context_length must be positive");
    }
    request.max_context_length = static_cast<size_t>(max_length);
  }
  if (body.contains("document_ids")) {
    request.document_ids = body.at("document_ids").get<std::vector<docqa_core::DocumentId>>();
  }
  return request;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

crow::response Routes::create_error_json(const docqa_core::DocqaError &error) {
  const int status = status_for(error.kind());
  if (status >= 500) {
    std::cerr << "Request failed (" << docqa_core::to_string(error.kind()) << "): " << error.what()
              << std::endl;
  }
  return create_json_response(create_error_response(error.what(), docqa_core::to_string(error.kind())),
                              status);
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error, const std::string &kind) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  if (!kind.empty()) {
    response["kind"] = kind;
  }
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace docqa_api
