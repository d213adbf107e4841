#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  std::string metadata_db_path;
  std::string db_key;
  int db_pool_size;

  // Retrieval store: "local", "qdrant" or "elasticsearch"
  std::string vector_backend;

  // Embeddings: "ollama" or "hashing"
  std::string embedding_provider;
  std::string embedding_model;
  int embedding_dimension;

  // Generation backends, tried in this order: ollama, openai, extractive
  bool ollama_enabled;
  std::string ollama_url;
  std::string ollama_model;
  int ollama_timeout_seconds;
  std::string openai_api_key;
  std::string openai_base_url;
  std::string openai_model;
  int openai_timeout_seconds;

  std::string qdrant_url;
  std::string qdrant_api_key;
  std::string qdrant_collection_name;
  int qdrant_timeout_seconds;
  std::string elasticsearch_url;
  std::string elasticsearch_index;
  int elasticsearch_timeout_seconds;

  int chunk_size;
  int chunk_overlap;
  int retrieval_top_k;
  int max_context_length;
  int max_documents_per_user;
  int max_chunks_per_document;
  int max_queries_per_hour;
  int stream_buffer_capacity;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    Config config;

    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8000"));
    config.metadata_db_path =
        json_config.value("metadata_db_path", std::string("./data/docqa.db"));
    config.db_key = json_config.value("db_key", std::string(""));
    config.db_pool_size = int_value(json_config, "db_pool_size", 4);

    config.vector_backend = json_config.value("vector_backend", std::string("local"));

    config.embedding_provider = json_config.value("embedding_provider", std::string("ollama"));
    config.embedding_model = json_config.value("embedding_model", std::string("nomic-embed-text"));
    config.embedding_dimension = int_value(json_config, "embedding_dimension", 768);

    config.ollama_enabled = json_config.value("ollama_enabled", true);
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.ollama_model = json_config.value("ollama_model", std::string("llama2"));
    config.ollama_timeout_seconds = int_value(json_config, "ollama_timeout_seconds", 60);
    config.openai_api_key = json_config.value("openai_api_key", std::string(""));
    config.openai_base_url =
        json_config.value("openai_base_url", std::string("https://api.openai.com/v1"));
    config.openai_model = json_config.value("openai_model", std::string("gpt-3.5-turbo"));
    config.openai_timeout_seconds = int_value(json_config, "openai_timeout_seconds", 60);

    config.qdrant_url = json_config.value("qdrant_url", std::string("http://localhost:6333"));
    config.qdrant_api_key = json_config.value("qdrant_api_key", std::string(""));
    config.qdrant_collection_name =
        json_config.value("qdrant_collection_name", std::string("documents"));
    config.qdrant_timeout_seconds = int_value(json_config, "qdrant_timeout_seconds", 10);
    config.elasticsearch_url =
        json_config.value("elasticsearch_url", std::string("http://localhost:9200"));
    config.elasticsearch_index = json_config.value("elasticsearch_index", std::string("documents"));
    config.elasticsearch_timeout_seconds =
        int_value(json_config, "elasticsearch_timeout_seconds", 10);

    config.chunk_size = int_value(json_config, "chunk_size", 1000);
    config.chunk_overlap = int_value(json_config, "chunk_overlap", 200);
    config.retrieval_top_k = int_value(json_config, "retrieval_top_k", 5);
    config.max_context_length = int_value(json_config, "max_context_length", 4000);
    config.max_documents_per_user = int_value(json_config, "max_documents_per_user", 100);
    config.max_chunks_per_document = int_value(json_config, "max_chunks_per_document", 1000);
    config.max_queries_per_hour = int_value(json_config, "max_queries_per_hour", 100);
    config.stream_buffer_capacity = int_value(json_config, "stream_buffer_capacity", 16);

    config.validate();
    return config;
  }

 private:
  // Integer with default; a value of the wrong type falls back to the default
  static int int_value(const nlohmann::json &json_config, const char *key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const auto &value = json_config.at(key);
    return value.is_number_integer() ? value.get<int>() : fallback;
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be host:port");
    }
    if (metadata_db_path.empty()) {
      throw std::runtime_error("metadata_db_path cannot be empty");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
    if (vector_backend != "local" && vector_backend != "faiss" && vector_backend != "qdrant" &&
        vector_backend != "elasticsearch") {
      throw std::runtime_error("vector_backend must be local, qdrant or elasticsearch");
    }
    if (embedding_provider != "ollama" && embedding_provider != "hashing") {
      throw std::runtime_error("embedding_provider must be ollama or hashing");
    }
    if (embedding_provider == "ollama" && (ollama_url.empty() || embedding_model.empty())) {
      throw std::runtime_error("ollama_url and embedding_model are required for ollama embeddings");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (ollama_enabled && ollama_model.empty()) {
      throw std::runtime_error("ollama_model cannot be empty when ollama_enabled is true");
    }
    if (ollama_timeout_seconds <= 0 || openai_timeout_seconds <= 0 ||
        qdrant_timeout_seconds <= 0 || elasticsearch_timeout_seconds <= 0) {
      throw std::runtime_error("timeouts must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_size)");
    }
    if (retrieval_top_k <= 0) {
      throw std::runtime_error("retrieval_top_k must be greater than 0");
    }
    if (max_context_length <= 0) {
      throw std::runtime_error("max_context_length must be greater than 0");
    }
    if (max_documents_per_user <= 0 || max_chunks_per_document <= 0) {
      throw std::runtime_error("document and chunk limits must be greater than 0");
    }
    if (max_queries_per_hour <= 0) {
      throw std::runtime_error("max_queries_per_hour must be greater than 0");
    }
    if (stream_buffer_capacity <= 0) {
      throw std::runtime_error("stream_buffer_capacity must be greater than 0");
    }
  }
};
