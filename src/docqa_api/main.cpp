#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

#include "docqa_api/config.hpp"
#include "docqa_api/routes.hpp"
#include "docqa_api/server.hpp"
#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/db/document_store.hpp"
#include "docqa_core/embedding/hashing_embedding_provider.hpp"
#include "docqa_core/embedding/ollama_embedding_provider.hpp"
#include "docqa_core/generation/generation_factory.hpp"
#include "docqa_core/index/vector_index_factory.hpp"
#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/retrieval/retrieval_engine.hpp"
#include "docqa_core/services/ingestion_service.hpp"
#include "docqa_core/services/qa_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char **argv) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "docqarc.json";
    Config config = Config::from_file(config_path);

    // The key may come from the environment instead of the config file
    std::string db_key = config.db_key;
    if (const char *env_key = std::getenv("DOCQA_DB_KEY")) {
      db_key = env_key;
    }

    std::cout << "Starting Document QA API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Metadata DB Path: " << config.metadata_db_path << std::endl;
    std::cout << "Database encryption: " << (db_key.empty() ? "off" : "on") << std::endl;
    std::cout << "Embedding Provider: " << config.embedding_provider << " ("
              << config.embedding_model << ", " << config.embedding_dimension << " dims)"
              << std::endl;

    std::filesystem::path db_path(config.metadata_db_path);
    if (db_path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(db_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Warning: Failed to create database directory: " << ec.message() << std::endl;
      }
    }

    // --- 1. WIRE CORE COMPONENTS ---
    docqa_core::DatabaseManager db_manager(db_path, db_key, config.db_pool_size);
    auto document_store = std::make_shared<docqa_core::DocumentStore>(db_manager);

    auto ollama_client = std::make_shared<docqa_core::OllamaClient>(
        config.ollama_url, std::chrono::seconds(config.ollama_timeout_seconds));

    std::shared_ptr<docqa_core::EmbeddingProvider> embedder;
    if (config.embedding_provider == "hashing") {
      embedder = std::make_shared<docqa_core::HashingEmbeddingProvider>(
          static_cast<size_t>(config.embedding_dimension));
    } else {
      embedder = std::make_shared<docqa_core::OllamaEmbeddingProvider>(
          ollama_client, config.embedding_model, static_cast<size_t>(config.embedding_dimension));
    }
    embedder = std::make_shared<docqa_core::RetryingEmbeddingProvider>(
        embedder, std::chrono::milliseconds(500));

    docqa_core::VectorIndexConfig index_config;
    index_config.backend = docqa_core::vector_backend_from_string(config.vector_backend);
    index_config.dimension = static_cast<size_t>(config.embedding_dimension);
    index_config.qdrant.url = config.qdrant_url;
    index_config.qdrant.api_key = config.qdrant_api_key;
    index_config.qdrant.collection = config.qdrant_collection_name;
    index_config.qdrant.timeout = std::chrono::seconds(config.qdrant_timeout_seconds);
    index_config.elasticsearch.url = config.elasticsearch_url;
    index_config.elasticsearch.index = config.elasticsearch_index;
    index_config.elasticsearch.timeout = std::chrono::seconds(config.elasticsearch_timeout_seconds);
    auto vector_index = docqa_core::make_vector_index(index_config, db_manager);

    docqa_core::GenerationConfig generation_config;
    generation_config.ollama_enabled = config.ollama_enabled;
    generation_config.ollama_model = config.ollama_model;
    generation_config.openai.api_key = config.openai_api_key;
    generation_config.openai.base_url = config.openai_base_url;
    generation_config.openai.model = config.openai_model;
    generation_config.openai.timeout = std::chrono::seconds(config.openai_timeout_seconds);
    auto chain = docqa_core::make_fallback_chain(generation_config, ollama_client);

    if (config.ollama_enabled && !ollama_client->is_server_available()) {
      std::cerr << "Warning: Ollama is not reachable at " << config.ollama_url
                << "; requests will fall back to " << chain->backends().back()->name()
                << std::endl;
    }

    docqa_core::IngestionLimits limits;
    limits.max_documents_per_owner = config.max_documents_per_user;
    limits.max_chunks_per_document = config.max_chunks_per_document;
    auto ingestion_service = std::make_shared<docqa_core::IngestionService>(
        document_store, embedder, vector_index, limits);

    auto retrieval = std::make_shared<docqa_core::RetrievalEngine>(embedder, vector_index,
                                                                   document_store);
    docqa_core::QaSettings qa_settings;
    qa_settings.top_k = static_cast<size_t>(config.retrieval_top_k);
    qa_settings.max_context_length = static_cast<size_t>(config.max_context_length);
    qa_settings.stream_buffer_capacity = static_cast<size_t>(config.stream_buffer_capacity);
    qa_settings.max_queries_per_hour = config.max_queries_per_hour;
    auto qa_service =
        std::make_shared<docqa_core::QaService>(retrieval, chain, document_store, qa_settings);

    docqa_api::Server server(config.api_base_url);
    docqa_api::ChunkingDefaults chunking{static_cast<size_t>(config.chunk_size),
                                         static_cast<size_t>(config.chunk_overlap)};
    docqa_api::Routes routes(ingestion_service, qa_service, vector_index->name(),
                             embedder->name(), chunking);
    routes.register_routes(server);

    // --- 2. START SERVER ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start(std::max(2u, std::thread::hardware_concurrency()));
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/3] Cancelling active streams..." << std::endl;
    routes.shutdown_streams();

    std::cout << "[2/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[3/3] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
