#pragma once

#include <memory>
#include <string>

#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/index/elasticsearch_vector_index.hpp"
#include "docqa_core/index/qdrant_vector_index.hpp"
#include "docqa_core/index/vector_index.hpp"

namespace docqa_core {

enum class VectorBackend { Local, Qdrant, Elasticsearch };

std::string to_string(VectorBackend backend);
VectorBackend vector_backend_from_string(const std::string &str);

struct VectorIndexConfig {
  VectorBackend backend = VectorBackend::Local;
  size_t dimension = 384;
  QdrantConfig qdrant;
  ElasticsearchConfig elasticsearch;
};

// The local variant keeps its vectors in db_manager's database
std::shared_ptr<VectorIndex> make_vector_index(const VectorIndexConfig &config,
                                               DatabaseManager &db_manager);

}  // namespace docqa_core
