#include "docqa_core/index/vector_index_factory.hpp"

#include <iostream>

#include "docqa_core/errors.hpp"
#include "docqa_core/index/local_vector_index.hpp"

namespace docqa_core {

std::string to_string(VectorBackend backend) {
  switch (backend) {
    case VectorBackend::Local:
      return "local";
    case VectorBackend::Qdrant:
      return "qdrant";
    case VectorBackend::Elasticsearch:
      return "elasticsearch";
    default:
      return "unknown";
  }
}

VectorBackend vector_backend_from_string(const std::string &str) {
  if (str == "local" || str == "faiss")
    return VectorBackend::Local;
  if (str == "qdrant")
    return VectorBackend::Qdrant;
  if (str == "elasticsearch")
    return VectorBackend::Elasticsearch;
  throw InvalidParametersError("Unknown vector backend: " + str);
}

std::shared_ptr<VectorIndex> make_vector_index(const VectorIndexConfig &config,
                                               DatabaseManager &db_manager) {
  std::cout << "Vector index backend: " << to_string(config.backend)
            << " (dimension " << config.dimension << ")" << std::endl;
  switch (config.backend) {
    case VectorBackend::Qdrant:
      return std::make_shared<QdrantVectorIndex>(config.qdrant, config.dimension);
    case VectorBackend::Elasticsearch:
      return std::make_shared<ElasticsearchVectorIndex>(config.elasticsearch, config.dimension);
    case VectorBackend::Local:
    default:
      return std::make_shared<LocalVectorIndex>(db_manager, config.dimension);
  }
}

}  // namespace docqa_core
