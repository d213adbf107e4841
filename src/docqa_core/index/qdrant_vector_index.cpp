#include "docqa_core/index/qdrant_vector_index.hpp"

#include <iostream>

#include "docqa_core/errors.hpp"

namespace docqa_core {

QdrantVectorIndex::QdrantVectorIndex(QdrantConfig config, size_t dimension)
    : config_(std::move(config)), dimension_(dimension) {
  if (dimension_ == 0) {
    throw InvalidParametersError("vector dimension must be positive");
  }
  if (config_.collection.empty()) {
    throw InvalidParametersError("qdrant collection name cannot be empty");
  }
  std::vector<std::string> headers;
  if (!config_.api_key.empty()) {
    headers.push_back("api-key: " + config_.api_key);
  }
  http_ = std::make_unique<HttpClient>(config_.url, config_.timeout, headers);
  ensure_collection();
}

nlohmann::json QdrantVectorIndex::owner_filter(OwnerId owner_id,
                                               std::optional<ChunkId> chunk_id,
                                               std::optional<DocumentId> document_id) {
  nlohmann::json must = nlohmann::json::array();
  must.push_back({{"key", "owner_id"}, {"match", {{"value", owner_id}}}});
  if (document_id) {
    must.push_back({{"key", "document_id"}, {"match", {{"value", *document_id}}}});
  }
  if (chunk_id) {
    must.push_back({{"has_id", nlohmann::json::array({*chunk_id})}});
  }
  return {{"must", must}};
}

nlohmann::json QdrantVectorIndex::build_upsert_body(OwnerId owner_id,
                                                    const std::vector<VectorEntry> &entries) {
  nlohmann::json points = nlohmann::json::array();
  for (const auto &entry : entries) {
    points.push_back({{"id", entry.chunk_id},
                      {"vector", entry.vector},
                      {"payload",
                       {{"owner_id", owner_id},
                        {"document_id", entry.metadata.document_id},
                        {"chunk_index", entry.metadata.chunk_index}}}});
  }
  return {{"points", points}};
}

nlohmann::json QdrantVectorIndex::build_search_body(OwnerId owner_id,
                                                    const std::vector<float> &query,
                                                    size_t k,
                                                    const SearchFilters &filters) {
  nlohmann::json filter = owner_filter(owner_id);
  if (!filters.document_ids.empty()) {
    filter["must"].push_back({{"key", "document_id"}, {"match", {{"any", filters.document_ids}}}});
  }
  return {{"vector", query}, {"limit", k}, {"filter", filter}, {"with_payload", false}};
}

nlohmann::json QdrantVectorIndex::build_collection_body(size_t dimension) {
  return {{"vectors", {{"size", dimension}, {"distance", "Cosine"}}}};
}

nlohmann::json QdrantVectorIndex::build_lookup_body(const std::vector<VectorEntry> &entries) {
  nlohmann::json ids = nlohmann::json::array();
  for (const auto &entry : entries) {
    ids.push_back(entry.chunk_id);
  }
  return {{"ids", ids},
          {"with_payload", nlohmann::json::array({"owner_id"})},
          {"with_vector", false}};
}

std::vector<ChunkId> QdrantVectorIndex::foreign_ids(const nlohmann::json &lookup_response,
                                                    OwnerId owner_id) {
  std::vector<ChunkId> foreign;
  for (const auto &point : lookup_response.at("result")) {
    const auto &payload = point.at("payload");
    if (payload.contains("owner_id") && payload.at("owner_id").get<OwnerId>() != owner_id) {
      foreign.push_back(point.at("id").get<ChunkId>());
    }
  }
  return foreign;
}

HttpResponse QdrantVectorIndex::send(const std::string &method,
                                     const std::string &path,
                                     const nlohmann::json *body,
                                     const std::string &operation) const {
  try {
    if (method == "GET") {
      return http_->get(path);
    }
    if (method == "PUT") {
      return http_->put(path, body ? body->dump() : "{}");
    }
    return http_->post(path, body ? body->dump() : "{}");
  } catch (const HttpError &e) {
    throw IndexUnavailableError("Qdrant " + operation + " failed: " + e.what());
  }
}

void QdrantVectorIndex::ensure_collection() {
  const std::string path = "/collections/" + config_.collection;
  HttpResponse existing = send("GET", path, nullptr, "collection lookup");
  if (existing.ok()) {
    return;
  }
  if (existing.status != 404) {
    throw IndexUnavailableError("Qdrant collection lookup returned HTTP " +
                                std::to_string(existing.status) + ": " + existing.body);
  }

  const nlohmann::json body = build_collection_body(dimension_);
  HttpResponse created = send("PUT", path, &body, "collection create");
  if (!created.ok()) {
    throw IndexUnavailableError("Qdrant collection create returned HTTP " +
                                std::to_string(created.status) + ": " + created.body);
  }

  // Payload index so owner filtering stays cheap
  const nlohmann::json index_body = {{"field_name", "owner_id"}, {"field_schema", "integer"}};
  HttpResponse indexed = send("PUT", path + "/index?wait=true", &index_body, "payload index");
  if (!indexed.ok()) {
    std::cerr << "Warning: Qdrant payload index on owner_id not created: HTTP " << indexed.status
              << std::endl;
  }
  std::cout << "Created Qdrant collection '" << config_.collection << "' with vector size "
            << dimension_ << std::endl;
}

void QdrantVectorIndex::check_dimension(const std::vector<float> &vector) const {
  if (vector.size() != dimension_) {
    throw InvalidParametersError("Vector dimension mismatch. Expected " +
                                 std::to_string(dimension_) + ", got " +
                                 std::to_string(vector.size()));
  }
}

void QdrantVectorIndex::reject_foreign_ids(OwnerId owner_id,
                                           const std::vector<VectorEntry> &entries) {
  const nlohmann::json body = build_lookup_body(entries);
  HttpResponse response =
      send("POST", "/collections/" + config_.collection + "/points", &body, "point lookup");
  if (!response.ok()) {
    throw IndexUnavailableError("Qdrant point lookup returned HTTP " +
                                std::to_string(response.status) + ": " + response.body);
  }
  std::vector<ChunkId> foreign;
  try {
    foreign = foreign_ids(nlohmann::json::parse(response.body), owner_id);
  } catch (const nlohmann::json::exception &e) {
    throw IndexUnavailableError("Malformed Qdrant point lookup response: " +
                                std::string(e.what()));
  }
  if (!foreign.empty()) {
    throw InvalidParametersError("chunk id " + std::to_string(foreign.front()) +
                                 " belongs to another owner");
  }
}

void QdrantVectorIndex::add(OwnerId owner_id,
                            ChunkId chunk_id,
                            const std::vector<float> &vector,
                            const VectorMetadata &metadata) {
  add_batch(owner_id, {VectorEntry{chunk_id, vector, metadata}});
}

void QdrantVectorIndex::add_batch(OwnerId owner_id, const std::vector<VectorEntry> &entries) {
  if (entries.empty()) {
    return;
  }
  for (const auto &entry : entries) {
    check_dimension(entry.vector);
  }
  reject_foreign_ids(owner_id, entries);
  const nlohmann::json body = build_upsert_body(owner_id, entries);
  HttpResponse response =
      send("PUT", "/collections/" + config_.collection + "/points?wait=true", &body, "upsert");
  if (!response.ok()) {
    throw IndexUnavailableError("Qdrant upsert returned HTTP " + std::to_string(response.status) +
                                ": " + response.body);
  }
}

std::vector<VectorHit> QdrantVectorIndex::search(OwnerId owner_id,
                                                 const std::vector<float> &query,
                                                 size_t k,
                                                 const SearchFilters &filters) {
  check_dimension(query);
  if (k == 0) {
    return {};
  }
  const nlohmann::json body = build_search_body(owner_id, query, k, filters);
  HttpResponse response =
      send("POST", "/collections/" + config_.collection + "/points/search", &body, "search");
  if (!response.ok()) {
    throw IndexUnavailableError("Qdrant search returned HTTP " + std::to_string(response.status) +
                                ": " + response.body);
  }

  std::vector<VectorHit> hits;
  try {
    auto json_response = nlohmann::json::parse(response.body);
    for (const auto &point : json_response.at("result")) {
      hits.push_back({point.at("id").get<ChunkId>(), point.at("score").get<float>()});
    }
  } catch (const nlohmann::json::exception &e) {
    throw IndexUnavailableError("Malformed Qdrant search response: " + std::string(e.what()));
  }
  return hits;
}

void QdrantVectorIndex::delete_points(const nlohmann::json &filter, const std::string &operation) {
  const nlohmann::json body = {{"filter", filter}};
  HttpResponse response = send(
      "POST", "/collections/" + config_.collection + "/points/delete?wait=true", &body, operation);
  if (!response.ok()) {
    throw IndexUnavailableError("Qdrant " + operation + " returned HTTP " +
                                std::to_string(response.status) + ": " + response.body);
  }
}

void QdrantVectorIndex::delete_chunk(OwnerId owner_id, ChunkId chunk_id) {
  delete_points(owner_filter(owner_id, chunk_id), "delete_chunk");
}

void QdrantVectorIndex::delete_document(OwnerId owner_id, DocumentId document_id) {
  delete_points(owner_filter(owner_id, std::nullopt, document_id), "delete_document");
}

void QdrantVectorIndex::delete_all(OwnerId owner_id) {
  delete_points(owner_filter(owner_id), "delete_all");
}

}  // namespace docqa_core
