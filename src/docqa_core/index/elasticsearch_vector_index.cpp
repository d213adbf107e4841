#include "docqa_core/index/elasticsearch_vector_index.hpp"

#include <algorithm>
#include <iostream>

#include "docqa_core/errors.hpp"

namespace docqa_core {

namespace {

nlohmann::json owner_term(OwnerId owner_id) {
  return {{"term", {{"owner_id", owner_id}}}};
}

}  // namespace

ElasticsearchVectorIndex::ElasticsearchVectorIndex(ElasticsearchConfig config, size_t dimension)
    : config_(std::move(config)), dimension_(dimension) {
  if (dimension_ == 0) {
    throw InvalidParametersError("vector dimension must be positive");
  }
  if (config_.index.empty()) {
    throw InvalidParametersError("elasticsearch index name cannot be empty");
  }
  std::vector<std::string> headers;
  if (!config_.api_key.empty()) {
    headers.push_back("Authorization: ApiKey " + config_.api_key);
  }
  http_ = std::make_unique<HttpClient>(config_.url, config_.timeout, headers);
  ensure_index();
}

std::string ElasticsearchVectorIndex::document_key(OwnerId owner_id, ChunkId chunk_id) {
  return "owner_" + std::to_string(owner_id) + "_chunk_" + std::to_string(chunk_id);
}

nlohmann::json ElasticsearchVectorIndex::build_mapping(size_t dimension) {
  return {{"mappings",
           {{"properties",
             {{"content", {{"type", "text"}}},
              {"embedding",
               {{"type", "dense_vector"},
                {"dims", dimension},
                {"index", true},
                {"similarity", "cosine"}}},
              {"owner_id", {{"type", "long"}}},
              {"chunk_id", {{"type", "long"}}},
              {"document_id", {{"type", "long"}}},
              {"chunk_index", {{"type", "integer"}}}}}}}};
}

std::string ElasticsearchVectorIndex::build_bulk_body(const std::string &index,
                                                      OwnerId owner_id,
                                                      const std::vector<VectorEntry> &entries) {
  std::string body;
  for (const auto &entry : entries) {
    const nlohmann::json action = {
        {"index", {{"_index", index}, {"_id", document_key(owner_id, entry.chunk_id)}}}};
    const nlohmann::json source = {{"content", entry.metadata.content},
                                   {"embedding", entry.vector},
                                   {"owner_id", owner_id},
                                   {"chunk_id", entry.chunk_id},
                                   {"document_id", entry.metadata.document_id},
                                   {"chunk_index", entry.metadata.chunk_index}};
    body += action.dump() + "\n" + source.dump() + "\n";
  }
  return body;
}

nlohmann::json ElasticsearchVectorIndex::build_search_body(OwnerId owner_id,
                                                           const std::vector<float> &query,
                                                           size_t k,
                                                           size_t num_candidates,
                                                           const SearchFilters &filters) {
  nlohmann::json filter = nlohmann::json::array({owner_term(owner_id)});
  if (!filters.document_ids.empty()) {
    filter.push_back({{"terms", {{"document_id", filters.document_ids}}}});
  }

  nlohmann::json body = {
      {"size", k},
      {"_source", nlohmann::json::array({"chunk_id"})},
      {"knn",
       {{"field", "embedding"},
        {"query_vector", query},
        {"k", k},
        {"num_candidates", std::max(num_candidates, k)},
        {"filter", {{"bool", {{"filter", filter}}}}}}}};

  if (!filters.text_hint.empty()) {
    body["query"] = {{"bool",
                      {{"filter", filter},
                       {"should",
                        nlohmann::json::array({{{"match", {{"content", filters.text_hint}}}}})}}}};
  }
  return body;
}

nlohmann::json ElasticsearchVectorIndex::build_delete_query(OwnerId owner_id,
                                                            std::optional<ChunkId> chunk_id,
                                                            std::optional<DocumentId> document_id) {
  nlohmann::json filter = nlohmann::json::array({owner_term(owner_id)});
  if (chunk_id) {
    filter.push_back({{"term", {{"chunk_id", *chunk_id}}}});
  }
  if (document_id) {
    filter.push_back({{"term", {{"document_id", *document_id}}}});
  }
  return {{"query", {{"bool", {{"filter", filter}}}}}};
}

nlohmann::json ElasticsearchVectorIndex::build_foreign_lookup(
    OwnerId owner_id, const std::vector<VectorEntry> &entries) {
  nlohmann::json ids = nlohmann::json::array();
  for (const auto &entry : entries) {
    ids.push_back(entry.chunk_id);
  }
  return {{"size", entries.size()},
          {"_source", nlohmann::json::array({"chunk_id"})},
          {"query",
           {{"bool",
             {{"filter", nlohmann::json::array({{{"terms", {{"chunk_id", ids}}}}})},
              {"must_not", nlohmann::json::array({owner_term(owner_id)})}}}}}};
}

void ElasticsearchVectorIndex::ensure_index() {
  HttpResponse existing;
  try {
    existing = http_->get("/" + config_.index);
  } catch (const HttpError &e) {
    throw IndexUnavailableError("Elasticsearch unreachable: " + std::string(e.what()));
  }
  if (existing.ok()) {
    return;
  }
  if (existing.status != 404) {
    throw IndexUnavailableError("Elasticsearch index lookup returned HTTP " +
                                std::to_string(existing.status) + ": " + existing.body);
  }

  HttpResponse created;
  try {
    created = http_->put("/" + config_.index, build_mapping(dimension_).dump());
  } catch (const HttpError &e) {
    throw IndexUnavailableError("Elasticsearch index create failed: " + std::string(e.what()));
  }
  if (!created.ok()) {
    throw IndexUnavailableError("Elasticsearch index create returned HTTP " +
                                std::to_string(created.status) + ": " + created.body);
  }
  std::cout << "Created Elasticsearch index '" << config_.index << "' with " << dimension_
            << " dims" << std::endl;
}

void ElasticsearchVectorIndex::check_dimension(const std::vector<float> &vector) const {
  if (vector.size() != dimension_) {
    throw InvalidParametersError("Vector dimension mismatch. Expected " +
                                 std::to_string(dimension_) + ", got " +
                                 std::to_string(vector.size()));
  }
}

void ElasticsearchVectorIndex::reject_foreign_ids(OwnerId owner_id,
                                                  const std::vector<VectorEntry> &entries) {
  HttpResponse response;
  try {
    response = http_->post("/" + config_.index + "/_search",
                           build_foreign_lookup(owner_id, entries).dump());
  } catch (const HttpError &e) {
    throw IndexUnavailableError("Elasticsearch chunk lookup failed: " + std::string(e.what()));
  }
  if (!response.ok()) {
    throw IndexUnavailableError("Elasticsearch chunk lookup returned HTTP " +
                                std::to_string(response.status) + ": " + response.body);
  }

  std::optional<ChunkId> foreign;
  try {
    auto json_response = nlohmann::json::parse(response.body);
    const auto &hits = json_response.at("hits").at("hits");
    if (!hits.empty()) {
      foreign = hits.front().at("_source").at("chunk_id").get<ChunkId>();
    }
  } catch (const nlohmann::json::exception &e) {
    throw IndexUnavailableError("Malformed Elasticsearch chunk lookup response: " +
                                std::string(e.what()));
  }
  if (foreign) {
    throw InvalidParametersError("chunk id " + std::to_string(*foreign) +
                                 " belongs to another owner");
  }
}

void ElasticsearchVectorIndex::add(OwnerId owner_id,
                                   ChunkId chunk_id,
                                   const std::vector<float> &vector,
                                   const VectorMetadata &metadata) {
  add_batch(owner_id, {VectorEntry{chunk_id, vector, metadata}});
}

void ElasticsearchVectorIndex::add_batch(OwnerId owner_id, const std::vector<VectorEntry> &entries) {
  if (entries.empty()) {
    return;
  }
  for (const auto &entry : entries) {
    check_dimension(entry.vector);
  }
  reject_foreign_ids(owner_id, entries);

  HttpResponse response;
  try {
    response = http_->post("/_bulk?refresh=true", build_bulk_body(config_.index, owner_id, entries),
                           "application/x-ndjson");
  } catch (const HttpError &e) {
    throw IndexUnavailableError("Elasticsearch bulk index failed: " + std::string(e.what()));
  }
  if (!response.ok()) {
    throw IndexUnavailableError("Elasticsearch bulk index returned HTTP " +
                                std::to_string(response.status) + ": " + response.body);
  }

  // _bulk answers 200 even when individual items fail
  try {
    auto json_response = nlohmann::json::parse(response.body);
    if (json_response.value("errors", false)) {
      throw IndexUnavailableError("Elasticsearch rejected part of a bulk index request");
    }
  } catch (const nlohmann::json::exception &e) {
    throw IndexUnavailableError("Malformed Elasticsearch bulk response: " + std::string(e.what()));
  }
}

std::vector<VectorHit> ElasticsearchVectorIndex::search(OwnerId owner_id,
                                                        const std::vector<float> &query,
                                                        size_t k,
                                                        const SearchFilters &filters) {
  check_dimension(query);
  if (k == 0) {
    return {};
  }

  const nlohmann::json body =
      build_search_body(owner_id, query, k, config_.num_candidates, filters);
  HttpResponse response;
  try {
    response = http_->post("/" + config_.index + "/_search", body.dump());
  } catch (const HttpError &e) {
    throw IndexUnavailableError("Elasticsearch search failed: " + std::string(e.what()));
  }
  if (!response.ok()) {
    throw IndexUnavailableError("Elasticsearch search returned HTTP " +
                                std::to_string(response.status) + ": " + response.body);
  }

  std::vector<VectorHit> hits;
  try {
    auto json_response = nlohmann::json::parse(response.body);
    for (const auto &hit : json_response.at("hits").at("hits")) {
      hits.push_back({hit.at("_source").at("chunk_id").get<ChunkId>(),
                      hit.at("_score").get<float>()});
      if (hits.size() == k) {
        break;
      }
    }
  } catch (const nlohmann::json::exception &e) {
    throw IndexUnavailableError("Malformed Elasticsearch search response: " +
                                std::string(e.what()));
  }
  return hits;
}

void ElasticsearchVectorIndex::delete_by_query(const nlohmann::json &body,
                                               const std::string &operation) {
  HttpResponse response;
  try {
    response = http_->post("/" + config_.index + "/_delete_by_query?refresh=true&conflicts=proceed",
                           body.dump());
  } catch (const HttpError &e) {
    throw IndexUnavailableError("Elasticsearch " + operation + " failed: " + e.what());
  }
  if (!response.ok()) {
    throw IndexUnavailableError("Elasticsearch " + operation + " returned HTTP " +
                                std::to_string(response.status) + ": " + response.body);
  }
}

void ElasticsearchVectorIndex::delete_chunk(OwnerId owner_id, ChunkId chunk_id) {
  delete_by_query(build_delete_query(owner_id, chunk_id, std::nullopt), "delete_chunk");
}

void ElasticsearchVectorIndex::delete_document(OwnerId owner_id, DocumentId document_id) {
  delete_by_query(build_delete_query(owner_id, std::nullopt, document_id), "delete_document");
}

void ElasticsearchVectorIndex::delete_all(OwnerId owner_id) {
  delete_by_query(build_delete_query(owner_id, std::nullopt, std::nullopt), "delete_all");
}

}  // namespace docqa_core
