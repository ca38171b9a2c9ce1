#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  // "ollama" or "hashing"
  std::string embedding_backend;
  int hashing_dimension;
  int num_workers;

  // Indexing and retrieval
  int chunk_size;
  int chunk_overlap;
  int top_k;
  int overfetch_factor;
  double subindex_max_fraction;
  int window_exchanges;
  int cache_max_entries;
  bool auto_clause_filter;
  bool revalidate_snapshots;

  // Empty disables snapshots
  std::string snapshot_db_path;

  int download_timeout_seconds;
  int generation_timeout_seconds;
  std::string system_prompt;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.generation_model = json_config.value("generation_model", std::string("llama3.1:8b"));
      config.embedding_backend = json_config.value("embedding_backend", std::string("ollama"));
      config.hashing_dimension = json_config.value("hashing_dimension", 1024);
      config.num_workers = json_config.value("num_workers", 2);

      config.chunk_size = json_config.value("chunk_size", 512);
      config.chunk_overlap = json_config.value("chunk_overlap", 64);
      config.top_k = json_config.value("top_k", 3);
      config.overfetch_factor = json_config.value("overfetch_factor", 16);
      config.subindex_max_fraction = json_config.value("subindex_max_fraction", 0.25);
      config.window_exchanges = json_config.value("window_exchanges", 3);
      config.cache_max_entries = json_config.value("cache_max_entries", 0);
      config.auto_clause_filter = json_config.value("auto_clause_filter", false);
      config.revalidate_snapshots = json_config.value("revalidate_snapshots", false);
      config.snapshot_db_path = json_config.value("snapshot_db_path", std::string(""));

      config.download_timeout_seconds = json_config.value("download_timeout_seconds", 30);
      config.generation_timeout_seconds = json_config.value("generation_timeout_seconds", 60);
      config.system_prompt = json_config.value(
          "system_prompt",
          std::string("You are a helpful assistant that answers based on provided policy documents."));
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Config value has the wrong type: ") + e.what());
    }

    config.validate();
    return config;
  }

  bool uses_hashing_embedder() const {
    return embedding_backend == "hashing";
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be of the form host:port");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty");
    }
    if (embedding_backend != "ollama" && embedding_backend != "hashing") {
      throw std::runtime_error("embedding_backend must be 'ollama' or 'hashing'");
    }
    if (hashing_dimension <= 0) {
      throw std::runtime_error("hashing_dimension must be greater than 0");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_size <= chunk_overlap) {
      throw std::runtime_error("chunk_size must be greater than chunk_overlap, which must be >= 0");
    }
    if (top_k < 1) {
      throw std::runtime_error("top_k must be at least 1");
    }
    if (overfetch_factor < 1) {
      throw std::runtime_error("overfetch_factor must be at least 1");
    }
    if (subindex_max_fraction < 0.0 || subindex_max_fraction > 1.0) {
      throw std::runtime_error("subindex_max_fraction must be within [0, 1]");
    }
    if (window_exchanges < 0) {
      throw std::runtime_error("window_exchanges cannot be negative");
    }
    if (cache_max_entries < 0) {
      throw std::runtime_error("cache_max_entries cannot be negative");
    }
    if (download_timeout_seconds <= 0 || generation_timeout_seconds <= 0) {
      throw std::runtime_error("timeouts must be greater than 0 seconds");
    }
  }
};
