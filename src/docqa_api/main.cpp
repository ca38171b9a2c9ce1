#include <curl/curl.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "docqa_api/config.hpp"
#include "docqa_api/routes.hpp"
#include "docqa_api/server.hpp"
#include "docqa_core/async/worker_pool.hpp"
#include "docqa_core/cache/document_cache.hpp"
#include "docqa_core/chunking/tokenizer.hpp"
#include "docqa_core/db/snapshot_store.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/io/document_fetcher.hpp"
#include "docqa_core/llm/hashing_embedder.hpp"
#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/services/document_indexer.hpp"
#include "docqa_core/services/qa_service.hpp"
#include "docqa_core/services/retrieval_service.hpp"

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

int main(int argc, char *argv[]) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::cerr << "Error starting server: failed to initialize libcurl" << std::endl;
    return 1;
  }

  try {
    const std::string config_path = argc > 1 ? argv[1] : "docqarc.json";
    Config config = Config::from_file(config_path);

    std::cout << "Starting DocQA API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding backend: " << config.embedding_backend << std::endl;
    std::cout << "Generation model: " << config.generation_model << std::endl;
    std::cout << "Snapshots: "
              << (config.snapshot_db_path.empty() ? "disabled" : config.snapshot_db_path)
              << std::endl;

    // --- 1. BUILD SERVICES ---
    docqa_core::OllamaSettings ollama_settings;
    ollama_settings.url = config.ollama_url;
    ollama_settings.embedding_model = config.embedding_model;
    ollama_settings.generation_model = config.generation_model;
    ollama_settings.system_prompt = config.system_prompt;
    ollama_settings.timeout_seconds = config.generation_timeout_seconds;
    auto ollama_client = std::make_shared<docqa_core::OllamaClient>(ollama_settings);

    docqa_core::EmbedderPtr embedder = ollama_client;
    if (config.uses_hashing_embedder()) {
      embedder = std::make_shared<docqa_core::HashingEmbedder>(
          static_cast<size_t>(config.hashing_dimension));
    }

    auto fetcher = std::make_shared<docqa_core::CurlDocumentFetcher>(config.download_timeout_seconds);
    auto extractor_factory = std::make_shared<docqa_core::ContentExtractorFactory>();
    auto tokenizer = std::make_shared<docqa_core::Utf8WordTokenizer>();

    docqa_core::IndexerSettings indexer_settings;
    indexer_settings.chunk_size = config.chunk_size;
    indexer_settings.chunk_overlap = config.chunk_overlap;
    auto indexer = std::make_shared<docqa_core::DocumentIndexer>(
        fetcher, extractor_factory, tokenizer, embedder, indexer_settings);

    docqa_core::RetrievalSettings retrieval_settings;
    retrieval_settings.overfetch_factor = config.overfetch_factor;
    retrieval_settings.subindex_max_fraction = config.subindex_max_fraction;
    auto retrieval = std::make_shared<docqa_core::RetrievalEngine>(embedder, retrieval_settings);

    auto cache =
        std::make_shared<docqa_core::DocumentCache>(static_cast<size_t>(config.cache_max_entries));

    docqa_core::SnapshotStorePtr snapshot_store;
    if (!config.snapshot_db_path.empty()) {
      std::error_code ec;
      auto parent = std::filesystem::path(config.snapshot_db_path).parent_path();
      if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
          std::cerr << "Warning: Failed to create snapshot directory: " << ec.message()
                    << std::endl;
        }
      }
      snapshot_store = std::make_shared<docqa_core::SnapshotStore>(config.snapshot_db_path);
    }

    auto worker_pool =
        std::make_shared<docqa_core::async::WorkerPool>(static_cast<size_t>(config.num_workers));

    docqa_core::QaSettings qa_settings;
    qa_settings.top_k = config.top_k;
    qa_settings.window_exchanges = config.window_exchanges;
    qa_settings.auto_clause_filter = config.auto_clause_filter;
    qa_settings.revalidate_snapshots = config.revalidate_snapshots;
    auto qa_service = std::make_shared<docqa_core::QaService>(
        cache, indexer, retrieval, ollama_client, worker_pool, snapshot_store, qa_settings);

    std::optional<std::string> api_key;
    if (const char *key = std::getenv("API_KEY")) {
      api_key = key;
    } else {
      std::cerr << "Warning: API_KEY is not set; protected endpoints will return 500" << std::endl;
    }

    const auto separator = config.api_base_url.rfind(':');
    std::string host = config.api_base_url.substr(0, separator);
    int port = std::stoi(config.api_base_url.substr(separator + 1));
    docqa_api::Server server(host, port);
    docqa_api::Routes routes(qa_service, api_key);
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    worker_pool->start();
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
    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Stopping worker pool..." << std::endl;
    worker_pool->stop();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    curl_global_cleanup();
    return 1;
  }

  curl_global_cleanup();
  return 0;
}
