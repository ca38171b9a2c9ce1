#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "docqa_core/llm/answer_generator.hpp"
#include "docqa_core/llm/embedder.hpp"

namespace docqa_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct OllamaSettings {
  std::string url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string generation_model = "llama3.1:8b";
  std::string system_prompt =
      "You are a helpful assistant that answers based on provided policy documents.";
  int timeout_seconds = 60;
  int max_answer_tokens = 512;
};

/**
 * @class OllamaClient
 * @brief Embedding and chat generation against an Ollama server.
 *
 * Construction checks the server is reachable. Requests are serialized because
 * ollama-hpp shares one HTTP client process-wide.
 */
class OllamaClient : public Embedder, public AnswerGenerator {
 public:
  explicit OllamaClient(const OllamaSettings &settings);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // Get embedding for text
  virtual std::vector<float> get_embedding(const std::string &text);

  std::vector<Embedding> embed(const std::vector<std::string> &texts) override;
  size_t dimension() const override {
    return dimension_.load();
  }
  std::string model_id() const override {
    return "ollama:" + settings_.embedding_model;
  }

  std::string generate(const ConversationWindow &history,
                       const std::string &query,
                       const std::string &context) override;

  virtual bool is_server_available();

 protected:
  // For test doubles: skips the connectivity check
  struct NoConnect {};
  OllamaClient(const OllamaSettings &settings, NoConnect);

 private:
  OllamaSettings settings_;
  std::atomic<size_t> dimension_{0};
  std::mutex request_mutex_;

  // Helper methods
  void setup_server_connection();
  void record_dimension(size_t dimension);
};

}  // namespace docqa_core
