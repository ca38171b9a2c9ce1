#include "docqa_core/llm/ollama_client.hpp"

#include "ollama.hpp"

#include "docqa_core/errors.hpp"

namespace docqa_core {

OllamaClient::OllamaClient(const OllamaSettings &settings) : settings_(settings) {
  setup_server_connection();
}

OllamaClient::OllamaClient(const OllamaSettings &settings, NoConnect) : settings_(settings) {}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(settings_.url);
  ollama::setReadTimeout(settings_.timeout_seconds);
  ollama::setWriteTimeout(settings_.timeout_seconds);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + settings_.url);
  }
}

void OllamaClient::record_dimension(size_t dimension) {
  size_t expected = 0;
  // The first successful embedding fixes the dimension for the process
  if (!dimension_.compare_exchange_strong(expected, dimension) && expected != dimension) {
    throw DimensionMismatchError(expected, dimension);
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    nlohmann::json json_response;
    {
      std::lock_guard<std::mutex> lock(request_mutex_);
      ollama::response response = ollama::generate_embeddings(settings_.embedding_model, text);
      json_response = response.as_json();
    }

    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    std::vector<float> vector;
    if (embeddings.is_array()) {
      if (embeddings.size() > 0 && embeddings[0].is_array()) {
        // Array of arrays - take the first embedding vector
        vector = embeddings[0].get<std::vector<float>>();
      } else {
        vector = embeddings.get<std::vector<float>>();
      }
    } else {
      throw OllamaError("Embeddings field is not an array");
    }
    if (vector.empty()) {
      throw OllamaError("Received empty embedding");
    }
    record_dimension(vector.size());
    return vector;

  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
}

// The Ollama embed endpoint is called once per text; callers batch above this
std::vector<Embedding> OllamaClient::embed(const std::vector<std::string> &texts) {
  std::vector<Embedding> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    out.push_back(get_embedding(text));
  }
  return out;
}

std::string OllamaClient::generate(const ConversationWindow &history,
                                   const std::string &query,
                                   const std::string &context) {
  ollama::messages messages;
  messages.push_back(ollama::message("system", settings_.system_prompt));
  for (const auto &turn : history) {
    messages.push_back(ollama::message(to_string(turn.role), turn.content));
  }
  if (context.find_first_not_of(" \t\r\n") != std::string::npos) {
    messages.push_back(ollama::message("system", "CONTEXT:\n" + context));
  }
  messages.push_back(ollama::message("user", query));

  ollama::options options;
  options["temperature"] = 0.0;
  options["num_predict"] = settings_.max_answer_tokens;

  try {
    nlohmann::json json_response;
    {
      std::lock_guard<std::mutex> lock(request_mutex_);
      ollama::response response = ollama::chat(settings_.generation_model, messages, options);
      json_response = response.as_json();
    }
    if (json_response.contains("error")) {
      throw GenerationError("Generation failed: " + json_response["error"].dump());
    }
    if (!json_response.contains("message") || !json_response["message"].contains("content")) {
      throw GenerationError("Generation response does not contain a message");
    }
    return json_response["message"]["content"].get<std::string>();
  } catch (const ollama::exception &e) {
    throw GenerationError("Generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw GenerationError("Malformed generation response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  std::lock_guard<std::mutex> lock(request_mutex_);
  return ollama::is_running();
}

}  // namespace docqa_core
