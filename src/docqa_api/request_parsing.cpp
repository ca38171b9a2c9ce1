#include "docqa_api/request_parsing.hpp"

#include <stdexcept>

#include "docqa_core/errors.hpp"

namespace docqa_api {

using docqa_core::InvalidParameterError;

nlohmann::json parse_json_body(const std::string &body) {
  try {
    nlohmann::json json = nlohmann::json::parse(body);
    if (!json.is_object()) {
      throw InvalidParameterError("Request body must be a JSON object");
    }
    return json;
  } catch (const nlohmann::json::parse_error &e) {
    throw InvalidParameterError("Invalid JSON format: " + std::string(e.what()));
  }
}

std::string require_string(const nlohmann::json &body, const std::string &key) {
  if (!body.contains(key) || !body[key].is_string()) {
    throw InvalidParameterError("Missing or invalid '" + key + "' field");
  }
  std::string value = body[key].get<std::string>();
  if (value.empty()) {
    throw InvalidParameterError("'" + key + "' cannot be empty");
  }
  return value;
}

std::vector<std::string> parse_questions(const nlohmann::json &body) {
  if (!body.contains("questions") || !body["questions"].is_array()) {
    throw InvalidParameterError("Missing or invalid 'questions' field");
  }
  std::vector<std::string> questions;
  for (const auto &question : body["questions"]) {
    if (!question.is_string()) {
      throw InvalidParameterError("Every question must be a string");
    }
    questions.push_back(question.get<std::string>());
  }
  if (questions.empty()) {
    throw InvalidParameterError("'questions' cannot be empty");
  }
  return questions;
}

docqa_core::RetrievalFilter parse_filter(const nlohmann::json &body) {
  docqa_core::RetrievalFilter filter;
  if (!body.contains("filters") || body["filters"].is_null()) {
    return filter;
  }
  const nlohmann::json &filters = body["filters"];
  if (!filters.is_object()) {
    throw InvalidParameterError("'filters' must be an object");
  }

  auto optional_string = [&filters](const char *key) -> std::optional<std::string> {
    if (!filters.contains(key) || filters[key].is_null()) {
      return std::nullopt;
    }
    if (!filters[key].is_string()) {
      throw InvalidParameterError(std::string("Filter '") + key + "' must be a string");
    }
    return filters[key].get<std::string>();
  };
  auto optional_page = [&filters](const char *key) -> std::optional<int> {
    if (!filters.contains(key) || filters[key].is_null()) {
      return std::nullopt;
    }
    if (!filters[key].is_number_integer() || filters[key].get<int>() < 1) {
      throw InvalidParameterError(std::string("Filter '") + key + "' must be a positive integer");
    }
    return filters[key].get<int>();
  };

  filter.source = optional_string("source");
  filter.clause_number = optional_string("clause_number");
  filter.page_from = optional_page("page_from");
  filter.page_to = optional_page("page_to");
  return filter;
}

docqa_core::ConversationWindow parse_history(const nlohmann::json &body) {
  docqa_core::ConversationWindow window;
  if (!body.contains("history") || body["history"].is_null()) {
    return window;
  }
  if (!body["history"].is_array()) {
    throw InvalidParameterError("'history' must be an array");
  }
  for (const auto &turn : body["history"]) {
    if (!turn.is_object() || !turn.contains("role") || !turn["role"].is_string() ||
        !turn.contains("content") || !turn["content"].is_string()) {
      throw InvalidParameterError("Each history entry needs string 'role' and 'content'");
    }
    try {
      window.push_back({docqa_core::role_from_string(turn["role"].get<std::string>()),
                        turn["content"].get<std::string>()});
    } catch (const std::invalid_argument &e) {
      throw InvalidParameterError(e.what());
    }
  }
  return window;
}

int parse_top_k(const nlohmann::json &body, int default_top_k) {
  if (!body.contains("top_k")) {
    return default_top_k;
  }
  if (!body["top_k"].is_number_integer() || body["top_k"].get<int>() < 1) {
    throw InvalidParameterError("'top_k' must be a positive integer");
  }
  return body["top_k"].get<int>();
}

nlohmann::json chunk_to_json(const docqa_core::RetrievedChunk &chunk) {
  nlohmann::json json;
  json["text"] = chunk.text;
  json["source"] = chunk.source;
  json["page"] = chunk.page ? nlohmann::json(*chunk.page) : nlohmann::json(nullptr);
  json["clause_number"] =
      chunk.clause_number ? nlohmann::json(*chunk.clause_number) : nlohmann::json(nullptr);
  json["score"] = chunk.score;
  return json;
}

nlohmann::json history_to_json(const docqa_core::ConversationWindow &window) {
  nlohmann::json turns = nlohmann::json::array();
  for (const auto &turn : window) {
    turns.push_back({{"role", docqa_core::to_string(turn.role)}, {"content", turn.content}});
  }
  return turns;
}

std::optional<int> check_bearer_auth(const std::string &authorization_header,
                                     const std::optional<std::string> &api_key) {
  if (!api_key || api_key->empty()) {
    return 500;
  }
  const std::string prefix = "Bearer ";
  if (authorization_header.compare(0, prefix.size(), prefix) != 0 ||
      authorization_header.substr(prefix.size()) != *api_key) {
    return 401;
  }
  return std::nullopt;
}

}  // namespace docqa_api
