#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/index/metadata_table.hpp"
#include "docqa_core/services/retrieval_service.hpp"
#include "docqa_core/types/conversation.hpp"

// JSON <-> domain conversions for the HTTP layer. Malformed input throws
// docqa_core::InvalidParameterError.
namespace docqa_api {

nlohmann::json parse_json_body(const std::string &body);

std::string require_string(const nlohmann::json &body, const std::string &key);

std::vector<std::string> parse_questions(const nlohmann::json &body);

// {"source": s, "page_from": a, "page_to": b, "clause_number": c}; every key optional
docqa_core::RetrievalFilter parse_filter(const nlohmann::json &body);

docqa_core::ConversationWindow parse_history(const nlohmann::json &body);

int parse_top_k(const nlohmann::json &body, int default_top_k);

nlohmann::json chunk_to_json(const docqa_core::RetrievedChunk &chunk);

nlohmann::json history_to_json(const docqa_core::ConversationWindow &window);

// Returns the HTTP status to reject with, or nullopt when the request may proceed.
// No configured key is a server misconfiguration (500); a wrong or missing token is 401.
std::optional<int> check_bearer_auth(const std::string &authorization_header,
                                     const std::optional<std::string> &api_key);

}  // namespace docqa_api
