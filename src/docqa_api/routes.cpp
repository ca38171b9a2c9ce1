#include "docqa_api/routes.hpp"

#include <iostream>

#include "docqa_api/request_parsing.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/services/qa_service.hpp"

namespace docqa_api {
Routes::Routes(std::shared_ptr<docqa_core::QaService> qa_service,
               std::optional<std::string> api_key)
    : qa_service_(std::move(qa_service)), api_key_(std::move(api_key)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/process-document")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_process_document(req); });

  // Older clients post PDF URLs here
  CROW_ROUTE(app, "/process-pdf")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_process_document(req); });

  CROW_ROUTE(app, "/ask").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ask(req);
  });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  return create_json_response({{"status", "healthy"}});
}

crow::response Routes::handle_process_document(const crow::request &req) {
  if (auto rejected = authorize(req)) {
    return std::move(*rejected);
  }
  try {
    nlohmann::json body = parse_json_body(req.body);
    std::string document_url = require_string(body, "documents");
    std::vector<std::string> questions = parse_questions(body);
    std::cout << "Answering " << questions.size() << " questions for " << document_url
              << std::endl;

    nlohmann::json answers = nlohmann::json::array();
    for (const auto &qa : qa_service_->answer_questions(document_url, questions)) {
      answers.push_back({{"question", qa.question}, {"answer", qa.answer}});
    }
    return create_json_response({{"answers", answers}});
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_process_document");
  }
}

crow::response Routes::handle_ask(const crow::request &req) {
  if (auto rejected = authorize(req)) {
    return std::move(*rejected);
  }
  try {
    nlohmann::json body = parse_json_body(req.body);
    std::string document_url = require_string(body, "documents");
    std::string question = require_string(body, "question");
    docqa_core::AskResult result = qa_service_->ask(document_url, question, parse_history(body),
                                                    parse_filter(body));

    nlohmann::json sources = nlohmann::json::array();
    for (const auto &chunk : result.sources) {
      sources.push_back(chunk_to_json(chunk));
    }
    return create_json_response({{"answer", result.answer},
                                 {"sources", sources},
                                 {"history", history_to_json(result.history)}});
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_ask");
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  if (auto rejected = authorize(req)) {
    return std::move(*rejected);
  }
  try {
    nlohmann::json body = parse_json_body(req.body);
    std::string document_url = require_string(body, "documents");
    if (!body.contains("query") || !body["query"].is_string()) {
      throw docqa_core::InvalidParameterError("Missing or invalid 'query' field");
    }
    std::string query = body["query"].get<std::string>();
    int top_k = parse_top_k(body, qa_service_->settings().top_k);

    std::cout << "Search for: " << query << " with top_k: " << top_k << std::endl;
    nlohmann::json results = nlohmann::json::array();
    for (const auto &chunk : qa_service_->search(document_url, query, top_k, parse_filter(body))) {
      results.push_back(chunk_to_json(chunk));
    }
    return create_json_response({{"results", results}, {"count", results.size()}});
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_search");
  }
}

std::optional<crow::response> Routes::authorize(const crow::request &req) {
  std::optional<int> status = check_bearer_auth(req.get_header_value("Authorization"), api_key_);
  if (!status) {
    return std::nullopt;
  }
  if (*status == 500) {
    std::cerr << "API_KEY is not configured; rejecting request" << std::endl;
    return create_json_response(create_error_response("Server API key is not configured"), 500);
  }
  return create_json_response(create_error_response("Invalid or missing bearer token"), 401);
}

crow::response Routes::error_response_for(const std::exception &e, const std::string &handler) {
  std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
  int status = 500;
  if (dynamic_cast<const docqa_core::InvalidParameterError *>(&e)) {
    status = 400;
  } else if (dynamic_cast<const docqa_core::NotFoundError *>(&e)) {
    status = 404;
  } else if (dynamic_cast<const docqa_core::DownloadError *>(&e) ||
             dynamic_cast<const docqa_core::ExtractionError *>(&e)) {
    status = 422;
  } else if (dynamic_cast<const docqa_core::GenerationError *>(&e) ||
             dynamic_cast<const docqa_core::OllamaError *>(&e)) {
    status = 502;
  }
  return create_json_response(create_error_response(e.what()), status);
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  return {{"success", false}, {"error", error}};
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response response(status_code, json_data.dump());
  response.set_header("Content-Type", "application/json");
  return response;
}

}  // namespace docqa_api
