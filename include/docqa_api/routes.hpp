#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "server.hpp"

namespace docqa_core {
class QaService;
}  // namespace docqa_core

namespace docqa_api {

class Routes {
 public:
  // api_key is the expected bearer token; nullopt rejects every protected request with 500
  Routes(std::shared_ptr<docqa_core::QaService> qa_service, std::optional<std::string> api_key);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

 private:
  std::shared_ptr<docqa_core::QaService> qa_service_;
  std::optional<std::string> api_key_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_process_document(const crow::request &req);
  crow::response handle_ask(const crow::request &req);
  crow::response handle_search(const crow::request &req);

  // Helper methods
  std::optional<crow::response> authorize(const crow::request &req);
  crow::response error_response_for(const std::exception &e, const std::string &handler);
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace docqa_api
