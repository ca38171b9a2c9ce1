#pragma once

#include <curl/curl.h>

#include <iosfwd>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace docqa_cli {

enum class Command { Health, Process, Search, Chat, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string document_url;
  std::vector<std::string> questions;
  std::string query;
  int top_k = 3;
  std::optional<std::string> source;
  std::optional<int> page_from;
  std::optional<int> page_to;
  std::optional<std::string> clause_number;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  CliHandler(const std::string &api_base_url, const std::string &api_key);
  ~CliHandler();

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Parse command line arguments
  static CliOptions parse_arguments(int argc, char *argv[]);

  // Request body for the search filters carried by options; null when none are set
  static nlohmann::json filters_to_json(const CliOptions &options);

  // Execute command. Chat reads questions from input until EOF or "exit".
  void execute_command(const CliOptions &options, std::istream &input);

  std::string get_api_base_url() const {
    return api_base_url_;
  }

 private:
  std::string api_base_url_;
  std::string api_key_;
  CURL *curl_handle_;

  // Command handlers
  void handle_health_command();
  void handle_process_command(const CliOptions &options);
  void handle_search_command(const CliOptions &options);
  void handle_chat_command(const CliOptions &options, std::istream &input);

  // HTTP methods
  nlohmann::json make_get_request(const std::string &endpoint);
  nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
  nlohmann::json perform(const std::string &url, const std::string *post_body);

  // Helper methods
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
  static void print_chunks(const nlohmann::json &chunks);
  static void print_help();
  std::string build_url(const std::string &endpoint) const;
};

}  // namespace docqa_cli
