#include "docqa_cli/cli_handler.hpp"

#include <iomanip>
#include <iostream>

namespace docqa_cli {

namespace {

int parse_int_flag(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid number for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid number for " + flag + ": " + value);
  }
}

struct HeaderList {
  curl_slist *list = nullptr;
  ~HeaderList() {
    curl_slist_free_all(list);
  }
  void append(const std::string &header) {
    curl_slist *grown = curl_slist_append(list, header.c_str());
    if (!grown) {
      throw CliError("Failed to build request headers");
    }
    list = grown;
  }
};

}  // namespace

CliHandler::CliHandler(const std::string &api_base_url, const std::string &api_key)
    : api_base_url_(api_base_url), api_key_(api_key), curl_handle_(curl_easy_init()) {
  if (!curl_handle_) {
    throw CliError("Failed to initialize CURL");
  }
  while (!api_base_url_.empty() && api_base_url_.back() == '/') {
    api_base_url_.pop_back();
  }
}

CliHandler::~CliHandler() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

size_t CliHandler::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;
  if (argc < 2) {
    return options;
  }

  std::string command = argv[1];
  if (command == "health") {
    options.command = Command::Health;
  } else if (command == "process" || command == "p") {
    options.command = Command::Process;
  } else if (command == "search" || command == "s") {
    options.command = Command::Search;
  } else if (command == "chat" || command == "c") {
    options.command = Command::Chat;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; i += 2) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    std::string value = argv[i + 1];

    if (flag == "--url" || flag == "-u") {
      options.document_url = value;
    } else if (flag == "--question" || flag == "-q") {
      options.questions.push_back(value);
    } else if (flag == "--query") {
      options.query = value;
    } else if (flag == "--top-k" || flag == "-k") {
      options.top_k = parse_int_flag(flag, value);
    } else if (flag == "--source") {
      options.source = value;
    } else if (flag == "--page-from") {
      options.page_from = parse_int_flag(flag, value);
    } else if (flag == "--page-to") {
      options.page_to = parse_int_flag(flag, value);
    } else if (flag == "--clause") {
      options.clause_number = value;
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  if (options.command != Command::Health && options.document_url.empty()) {
    throw CliError("This command requires a document. Usage: " + command + " --url <url>");
  }
  if (options.command == Command::Process && options.questions.empty()) {
    throw CliError("Process command requires at least one --question");
  }
  if (options.command == Command::Search && options.query.empty()) {
    throw CliError("Search command requires a query. Usage: search --url <url> --query <query>");
  }
  if (options.top_k < 1) {
    throw CliError("--top-k must be at least 1");
  }
  return options;
}

nlohmann::json CliHandler::filters_to_json(const CliOptions &options) {
  nlohmann::json filters = nlohmann::json::object();
  if (options.source) {
    filters["source"] = *options.source;
  }
  if (options.page_from) {
    filters["page_from"] = *options.page_from;
  }
  if (options.page_to) {
    filters["page_to"] = *options.page_to;
  }
  if (options.clause_number) {
    filters["clause_number"] = *options.clause_number;
  }
  return filters.empty() ? nlohmann::json(nullptr) : filters;
}

void CliHandler::execute_command(const CliOptions &options, std::istream &input) {
  switch (options.command) {
    case Command::Health:
      handle_health_command();
      break;
    case Command::Process:
      handle_process_command(options);
      break;
    case Command::Search:
      handle_search_command(options);
      break;
    case Command::Chat:
      handle_chat_command(options, input);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

void CliHandler::handle_health_command() {
  nlohmann::json response = make_get_request("/health");
  std::cout << "API status: " << response.value("status", std::string("unknown")) << std::endl;
}

void CliHandler::handle_process_command(const CliOptions &options) {
  std::cout << "Processing document: " << options.document_url << std::endl;
  nlohmann::json request_data = {{"documents", options.document_url},
                                 {"questions", options.questions}};
  nlohmann::json response = make_post_request("/process-document", request_data);

  for (const auto &answer : response.value("answers", nlohmann::json::array())) {
    std::cout << "\nQ: " << answer.value("question", std::string()) << std::endl;
    std::cout << "A: " << answer.value("answer", std::string()) << std::endl;
  }
}

void CliHandler::handle_search_command(const CliOptions &options) {
  std::cout << "Search for: " << options.query << " (top_k: " << options.top_k << ")"
            << std::endl;
  nlohmann::json request_data = {
      {"documents", options.document_url}, {"query", options.query}, {"top_k", options.top_k}};
  nlohmann::json filters = filters_to_json(options);
  if (!filters.is_null()) {
    request_data["filters"] = filters;
  }

  nlohmann::json response = make_post_request("/search", request_data);
  print_chunks(response.value("results", nlohmann::json::array()));
}

void CliHandler::handle_chat_command(const CliOptions &options, std::istream &input) {
  std::cout << "Chatting about " << options.document_url << ". Type 'exit' to quit." << std::endl;
  nlohmann::json history = nlohmann::json::array();
  nlohmann::json filters = filters_to_json(options);

  std::string question;
  while (true) {
    std::cout << "\n> " << std::flush;
    if (!std::getline(input, question) || question == "exit" || question == "quit") {
      break;
    }
    if (question.find_first_not_of(" \t") == std::string::npos) {
      continue;
    }

    nlohmann::json request_data = {
        {"documents", options.document_url}, {"question", question}, {"history", history}};
    if (!filters.is_null()) {
      request_data["filters"] = filters;
    }
    try {
      nlohmann::json response = make_post_request("/ask", request_data);
      std::cout << response.value("answer", std::string()) << std::endl;
      history = response.value("history", nlohmann::json::array());
      if (response.contains("sources") && !response["sources"].empty()) {
        std::cout << "\nSources:" << std::endl;
        print_chunks(response["sources"]);
      }
    } catch (const CliError &e) {
      std::cerr << "Error: " << e.what() << std::endl;
    }
  }
}

void CliHandler::print_chunks(const nlohmann::json &chunks) {
  if (!chunks.is_array() || chunks.empty()) {
    std::cout << "No results found." << std::endl;
    return;
  }
  for (const auto &chunk : chunks) {
    std::string text = chunk.value("text", std::string());
    std::cout << "  * " << chunk.value("source", std::string("unknown"));
    if (chunk.contains("page") && !chunk["page"].is_null()) {
      std::cout << " p." << chunk["page"].get<int>();
    }
    if (chunk.contains("clause_number") && !chunk["clause_number"].is_null()) {
      std::cout << " [clause " << chunk["clause_number"].get<std::string>() << "]";
    }
    std::cout << " | Score: " << std::fixed << std::setprecision(3)
              << chunk.value("score", 0.0f) << std::endl;
    std::cout << "    " << text.substr(0, 100) << (text.size() > 100 ? "..." : "") << std::endl;
  }
}

nlohmann::json CliHandler::make_get_request(const std::string &endpoint) {
  return perform(build_url(endpoint), nullptr);
}

nlohmann::json CliHandler::make_post_request(const std::string &endpoint,
                                             const nlohmann::json &data) {
  const std::string request_json = data.dump();
  return perform(build_url(endpoint), &request_json);
}

nlohmann::json CliHandler::perform(const std::string &url, const std::string *post_body) {
  std::string response_buffer;
  HeaderList headers;
  headers.append("Content-Type: application/json");
  if (!api_key_.empty()) {
    headers.append("Authorization: Bearer " + api_key_);
  }

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.list);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
  if (post_body) {
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, post_body->c_str());
  }

  CURLcode res = curl_easy_perform(curl_handle_);
  if (res != CURLE_OK) {
    throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

  nlohmann::json response = nlohmann::json::parse(response_buffer, nullptr, false);
  if (http_code != 200) {
    std::string detail = response.is_object() ? response.value("error", std::string()) : "";
    throw CliError("HTTP request failed with status code: " + std::to_string(http_code) +
                   (detail.empty() ? "" : " (" + detail + ")"));
  }
  if (response.is_discarded()) {
    throw CliError("Server returned invalid JSON");
  }
  return response;
}

std::string CliHandler::build_url(const std::string &endpoint) const {
  return api_base_url_ + endpoint;
}

void CliHandler::print_help() {
  std::cout << R"(
DocQA CLI - Question answering over documents

Usage: docqa_cli <command> [options]

Commands:
  health          Check that the API is up

  process, p      Answer a batch of questions about a document
    --url, -u <url>          Document URL, server-side path or folder
    --question, -q <text>    Question to ask (repeatable)

  search, s       Retrieve the most similar chunks
    --url, -u <url>          Document URL or server-side path
    --query <text>           Search query
    --top-k, -k <num>        Number of results to return (default: 3)
    --source <name>          Only chunks from this source file
    --page-from <n>          First page to include
    --page-to <n>            Last page to include
    --clause <number>        Only chunks tagged with this clause, e.g. 4.2

  chat, c         Interactive questions with conversation memory
    --url, -u <url>          Document URL or server-side path
    (accepts the same filter options as search)

  help, h         Show this help message

Environment Variables:
  API_BASE_URL  Base URL for the DocQA API (default: http://127.0.0.1:3030)
  API_KEY       Bearer token sent with every request

Examples:
  docqa_cli process --url https://example.com/policy.txt -q "What is the grace period?"
  docqa_cli search --url ./policy.pdf --query "waiting period" --page-from 2 --page-to 3
  docqa_cli search --url ./policies/ --query "grace period" --source motor.md
  docqa_cli chat --url ./policy.md
)" << std::endl;
}

}  // namespace docqa_cli
