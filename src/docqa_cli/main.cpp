#include <cstdlib>
#include <iostream>

#include "docqa_cli/cli_handler.hpp"

int main(int argc, char *argv[]) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  int exit_code = 0;
  try {
    const char *api_base_url = std::getenv("API_BASE_URL");
    const char *api_key = std::getenv("API_KEY");

    docqa_cli::CliOptions options = docqa_cli::CliHandler::parse_arguments(argc, argv);
    docqa_cli::CliHandler handler(api_base_url ? api_base_url : "http://127.0.0.1:3030",
                                  api_key ? api_key : "");
    handler.execute_command(options, std::cin);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }
  curl_global_cleanup();
  return exit_code;
}
