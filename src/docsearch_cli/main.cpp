#include <iostream>

#include "docsearch_cli/cli_handler.hpp"

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    docsearch_cli::CliOptions options = docsearch_cli::CliHandler::parse_arguments(argc, argv);

    docsearch_cli::Config config = docsearch_cli::CliHandler::load_config(options.config_path);

    docsearch_cli::CliHandler handler(config);
    handler.execute_command(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
