#include "docsage_cli/cli_handler.hpp"
#include <iostream>
#include <memory>

int main(int argc, char *argv[])
{
  try
  {
    docsage_cli::CliOptions options = docsage_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == docsage_cli::Command::Help)
    {
      docsage_cli::CliHandler::print_help();
      return 0;
    }

    docsage_core::Config config = docsage_core::Config::from_file(options.config_path);

    auto ollama_client = std::make_shared<docsage_core::OllamaClient>(
        config.ollama_url, config.embedding_model, config.generation_model,
        config.oracle_timeout_seconds);
    docsage_cli::CliHandler::verify_oracle(*ollama_client, config);

    auto pipeline = std::make_shared<docsage_core::RagPipeline>(config, ollama_client);

    docsage_cli::CliHandler handler(pipeline);
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
