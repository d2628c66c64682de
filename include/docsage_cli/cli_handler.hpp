#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docsage_core/config.hpp"
#include "docsage_core/llm/ollama_client.hpp"
#include "docsage_core/pipeline/rag_pipeline.hpp"

namespace docsage_cli
{

  enum class Command
  {
    Build,
    Search,
    Ask,
    Info,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string query;
    int top_k = -1;  // -1 means use the configured top_k
    std::string config_path = "docsagerc.json";
    bool show_sources = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(std::shared_ptr<docsage_core::RagPipeline> pipeline);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    // Checks the server is up and both models are installed, pulling them when
    // pull_missing_models is set. Throws CliError otherwise.
    static void verify_oracle(docsage_core::OllamaClient &client, const docsage_core::Config &config);

    static void print_help();

  private:
    std::shared_ptr<docsage_core::RagPipeline> pipeline_;

    // Command handlers
    void handle_build_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_ask_command(const CliOptions &options);
    void handle_info_command(const CliOptions &options);

    // Helper methods
    int resolve_top_k(const CliOptions &options) const;
    void print_results(const docsage_core::RetrievalResult &results, bool with_content);
    static bool has_model(const std::vector<std::string> &installed, const std::string &model);
  };

}
