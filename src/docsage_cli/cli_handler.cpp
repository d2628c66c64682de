#include "docsage_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <stdexcept>

namespace docsage_cli {

namespace {

constexpr size_t PREVIEW_CHARS = 240;

int parse_top_k(const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("--top-k expects an integer, got '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw CliError("--top-k expects an integer, got '" + value + "'");
    }
}

std::string display_name(const docsage_core::RetrievedChunk& chunk) {
    if (chunk.metadata.contains("filename") && chunk.metadata["filename"].is_string()) {
        return chunk.metadata["filename"].get<std::string>();
    }
    return chunk.source;
}

}  // namespace

CliHandler::CliHandler(std::shared_ptr<docsage_core::RagPipeline> pipeline)
    : pipeline_(std::move(pipeline)) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    // The command is the first argument that is not part of a global flag
    std::string command;
    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                throw CliError("--config requires a path");
            }
            options.config_path = argv[++i];
        } else if (command.empty() && !arg.empty() && arg[0] != '-') {
            command = arg;
        } else if (command.empty() && (arg == "--help" || arg == "-h")) {
            command = "help";
        } else {
            rest.push_back(arg);
        }
    }

    if (command.empty() || command == "help" || command == "h") {
        options.command = Command::Help;
        return options;
    }

    if (command == "build" || command == "b") {
        options.command = Command::Build;
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
    } else if (command == "ask" || command == "a") {
        options.command = Command::Ask;
    } else if (command == "info" || command == "i") {
        options.command = Command::Info;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (size_t i = 0; i < rest.size(); ++i) {
        const std::string& flag = rest[i];
        if (flag == "--show-sources") {
            options.show_sources = true;
            continue;
        }
        if (flag == "--query" || flag == "-q" || flag == "--top-k" || flag == "-k") {
            if (i + 1 >= rest.size()) {
                throw CliError(flag + " requires a value");
            }
            const std::string& value = rest[++i];
            if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else {
                options.top_k = parse_top_k(value);
            }
            continue;
        }
        throw CliError("Unknown option for " + command + ": " + flag);
    }

    if ((options.command == Command::Search || options.command == Command::Ask) &&
        options.query.empty()) {
        throw CliError("The " + command + " command requires a query. Usage: " + command +
                       " --query <text>");
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Build:
            handle_build_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Ask:
            handle_ask_command(options);
            break;
        case Command::Info:
            handle_info_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::verify_oracle(docsage_core::OllamaClient& client,
                               const docsage_core::Config& config) {
    if (!client.is_server_available()) {
        throw CliError("Ollama server is not running at " + config.ollama_url);
    }

    const std::vector<std::string> installed = client.list_models();
    for (const std::string& model : {config.embedding_model, config.generation_model}) {
        if (has_model(installed, model)) {
            continue;
        }
        if (!config.pull_missing_models) {
            throw CliError("Model '" + model + "' is not installed. Run `ollama pull " + model +
                           "` or set pull_missing_models in the config");
        }
        std::cout << "Pulling model " << model << "..." << std::endl;
        if (!client.pull_model(model)) {
            throw CliError("Failed to pull model '" + model + "'");
        }
    }
}

bool CliHandler::has_model(const std::vector<std::string>& installed, const std::string& model) {
    for (const auto& name : installed) {
        // Ollama reports untagged models as "<name>:latest"
        if (name == model || name == model + ":latest") {
            return true;
        }
    }
    return false;
}

int CliHandler::resolve_top_k(const CliOptions& options) const {
    return options.top_k >= 0 ? options.top_k : pipeline_->config().top_k;
}

void CliHandler::handle_build_command(const CliOptions& /*options*/) {
    auto index = pipeline_->rebuild_index();
    std::cout << "Index built: " << index->size() << " chunks from " << index->document_count()
              << " documents -> " << pipeline_->config().index_path << std::endl;
}

void CliHandler::handle_search_command(const CliOptions& options) {
    pipeline_->build_or_load_index();
    auto results = pipeline_->retrieve(options.query, resolve_top_k(options));
    if (results.empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }
    std::cout << "Found " << results.size() << " results for \"" << options.query << "\":"
              << std::endl;
    print_results(results, true);
}

void CliHandler::handle_ask_command(const CliOptions& options) {
    pipeline_->build_or_load_index();
    auto results = pipeline_->retrieve(options.query, resolve_top_k(options));

    try {
        std::string answer = pipeline_->generate(options.query, results);
        std::cout << answer << std::endl;
    } catch (const docsage_core::GenerationError&) {
        // The retrieved context is still useful to the user
        if (!results.empty()) {
            std::cerr << "Generation failed. Retrieved sources:" << std::endl;
            print_results(results, false);
        }
        throw;
    }

    if (options.show_sources && !results.empty()) {
        std::cout << "\nSources:" << std::endl;
        print_results(results, false);
    }
}

void CliHandler::handle_info_command(const CliOptions& /*options*/) {
    auto index = pipeline_->build_or_load_index();
    const auto& config = pipeline_->config();
    const auto& fingerprint = index->fingerprint();

    std::cout << "Index: " << config.index_path << std::endl;
    std::cout << "  Sources:        " << config.docs_dir << std::endl;
    std::cout << "  Entries:        " << index->size() << std::endl;
    std::cout << "  Documents:      " << index->document_count() << std::endl;
    std::cout << "  Dimension:      " << fingerprint.dimension << std::endl;
    std::cout << "  Model:          " << fingerprint.embedding_model << std::endl;
    std::cout << "  Chunk size:     " << fingerprint.chunk_size << " (overlap "
              << fingerprint.chunk_overlap << ")" << std::endl;
    std::cout << "  Search mode:    " << docsage_core::to_string(index->search_options().mode)
              << std::endl;
}

void CliHandler::print_results(const docsage_core::RetrievalResult& results, bool with_content) {
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& chunk = results[i];
        std::cout << "[" << (i + 1) << "] " << std::fixed << std::setprecision(4) << chunk.score
                  << "  " << display_name(chunk) << " (" << chunk.source << ", chunk "
                  << chunk.chunk_index << ")" << std::endl;
        if (with_content) {
            std::string preview = chunk.content.substr(0, PREVIEW_CHARS);
            // Do not end the preview inside a UTF-8 sequence
            while (!preview.empty() && preview.size() < chunk.content.size() &&
                   (static_cast<unsigned char>(chunk.content[preview.size()]) & 0xC0) == 0x80) {
                preview.pop_back();
            }
            std::cout << "    " << preview << (preview.size() < chunk.content.size() ? "..." : "")
                      << std::endl;
        }
    }
}

void CliHandler::print_help() {
    std::cout << "docsage - question answering over a local document collection\n\n"
              << "Usage: docsage [--config <path>] <command> [options]\n\n"
              << "Commands:\n"
              << "  build                         Rebuild the index from docs_dir and save it\n"
              << "  search --query <q> [--top-k N]\n"
              << "                                Show the most similar chunks with scores\n"
              << "  ask --query <q> [--top-k N] [--show-sources]\n"
              << "                                Answer a question from the retrieved chunks\n"
              << "  info                          Show index statistics\n"
              << "  help                          Show this message\n\n"
              << "Global options:\n"
              << "  --config, -c <path>           Configuration file (default: docsagerc.json)\n";
}

}  // namespace docsage_cli
