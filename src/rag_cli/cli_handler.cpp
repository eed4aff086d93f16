#include "rag_cli/cli_handler.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "rag_core/app_context.hpp"
#include "rag_core/async/worker.hpp"
#include "rag_core/db/knowledge_store.hpp"
#include "rag_core/embeddings/embedder.hpp"
#include "rag_core/services/document_service.hpp"
#include "rag_core/services/ingestion_service.hpp"
#include "rag_core/services/rag_service.hpp"

namespace rag_cli {

namespace {

// Flags that take a value
bool takes_value(const std::string& flag) {
  return flag == "--config" || flag == "--name" || flag == "--system-prompt" ||
         flag == "--temperature" || flag == "--top-k" || flag == "-k" || flag == "--mime" ||
         flag == "--model";
}

int parse_int(const std::string& flag, const std::string& value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError(flag + " expects an integer, got '" + value + "'");
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw CliError(flag + " expects an integer, got '" + value + "'");
  }
}

float parse_float(const std::string& flag, const std::string& value) {
  try {
    size_t consumed = 0;
    float parsed = std::stof(value, &consumed);
    if (consumed != value.size()) {
      throw CliError(flag + " expects a number, got '" + value + "'");
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw CliError(flag + " expects a number, got '" + value + "'");
  }
}

void require_positionals(const std::vector<std::string>& positionals, size_t count,
                         const std::string& usage) {
  if (positionals.size() < count) {
    throw CliError("Missing arguments. Usage: " + usage);
  }
}

rag_core::ChatbotConfig load_chatbot(rag_core::KnowledgeStore& store, const std::string& id) {
  auto chatbot = store.get_chatbot(id);
  if (!chatbot) {
    throw CliError("Chatbot not found: " + id);
  }
  return *chatbot;
}

void print_sources(const std::vector<rag_core::RetrievedChunk>& chunks, bool verbose) {
  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto& chunk = chunks[i];
    std::cout << "  [" << i + 1 << "] " << chunk.document_name << " (score: " << std::fixed
              << std::setprecision(3) << chunk.score << ")";
    if (verbose) {
      std::cout << " chunk " << chunk.chunk_id << "\n      " << chunk.content;
    }
    std::cout << std::endl;
  }
}

}  // namespace

CliHandler::CliHandler(rag_core::AppContext& context) : context_(context) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
  CliOptions options;
  std::vector<std::string> positionals;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--verbose" || arg == "-v") {
      options.verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      positionals.insert(positionals.begin(), "help");
    } else if (takes_value(arg)) {
      if (i + 1 >= argc) {
        throw CliError(arg + " requires a value");
      }
      std::string value = argv[++i];
      if (arg == "--config") {
        options.config_path = value;
        options.config_path_given = true;
      } else if (arg == "--name") {
        options.name = value;
      } else if (arg == "--system-prompt") {
        options.system_prompt = value;
      } else if (arg == "--model") {
        options.model_name = value;
      } else if (arg == "--temperature") {
        options.temperature = parse_float(arg, value);
      } else if (arg == "--top-k" || arg == "-k") {
        options.top_k = parse_int(arg, value);
      } else if (arg == "--mime") {
        options.mime_type = value;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw CliError("Unknown option: " + arg);
    } else {
      positionals.push_back(arg);
    }
  }

  if (positionals.empty()) {
    options.command = Command::Help;
    return options;
  }

  const std::string command = positionals.front();
  positionals.erase(positionals.begin());

  if (command == "create-chatbot") {
    options.command = Command::CreateChatbot;
    if (options.name.empty()) {
      throw CliError("create-chatbot requires --name. Usage: create-chatbot --name <name>");
    }
  } else if (command == "list-chatbots") {
    options.command = Command::ListChatbots;
  } else if (command == "upload") {
    options.command = Command::Upload;
    require_positionals(positionals, 2, "upload <chatbot_id> <file> [--mime <type>]");
    options.chatbot_id = positionals[0];
    options.file_path = positionals[1];
  } else if (command == "ingest") {
    options.command = Command::Ingest;
  } else if (command == "documents") {
    options.command = Command::Documents;
    require_positionals(positionals, 1, "documents <chatbot_id>");
    options.chatbot_id = positionals[0];
  } else if (command == "search" || command == "ask") {
    options.command = command == "search" ? Command::Search : Command::Ask;
    require_positionals(positionals, 2, command + " <chatbot_id> <text> [--top-k <k>]");
    options.chatbot_id = positionals[0];
    // the rest of the words form the query
    std::ostringstream query;
    for (size_t i = 1; i < positionals.size(); ++i) {
      query << (i > 1 ? " " : "") << positionals[i];
    }
    options.query = query.str();
  } else if (command == "chat") {
    options.command = Command::Chat;
    require_positionals(positionals, 1, "chat <chatbot_id>");
    options.chatbot_id = positionals[0];
  } else if (command == "reindex") {
    options.command = Command::Reindex;
    require_positionals(positionals, 1, "reindex <chatbot_id>");
    options.chatbot_id = positionals[0];
  } else if (command == "help") {
    options.command = Command::Help;
  } else {
    throw CliError("Unknown command: " + command);
  }

  return options;
}

void CliHandler::execute_command(const CliOptions& options) {
  switch (options.command) {
    case Command::CreateChatbot:
      handle_create_chatbot_command(options);
      break;
    case Command::ListChatbots:
      handle_list_chatbots_command(options);
      break;
    case Command::Upload:
      handle_upload_command(options);
      break;
    case Command::Ingest:
      handle_ingest_command(options);
      break;
    case Command::Documents:
      handle_documents_command(options);
      break;
    case Command::Search:
      handle_search_command(options);
      break;
    case Command::Ask:
      handle_ask_command(options);
      break;
    case Command::Chat:
      handle_chat_command(options);
      break;
    case Command::Reindex:
      handle_reindex_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

void CliHandler::handle_create_chatbot_command(const CliOptions& options) {
  rag_core::ChatbotConfig chatbot;
  chatbot.name = options.name;
  chatbot.system_prompt = options.system_prompt;
  chatbot.model_name =
      options.model_name.empty() ? context_.config().generation_model : options.model_name;
  if (options.temperature) {
    chatbot.temperature = *options.temperature;
  }
  if (options.top_k) {
    if (*options.top_k < 1) {
      throw CliError("--top-k must be at least 1");
    }
    chatbot.top_k = *options.top_k;
  }

  const std::string id = context_.store().create_chatbot(chatbot);
  std::cout << "Created chatbot " << id << " (" << chatbot.name << ")" << std::endl;
}

void CliHandler::handle_list_chatbots_command(const CliOptions& options) {
  auto chatbots = context_.store().list_chatbots();
  if (chatbots.empty()) {
    std::cout << "No chatbots." << std::endl;
    return;
  }
  for (const auto& chatbot : chatbots) {
    std::cout << chatbot.id << "  " << chatbot.name << "  (top_k " << chatbot.top_k
              << ", temperature " << chatbot.temperature << ")" << std::endl;
    if (options.verbose && !chatbot.system_prompt.empty()) {
      std::cout << "    prompt: " << chatbot.system_prompt << std::endl;
    }
  }
}

void CliHandler::handle_upload_command(const CliOptions& options) {
  std::ifstream file(options.file_path, std::ios::binary);
  if (!file.is_open()) {
    throw CliError("Could not open file: " + options.file_path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  const std::string bytes = buffer.str();

  const std::string mime_type = options.mime_type.empty()
                                    ? rag_core::DocumentService::guess_mime_type(options.file_path)
                                    : options.mime_type;
  rag_core::Document document = context_.documents().register_upload(
      options.chatbot_id, options.file_path, mime_type, bytes);

  std::cout << "Uploaded " << document.file_name << " as document " << document.id << " ("
            << document.mime_type << ", " << document.size_bytes << " bytes)" << std::endl;
  if (options.verbose) {
    std::cout << "  checksum: " << document.checksum << "\n  storage key: "
              << document.storage_key << std::endl;
  }
  std::cout << "Run 'rag_cli ingest' or start rag_worker to index it." << std::endl;
}

void CliHandler::handle_ingest_command(const CliOptions& /*options*/) {
  rag_core::async::Worker worker(0, context_.services(), context_.config().worker_poll_interval());
  int processed = 0;
  while (worker.run_one_task()) {
    ++processed;
  }
  std::cout << "Processed " << processed << " task(s)." << std::endl;
}

void CliHandler::handle_documents_command(const CliOptions& options) {
  load_chatbot(context_.store(), options.chatbot_id);
  auto documents = context_.store().list_documents(options.chatbot_id);
  if (documents.empty()) {
    std::cout << "No documents." << std::endl;
    return;
  }
  for (const auto& document : documents) {
    std::cout << document.id << "  " << std::left << std::setw(10)
              << rag_core::to_string(document.status) << "  " << document.file_name;
    if (document.status == rag_core::DocumentStatus::Ready) {
      std::cout << "  (" << context_.store().count_chunks_for_document(document.id)
                << " chunks)";
    }
    std::cout << std::endl;
    if (document.error) {
      std::cout << "    error: " << *document.error << std::endl;
    }
  }
}

void CliHandler::handle_search_command(const CliOptions& options) {
  const auto chatbot = load_chatbot(context_.store(), options.chatbot_id);
  rag_core::RagService& rag = context_.rag();
  const int top_k = rag.effective_top_k(chatbot, options.top_k);

  std::cout << "Search for: " << options.query << " (top_k: " << top_k << ")" << std::endl;
  auto results = rag.retrieve(chatbot, options.query, top_k);
  if (results.empty()) {
    std::cout << "No results." << std::endl;
    return;
  }
  print_sources(results, true);
}

void CliHandler::handle_ask_command(const CliOptions& options) {
  const auto chatbot = load_chatbot(context_.store(), options.chatbot_id);
  rag_core::RagResponse response =
      context_.rag().respond(chatbot, options.query, {}, options.top_k);

  std::cout << response.answer << std::endl;
  if (!response.context.empty()) {
    std::cout << "\nSources:" << std::endl;
    print_sources(response.context, options.verbose);
  }
}

void CliHandler::handle_chat_command(const CliOptions& options) {
  const auto chatbot = load_chatbot(context_.store(), options.chatbot_id);
  rag_core::RagService& rag = context_.rag();
  std::vector<rag_core::HistoryTurn> history;

  std::cout << "Chatting with " << chatbot.name << ". Type 'exit' to quit." << std::endl;
  std::string line;
  while (true) {
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line) || line == "exit" || line == "quit") {
      break;
    }
    try {
      rag_core::RagResponse response = rag.respond(chatbot, line, history, options.top_k);
      std::cout << response.answer << std::endl;
      if (options.verbose) {
        print_sources(response.context, false);
      }
      history.push_back({"user", line});
      history.push_back({"assistant", response.answer});
    } catch (const rag_core::RagValidationError&) {
      continue;
    } catch (const rag_core::RagGenerationError& e) {
      std::cerr << "Error: " << e.what() << std::endl;
    }
  }
}

void CliHandler::handle_reindex_command(const CliOptions& options) {
  load_chatbot(context_.store(), options.chatbot_id);
  const size_t count = context_.ingestion().rebuild_index(options.chatbot_id);
  std::cout << "Reindexed " << count << " chunk(s) for chatbot " << options.chatbot_id
            << " with " << context_.embedder().model_id() << std::endl;
}

void CliHandler::print_help() {
  std::cout << "rag_cli - chatbot knowledge base tool\n\n"
            << "Usage: rag_cli [--config <path>] [--verbose] <command> [args]\n\n"
            << "Commands:\n"
            << "  create-chatbot --name <name> [--system-prompt <text>] [--temperature <t>]\n"
            << "                 [--top-k <k>] [--model <generation model>]\n"
            << "  list-chatbots\n"
            << "  upload <chatbot_id> <file> [--mime <type>]\n"
            << "  ingest                          process every pending ingestion task\n"
            << "  documents <chatbot_id>\n"
            << "  search <chatbot_id> <query> [--top-k <k>]\n"
            << "  ask <chatbot_id> <message> [--top-k <k>]\n"
            << "  chat <chatbot_id>               interactive conversation\n"
            << "  reindex <chatbot_id>            re-embed all chunks and rebuild the index\n"
            << "  help\n"
            << std::endl;
}

}  // namespace rag_cli
