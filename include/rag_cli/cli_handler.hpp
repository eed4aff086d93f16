#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rag_core {
class AppContext;
}

namespace rag_cli
{

  enum class Command
  {
    CreateChatbot,
    ListChatbots,
    Upload,
    Ingest,
    Documents,
    Search,
    Ask,
    Chat,
    Reindex,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string chatbot_id;
    std::string file_path;
    std::string query;
    std::string name;
    std::string system_prompt;
    std::string model_name;
    std::string mime_type;
    std::optional<float> temperature;
    std::optional<int> top_k;
    std::string config_path = "ragrc.json";
    bool config_path_given = false;
    bool verbose = false;
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
    explicit CliHandler(rag_core::AppContext &context);
    ~CliHandler() = default;

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments; throws CliError on bad usage
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    static void print_help();

  private:
    rag_core::AppContext &context_;

    // Command handlers
    void handle_create_chatbot_command(const CliOptions &options);
    void handle_list_chatbots_command(const CliOptions &options);
    void handle_upload_command(const CliOptions &options);
    void handle_ingest_command(const CliOptions &options);
    void handle_documents_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_ask_command(const CliOptions &options);
    void handle_chat_command(const CliOptions &options);
    void handle_reindex_command(const CliOptions &options);
  };

}  // namespace rag_cli
