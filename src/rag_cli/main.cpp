#include <filesystem>
#include <iostream>

#include "rag_cli/cli_handler.hpp"
#include "rag_core/app_context.hpp"
#include "rag_core/config.hpp"

int main(int argc, char *argv[])
{
  try
  {
    rag_cli::CliOptions options = rag_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == rag_cli::Command::Help)
    {
      rag_cli::CliHandler::print_help();
      return 0;
    }

    rag_core::Config config = rag_core::Config::defaults();
    if (options.config_path_given || std::filesystem::exists(options.config_path))
    {
      config = rag_core::Config::from_file(options.config_path);
    }
    else if (options.verbose)
    {
      std::cerr << "Warning: " << options.config_path << " not found, using defaults" << std::endl;
    }

    rag_core::AppContext context(config);
    rag_cli::CliHandler handler(context);
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
