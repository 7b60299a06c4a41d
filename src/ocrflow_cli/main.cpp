#include "ocrflow_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    // OCRFLOW_API_URL wins over the generic API_BASE_URL
    const char *api_url = std::getenv("OCRFLOW_API_URL");
    if (!api_url || !*api_url)
    {
      api_url = std::getenv("API_BASE_URL");
    }
    std::string base_url = (api_url && *api_url) ? api_url : "http://127.0.0.1:8001";

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exit_code = 0;
    {
      ocrflow_cli::CliHandler handler(base_url);
      ocrflow_cli::CliOptions options = handler.parse_arguments(argc, argv);
      try
      {
        handler.execute_command(options);
      }
      catch (const std::exception &e)
      {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
      }
    }
    curl_global_cleanup();
    return exit_code;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
