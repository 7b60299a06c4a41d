#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace ocrflow_cli
{

  enum class Command
  {
    Extract,
    Upload,
    Status,
    Result,
    Progress,
    Health,
    Metrics,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string job_id;
    int dpi = 0;          // 0: server default
    bool partial = false; // accept results of a failed job
    bool follow = false;  // stream progress until the job ends
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
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

    std::string build_url(const std::string &endpoint) const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_extract_command(const CliOptions &options);
    void handle_upload_command(const CliOptions &options);
    void handle_status_command(const CliOptions &options);
    void handle_result_command(const CliOptions &options);
    void handle_progress_command(const CliOptions &options);
    void handle_health_command(const CliOptions &options);
    void handle_metrics_command(const CliOptions &options);

    // HTTP methods
    std::string make_get_request(const std::string &endpoint);
    std::string make_file_upload_request(const std::string &endpoint, const std::string &file_path);
    std::string perform(const std::string &url);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    static std::string read_flag_value(int argc, char *argv[], int index);
    void print_json_response(const std::string &body);
    void print_extraction_response(const nlohmann::json &response);
    void print_help();
  };

}
