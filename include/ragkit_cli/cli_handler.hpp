#pragma once

#include <optional>
#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace ragkit_cli
{

  enum class Command
  {
    Query,
    Ingest,
    Health,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string query;
    std::string file_path;
    std::string source;
    std::optional<std::string> doc_id;
    std::optional<std::string> tenant;
    int top_k = 5;
    std::optional<int> budget;
    bool rerank = true;
    bool plan = false;
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

    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments; throws CliError on bad usage
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Request body sent to /api/query for these options
    static nlohmann::json build_query_body(const CliOptions &options);

    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_query_command(const CliOptions &options);
    void handle_ingest_command(const CliOptions &options);
    void handle_health_command();
    void handle_help_command();

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint,
                                     const nlohmann::json &data,
                                     const std::optional<std::string> &tenant);
    nlohmann::json perform(const std::string &endpoint);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_query_response(const nlohmann::json &response);
    std::string build_url(const std::string &endpoint);
  };

}
