#include "ragkit_cli/cli_handler.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ragkit_cli {

namespace {

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

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    // Flags that take a value; anything else starting with "--" is a switch.
    auto value_for = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw CliError(flag + " requires a value");
        }
        return argv[++i];
    };

    if (command == "query" || command == "q") {
        options.command = Command::Query;
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--top-k" || arg == "-k") {
                options.top_k = parse_int(arg, value_for(i, arg));
            } else if (arg == "--doc-id") {
                options.doc_id = value_for(i, arg);
            } else if (arg == "--budget") {
                options.budget = parse_int(arg, value_for(i, arg));
            } else if (arg == "--tenant") {
                options.tenant = value_for(i, arg);
            } else if (arg == "--no-rerank") {
                options.rerank = false;
            } else if (arg == "--plan") {
                options.plan = true;
            } else if (arg.rfind("--", 0) == 0) {
                throw CliError("Unknown option for query: " + arg);
            } else if (options.query.empty()) {
                options.query = arg;
            } else {
                options.query += " " + arg;
            }
        }
        if (options.query.empty()) {
            throw CliError("Query command requires a question. Usage: query \"<text>\" [--top-k N]");
        }
    } else if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--file" || arg == "-f") {
                options.file_path = value_for(i, arg);
            } else if (arg == "--source") {
                options.source = value_for(i, arg);
            } else if (arg == "--doc-id") {
                options.doc_id = value_for(i, arg);
            } else if (arg == "--tenant") {
                options.tenant = value_for(i, arg);
            } else {
                throw CliError("Unknown option for ingest: " + arg);
            }
        }
        if (options.file_path.empty()) {
            throw CliError("Ingest command requires a file. Usage: ingest --file <path>");
        }
        if (options.source.empty()) {
            options.source = std::filesystem::path(options.file_path).filename().string();
        }
    } else if (command == "health") {
        options.command = Command::Health;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

nlohmann::json CliHandler::build_query_body(const CliOptions& options) {
    nlohmann::json body;
    body["query"] = options.query;
    body["k"] = options.top_k;
    body["rerank"] = options.rerank;
    if (options.doc_id) {
        body["doc_id"] = *options.doc_id;
    }
    if (options.budget) {
        body["max_context_tokens"] = *options.budget;
    }
    if (options.plan) {
        body["enable_planning"] = true;
    }
    return body;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Query:
            handle_query_command(options);
            break;
        case Command::Ingest:
            handle_ingest_command(options);
            break;
        case Command::Health:
            handle_health_command();
            break;
        case Command::Help:
            handle_help_command();
            break;
    }
}

void CliHandler::handle_query_command(const CliOptions& options) {
    nlohmann::json response = make_post_request("/api/query", build_query_body(options), options.tenant);
    print_query_response(response);
}

void CliHandler::handle_ingest_command(const CliOptions& options) {
    std::ifstream file_stream(options.file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        throw CliError("Could not open file: " + options.file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();

    nlohmann::json body;
    body["text"] = buffer.str();
    body["source"] = options.source;
    if (options.doc_id) {
        body["doc_id"] = *options.doc_id;
    }

    nlohmann::json response = make_post_request("/api/ingest", body, options.tenant);
    std::cout << "Ingested " << response.value("chunks", 0) << " chunks from "
              << response.value("source", options.source) << std::endl;
    std::cout << "Document ID: " << response.value("doc_id", std::string()) << std::endl;
}

void CliHandler::handle_health_command() {
    nlohmann::json response = make_get_request("/health");
    std::cout << "Status: " << response.value("status", std::string("unknown")) << std::endl;
    std::cout << "Index: " << response.value("index_state", std::string("unknown")) << " ("
              << response.value("indexed_chunks", 0) << " chunks, dimension "
              << response.value("dimension", 0) << ")" << std::endl;
}

void CliHandler::handle_help_command() {
    std::cout << "ragkit - query and feed a ragkit server\n\n"
              << "Usage:\n"
              << "  ragkit query \"<text>\" [--top-k N] [--doc-id ID] [--budget N] [--no-rerank] [--plan] [--tenant T]\n"
              << "  ragkit ingest --file <path> [--source NAME] [--doc-id ID] [--tenant T]\n"
              << "  ragkit health\n"
              << "  ragkit help\n\n"
              << "Environment:\n"
              << "  API_BASE_URL  server address (default http://127.0.0.1:3030)\n";
}

void CliHandler::print_query_response(const nlohmann::json& response) {
    std::cout << response.value("answer", std::string()) << "\n" << std::endl;

    if (response.contains("tool_used") && response["tool_used"].is_string()) {
        std::cout << "Tool: " << response["tool_used"].get<std::string>() << std::endl;
    }

    if (response.contains("citations") && response["citations"].contains("used")) {
        const auto& used = response["citations"]["used"];
        if (!used.empty()) {
            std::cout << "Sources:" << std::endl;
            for (const auto& citation : used) {
                std::cout << "  [" << citation.value("source", std::string("unknown")) << "#"
                          << citation.value("chunk_index", 0) << "]" << std::endl;
            }
        }
    }

    if (response.contains("results")) {
        std::cout << "Retrieved " << response["results"].size() << " chunks:" << std::endl;
        for (const auto& result : response["results"]) {
            std::cout << "  " << std::fixed << std::setprecision(4) << result.value("score", 0.0)
                      << "  " << result.value("source", std::string("unknown")) << "#"
                      << result.value("chunk_index", 0) << std::endl;
        }
    }

    if (response.contains("follow_ups") && !response["follow_ups"].empty()) {
        std::cout << "\nYou could also ask:" << std::endl;
        for (const auto& question : response["follow_ups"]) {
            if (question.is_string()) {
                std::cout << "  - " << question.get<std::string>() << std::endl;
            }
        }
    }
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    return perform(endpoint);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint,
                                             const nlohmann::json& data,
                                             const std::optional<std::string>& tenant) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    std::string payload = data.dump();

    curl_easy_reset(curl_handle_);
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (tenant) {
        headers = curl_slist_append(headers, ("X-Tenant-Id: " + *tenant).c_str());
    }
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));

    try {
        nlohmann::json response = perform(endpoint);
        curl_slist_free_all(headers);
        return response;
    } catch (...) {
        curl_slist_free_all(headers);
        throw;
    }
}

nlohmann::json CliHandler::perform(const std::string& endpoint) {
    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code != 200) {
        std::string detail = "HTTP request failed with status code: " + std::to_string(http_code);
        if (body.is_object() && body.contains("error") && body["error"].is_string()) {
            detail += " (" + body["error"].get<std::string>() + ")";
        }
        throw CliError(detail);
    }
    if (body.is_discarded()) {
        throw CliError("Server returned invalid JSON");
    }
    return body;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string base = api_base_url_;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + endpoint;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

}  // namespace ragkit_cli
