#include "ocrflow_cli/cli_handler.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>

namespace ocrflow_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    while (!api_base_url_.empty() && api_base_url_.back() == '/') {
        api_base_url_.pop_back();
    }
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

std::string CliHandler::read_flag_value(int argc, char* argv[], int index) {
    if (index + 1 >= argc) {
        throw CliError(std::string("Missing value for ") + argv[index]);
    }
    return argv[index + 1];
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "extract" || command == "e") {
        options.command = Command::Extract;
    } else if (command == "upload" || command == "u") {
        options.command = Command::Upload;
    } else if (command == "status" || command == "s") {
        options.command = Command::Status;
    } else if (command == "result" || command == "r") {
        options.command = Command::Result;
    } else if (command == "progress" || command == "p") {
        options.command = Command::Progress;
    } else if (command == "health") {
        options.command = Command::Health;
        return options;
    } else if (command == "metrics") {
        options.command = Command::Metrics;
        return options;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--file" || flag == "-f") {
            options.file_path = read_flag_value(argc, argv, i++);
        } else if (flag == "--id" || flag == "-i") {
            options.job_id = read_flag_value(argc, argv, i++);
        } else if (flag == "--dpi" || flag == "-d") {
            std::string value = read_flag_value(argc, argv, i++);
            try {
                options.dpi = std::stoi(value);
            } catch (const std::exception&) {
                throw CliError("--dpi expects an integer, got '" + value + "'");
            }
        } else if (flag == "--partial") {
            options.partial = true;
        } else if (flag == "--follow") {
            options.follow = true;
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    bool needs_file = options.command == Command::Extract || options.command == Command::Upload;
    if (needs_file && options.file_path.empty()) {
        throw CliError("Command '" + command + "' requires a file. Usage: " + command + " --file <path>");
    }
    if (!needs_file && options.job_id.empty()) {
        throw CliError("Command '" + command + "' requires a job ID. Usage: " + command + " --id <job_id>");
    }
    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Extract:
            handle_extract_command(options);
            break;
        case Command::Upload:
            handle_upload_command(options);
            break;
        case Command::Status:
            handle_status_command(options);
            break;
        case Command::Result:
            handle_result_command(options);
            break;
        case Command::Progress:
            handle_progress_command(options);
            break;
        case Command::Health:
            handle_health_command(options);
            break;
        case Command::Metrics:
            handle_metrics_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_extract_command(const CliOptions& options) {
    std::cout << "Extracting text from: " << options.file_path << std::endl;
    std::string endpoint = "/extract";
    if (options.dpi > 0) {
        endpoint += "?dpi=" + std::to_string(options.dpi);
    }
    std::string body = make_file_upload_request(endpoint, options.file_path);
    print_extraction_response(nlohmann::json::parse(body));
}

void CliHandler::handle_upload_command(const CliOptions& options) {
    std::cout << "Uploading: " << options.file_path << std::endl;
    print_json_response(make_file_upload_request("/upload", options.file_path));
}

void CliHandler::handle_status_command(const CliOptions& options) {
    print_json_response(make_get_request("/status/" + options.job_id));
}

void CliHandler::handle_result_command(const CliOptions& options) {
    std::string endpoint = "/result/" + options.job_id;
    if (options.partial) {
        endpoint += "?partial=true";
    }
    print_json_response(make_get_request(endpoint));
}

void CliHandler::handle_progress_command(const CliOptions& options) {
    if (options.follow) {
        // The server sends the whole event stream once the job ends.
        std::cout << make_get_request("/progress-stream/" + options.job_id);
        return;
    }
    print_json_response(make_get_request("/progress/" + options.job_id));
}

void CliHandler::handle_health_command(const CliOptions& options) {
    print_json_response(make_get_request("/health"));
}

void CliHandler::handle_metrics_command(const CliOptions& options) {
    std::cout << make_get_request("/metrics");
}

std::string CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    return perform(build_url(endpoint));
}

std::string CliHandler::make_file_upload_request(const std::string& endpoint, const std::string& file_path) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    if (!std::filesystem::is_regular_file(file_path)) {
        throw CliError("File not found: " + file_path);
    }

    curl_easy_reset(curl_handle_);
    std::unique_ptr<curl_mime, decltype(&curl_mime_free)> mime(curl_mime_init(curl_handle_), curl_mime_free);
    if (!mime) {
        throw CliError("Failed to build multipart request");
    }
    curl_mimepart* part = curl_mime_addpart(mime.get());
    curl_mime_name(part, "file");
    if (curl_mime_filedata(part, file_path.c_str()) != CURLE_OK) {
        throw CliError("Failed to read file: " + file_path);
    }
    curl_mime_type(part, "application/pdf");
    curl_easy_setopt(curl_handle_, CURLOPT_MIMEPOST, mime.get());

    return perform(build_url(endpoint));
}

std::string CliHandler::perform(const std::string& url) {
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
    if (http_code != 200) {
        std::string detail;
        nlohmann::json error_body = nlohmann::json::parse(response_buffer, nullptr, false);
        if (!error_body.is_discarded() && error_body.is_object() && error_body.contains("error")) {
            detail = ": " + error_body["error"].get<std::string>();
        }
        throw CliError("HTTP request failed with status code " + std::to_string(http_code) + detail);
    }
    return response_buffer;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    return api_base_url_ + endpoint;
}

void CliHandler::print_json_response(const std::string& body) {
    nlohmann::json response = nlohmann::json::parse(body, nullptr, false);
    if (response.is_discarded()) {
        std::cout << body << std::endl;
        return;
    }
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_extraction_response(const nlohmann::json& response) {
    const auto& metadata = response["metadata"];
    std::cout << "\n=== Extraction Result ===" << std::endl;
    std::cout << "Job ID:     " << metadata.value("job_id", std::string()) << std::endl;
    std::cout << "Pages:      " << metadata.value("num_pages", 0)
              << " (" << metadata.value("failed_pages", 0) << " failed)" << std::endl;
    std::cout << "Confidence: " << std::fixed << std::setprecision(1)
              << response.value("confidence", 0.0) << std::endl;
    std::cout << "Time:       " << std::fixed << std::setprecision(2)
              << metadata.value("processing_time_seconds", 0.0) << "s" << std::endl;
    std::cout << "\n" << response.value("text", std::string()) << std::endl;
}

void CliHandler::print_help() {
    std::cout << "ocrflow - PDF OCR service client\n\n"
              << "Usage: ocrflow <command> [options]\n\n"
              << "Commands:\n"
              << "  extract, e    --file <path> [--dpi <n>]   OCR a PDF and print its text\n"
              << "  upload, u     --file <path>               Start a chunked job\n"
              << "  status, s     --id <job_id>               Show chunk progress of a job\n"
              << "  result, r     --id <job_id> [--partial]   Fetch the results of a job\n"
              << "  progress, p   --id <job_id> [--follow]    Show page progress of an extraction\n"
              << "  health                                    Show service health\n"
              << "  metrics                                   Dump Prometheus metrics\n"
              << "  help, h                                   Show this message\n\n"
              << "Environment:\n"
              << "  OCRFLOW_API_URL   Service URL (default http://127.0.0.1:8001)\n";
}

}  // namespace ocrflow_cli
