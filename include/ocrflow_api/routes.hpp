#pragma once
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/jobs/job_orchestrator.hpp"
#include "ocrflow_core/progress/progress_stream.hpp"
#include "ocrflow_core/services/extraction_service.hpp"
#include "ocrflow_core/services/upload_service.hpp"
#include "server.hpp"

// Forward declarations
namespace ocrflow_core {
class ProgressTracker;
class ServiceMetrics;
namespace async {
class WorkerPool;
}
}  // namespace ocrflow_core

namespace ocrflow_api {

inline constexpr const char *SERVICE_VERSION = "1.0.0";

struct UploadedFile {
  std::string file_name;
  std::string content;
};

class Routes {
 public:
  Routes(std::shared_ptr<ocrflow_core::ExtractionService> extraction_service,
         std::shared_ptr<ocrflow_core::UploadService> upload_service,
         std::shared_ptr<ocrflow_core::JobOrchestrator> orchestrator,
         std::shared_ptr<ocrflow_core::ProgressTracker> progress,
         std::shared_ptr<ocrflow_core::ServiceMetrics> metrics,
         std::shared_ptr<ocrflow_core::async::WorkerPool> ocr_pool,
         std::shared_ptr<ocrflow_core::async::WorkerPool> chunk_pool);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // JSON views, public for tests
  static nlohmann::json extraction_to_json(const ocrflow_core::ExtractionResult &result,
                                           const std::string &file_name);
  static nlohmann::json progress_to_json(const ocrflow_core::ProgressSnapshot &snapshot);
  static nlohmann::json status_to_json(const ocrflow_core::JobStatusView &status);
  static nlohmann::json job_result_to_json(const ocrflow_core::Job &job);
  static std::string format_sse(const ocrflow_core::ProgressEvent &event);
  static int status_code_for(const ocrflow_core::OcrflowError &error);
  static std::string time_point_to_string(std::chrono::system_clock::time_point tp);

 private:
  std::shared_ptr<ocrflow_core::ExtractionService> extraction_service_;
  std::shared_ptr<ocrflow_core::UploadService> upload_service_;
  std::shared_ptr<ocrflow_core::JobOrchestrator> orchestrator_;
  std::shared_ptr<ocrflow_core::ProgressTracker> progress_;
  std::shared_ptr<ocrflow_core::ServiceMetrics> metrics_;
  std::shared_ptr<ocrflow_core::async::WorkerPool> ocr_pool_;
  std::shared_ptr<ocrflow_core::async::WorkerPool> chunk_pool_;
  std::chrono::steady_clock::time_point started_at_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_metrics(const crow::request &req);
  crow::response handle_extract(const crow::request &req);
  crow::response handle_progress(const crow::request &req, const std::string &job_id);
  crow::response handle_progress_stream(const crow::request &req, const std::string &job_id);
  crow::response handle_upload(const crow::request &req);
  crow::response handle_status(const crow::request &req, const std::string &job_id);
  crow::response handle_result(const crow::request &req, const std::string &job_id);

  // Helper methods
  UploadedFile extract_uploaded_file(const crow::request &req);
  crow::response create_error_response(const std::string &endpoint,
                                       const ocrflow_core::OcrflowError &error);
  crow::response create_internal_error_response(const std::string &endpoint,
                                                const std::exception &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace ocrflow_api
