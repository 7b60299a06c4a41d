#include "ocrflow_api/routes.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "ocrflow_core/async/worker_pool.hpp"
#include "ocrflow_core/metrics/service_metrics.hpp"
#include "ocrflow_core/progress/progress_tracker.hpp"

namespace ocrflow_api {

using ocrflow_core::ErrorKind;
using ocrflow_core::OcrflowError;

Routes::Routes(std::shared_ptr<ocrflow_core::ExtractionService> extraction_service,
               std::shared_ptr<ocrflow_core::UploadService> upload_service,
               std::shared_ptr<ocrflow_core::JobOrchestrator> orchestrator,
               std::shared_ptr<ocrflow_core::ProgressTracker> progress,
               std::shared_ptr<ocrflow_core::ServiceMetrics> metrics,
               std::shared_ptr<ocrflow_core::async::WorkerPool> ocr_pool,
               std::shared_ptr<ocrflow_core::async::WorkerPool> chunk_pool)
    : extraction_service_(std::move(extraction_service)),
      upload_service_(std::move(upload_service)),
      orchestrator_(std::move(orchestrator)),
      progress_(std::move(progress)),
      metrics_(std::move(metrics)),
      ocr_pool_(std::move(ocr_pool)),
      chunk_pool_(std::move(chunk_pool)),
      started_at_(std::chrono::steady_clock::now()) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/metrics")
  ([this](const crow::request &req) { return handle_metrics(req); });

  // Synchronous OCR of a whole document
  CROW_ROUTE(app, "/extract").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_extract(req);
  });

  CROW_ROUTE(app, "/progress/<string>")
  ([this](const crow::request &req, const std::string &job_id) {
    return handle_progress(req, job_id);
  });

  CROW_ROUTE(app, "/progress-stream/<string>")
  ([this](const crow::request &req, const std::string &job_id) {
    return handle_progress_stream(req, job_id);
  });

  // Chunked asynchronous pipeline
  CROW_ROUTE(app, "/upload").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_upload(req);
  });

  CROW_ROUTE(app, "/status/<string>")
  ([this](const crow::request &req, const std::string &job_id) {
    return handle_status(req, job_id);
  });

  CROW_ROUTE(app, "/result/<string>")
  ([this](const crow::request &req, const std::string &job_id) {
    return handle_result(req, job_id);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  metrics_->record_request("health");
  nlohmann::json response;
  response["status"] = "healthy";
  response["version"] = SERVICE_VERSION;
  response["queue_size"] = ocr_pool_->queue_size() + chunk_pool_->queue_size();
  response["active_workers"] = ocr_pool_->active_workers() + chunk_pool_->active_workers();
  response["uptime_seconds"] =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
  if (auto last = progress_->last_update()) {
    response["last_processed"] = time_point_to_string(*last);
  } else {
    response["last_processed"] = nullptr;
  }
  return create_json_response(response);
}

crow::response Routes::handle_metrics(const crow::request &req) {
  crow::response resp(200, metrics_->render_prometheus());
  resp.add_header("Content-Type", "text/plain; version=0.0.4");
  return resp;
}

crow::response Routes::handle_extract(const crow::request &req) {
  const std::string endpoint = "extract";
  metrics_->record_request(endpoint);
  try {
    UploadedFile file = extract_uploaded_file(req);

    ocrflow_core::ExtractionRequest request;
    request.file_name = file.file_name;
    request.content = std::move(file.content);
    if (const char *dpi = req.url_params.get("dpi")) {
      try {
        size_t consumed = 0;
        request.dpi = std::stoi(dpi, &consumed);
        if (consumed != std::string(dpi).size()) {
          throw std::invalid_argument(dpi);
        }
      } catch (const std::exception &) {
        throw ocrflow_core::InvalidInputError(std::string("dpi must be an integer, got '") + dpi +
                                              "'");
      }
    }
    std::string requested_id = req.get_header_value("X-Job-ID");
    if (!requested_id.empty()) {
      request.job_id = requested_id;
    }

    ocrflow_core::ExtractionResult result = extraction_service_->extract(request);
    crow::response resp = create_json_response(extraction_to_json(result, file.file_name));
    resp.add_header("X-Job-ID", result.job_id);
    return resp;
  } catch (const OcrflowError &e) {
    return create_error_response(endpoint, e);
  } catch (const std::exception &e) {
    return create_internal_error_response(endpoint, e);
  }
}

crow::response Routes::handle_progress(const crow::request &req, const std::string &job_id) {
  metrics_->record_request("progress");
  std::optional<ocrflow_core::ProgressSnapshot> snapshot = progress_->snapshot(job_id);
  if (!snapshot) {
    return create_error_response("progress", ocrflow_core::JobNotFoundError(job_id));
  }
  return create_json_response(progress_to_json(*snapshot));
}

crow::response Routes::handle_progress_stream(const crow::request &req, const std::string &job_id) {
  metrics_->record_request("progress-stream");
  if (!progress_->contains(job_id)) {
    return create_error_response("progress-stream", ocrflow_core::JobNotFoundError(job_id));
  }

  // Crow buffers the body, so the event stream is delivered once the job ends.
  ocrflow_core::ProgressStream stream(progress_, job_id);
  std::string body;
  while (std::optional<ocrflow_core::ProgressEvent> event = stream.next()) {
    body += format_sse(*event);
  }

  crow::response resp(200, body);
  resp.add_header("Content-Type", "text/event-stream");
  resp.add_header("Cache-Control", "no-cache");
  resp.add_header("X-Accel-Buffering", "no");
  return resp;
}

crow::response Routes::handle_upload(const crow::request &req) {
  const std::string endpoint = "upload";
  metrics_->record_request(endpoint);
  try {
    UploadedFile file = extract_uploaded_file(req);
    ocrflow_core::UploadResult result = upload_service_->upload(file.file_name, file.content);

    nlohmann::json response;
    response["job_id"] = result.job_id;
    response["file_name"] = result.file_name;
    response["total_pages"] = result.total_pages;
    response["total_chunks"] = result.total_chunks;
    return create_json_response(response);
  } catch (const OcrflowError &e) {
    return create_error_response(endpoint, e);
  } catch (const std::exception &e) {
    return create_internal_error_response(endpoint, e);
  }
}

crow::response Routes::handle_status(const crow::request &req, const std::string &job_id) {
  metrics_->record_request("status");
  std::optional<ocrflow_core::JobStatusView> status = orchestrator_->get_status(job_id);
  if (!status) {
    return create_error_response("status", ocrflow_core::JobNotFoundError(job_id));
  }
  return create_json_response(status_to_json(*status));
}

crow::response Routes::handle_result(const crow::request &req, const std::string &job_id) {
  const std::string endpoint = "result";
  metrics_->record_request(endpoint);
  std::optional<ocrflow_core::Job> job = orchestrator_->get_result(job_id);
  if (!job) {
    return create_error_response(endpoint, ocrflow_core::JobNotFoundError(job_id));
  }

  const char *partial = req.url_params.get("partial");
  bool allow_partial = partial && std::string(partial) == "true";
  bool finished = job->completed_chunks == job->total_chunks;
  bool readable = job->status == ocrflow_core::JobStatus::COMPLETED ||
                  (allow_partial && job->status == ocrflow_core::JobStatus::ERROR && finished);
  if (!readable) {
    return create_error_response(
        endpoint, ocrflow_core::InvalidInputError("Job is not completed (status: " +
                                                  ocrflow_core::to_string(job->status) + ")"));
  }

  orchestrator_->mark_consumed(job_id);
  return create_json_response(job_result_to_json(*job));
}

UploadedFile Routes::extract_uploaded_file(const crow::request &req) {
  const std::string content_type = req.get_header_value("Content-Type");
  if (content_type.find("multipart/form-data") == std::string::npos) {
    throw ocrflow_core::InvalidInputError("Expected a multipart/form-data upload");
  }

  try {
    crow::multipart::message message(req);
    crow::multipart::part part = message.get_part_by_name("file");
    if (part.body.empty()) {
      throw ocrflow_core::InvalidInputError("No file provided in field 'file'");
    }
    crow::multipart::header disposition = part.get_header_object("Content-Disposition");
    UploadedFile file;
    auto filename = disposition.params.find("filename");
    file.file_name = filename != disposition.params.end() ? filename->second : "";
    if (file.file_name.empty()) {
      throw ocrflow_core::InvalidInputError("Uploaded file has no filename");
    }
    file.content = std::move(part.body);
    return file;
  } catch (const OcrflowError &) {
    throw;
  } catch (const std::exception &e) {
    throw ocrflow_core::InvalidInputError(std::string("Malformed multipart body: ") + e.what());
  }
}

nlohmann::json Routes::extraction_to_json(const ocrflow_core::ExtractionResult &result,
                                          const std::string &file_name) {
  nlohmann::json document_info = nlohmann::json::object();
  for (const auto &[key, value] : result.document_info) {
    document_info[key] = value;
  }

  nlohmann::json response;
  response["text"] = result.text;
  response["confidence"] = result.confidence;
  response["metadata"] = {{"num_pages", result.num_pages},
                          {"failed_pages", result.failed_pages},
                          {"filename", file_name},
                          {"processing_time_seconds", result.processing_time_seconds},
                          {"dpi", result.dpi},
                          {"job_id", result.job_id},
                          {"workers", result.workers},
                          {"content_hash", result.content_hash},
                          {"document_info", document_info}};
  return response;
}

nlohmann::json Routes::progress_to_json(const ocrflow_core::ProgressSnapshot &snapshot) {
  nlohmann::json response;
  response["job_id"] = snapshot.job_id;
  response["total_pages"] = snapshot.total_units;
  response["processed_pages"] = snapshot.processed_units;
  response["status"] = ocrflow_core::to_string(snapshot.status);
  response["progress_percentage"] = snapshot.percentage;
  if (snapshot.estimated_time_remaining) {
    response["estimated_time_remaining"] = *snapshot.estimated_time_remaining;
  }
  if (snapshot.error_message) {
    response["error"] = *snapshot.error_message;
  }
  return response;
}

nlohmann::json Routes::status_to_json(const ocrflow_core::JobStatusView &status) {
  nlohmann::json response;
  response["job_id"] = status.job_id;
  response["status"] = ocrflow_core::to_string(status.status);
  response["progress"] = {{"completed_chunks", status.completed_chunks},
                          {"total_chunks", status.total_chunks},
                          {"percentage", status.percentage}};
  if (status.error_message) {
    response["error"] = *status.error_message;
  }
  return response;
}

nlohmann::json Routes::job_result_to_json(const ocrflow_core::Job &job) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto &result : job.results) {
    nlohmann::json item;
    item["chunk_id"] = result.chunk_id;
    item["start_page"] = result.start_page;
    item["end_page"] = result.end_page;
    item["content"] = result.content;
    item["confidence"] = result.confidence;
    if (result.error) {
      item["error"] = *result.error;
    }
    results.push_back(item);
  }

  nlohmann::json response;
  response["job_id"] = job.id;
  response["file_name"] = job.file_name;
  response["status"] = ocrflow_core::to_string(job.status);
  response["results"] = results;
  response["confidence"] = job.confidence();
  if (job.error_message) {
    response["error"] = *job.error_message;
  }
  return response;
}

std::string Routes::format_sse(const ocrflow_core::ProgressEvent &event) {
  return "event: progress\ndata: " + progress_to_json(event.snapshot).dump() + "\n\n";
}

int Routes::status_code_for(const OcrflowError &error) {
  if (dynamic_cast<const ocrflow_core::FileTooLargeError *>(&error) ||
      dynamic_cast<const ocrflow_core::ChunkTooLargeError *>(&error)) {
    return 413;
  }
  if (dynamic_cast<const ocrflow_core::InsufficientStorageError *>(&error)) {
    return 507;
  }
  switch (error.kind()) {
    case ErrorKind::InvalidInput: return 400;
    case ErrorKind::ResourceExhausted: return 503;
    case ErrorKind::ToolFailure: return 500;
    case ErrorKind::DownstreamUnavailable: return 503;
    case ErrorKind::NotFound: return 404;
  }
  return 500;
}

std::string Routes::time_point_to_string(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

crow::response Routes::create_error_response(const std::string &endpoint,
                                             const OcrflowError &error) {
  metrics_->record_failure(endpoint, error.kind());
  int status = status_code_for(error);
  if (status >= 500) {
    std::cerr << "Error in /" << endpoint << ": " << error.what() << std::endl;
  }
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error.what();
  response["kind"] = ocrflow_core::to_string(error.kind());
  return create_json_response(response, status);
}

crow::response Routes::create_internal_error_response(const std::string &endpoint,
                                                      const std::exception &error) {
  std::cerr << "Exception in /" << endpoint << ": " << error.what() << std::endl;
  return create_error_response(endpoint, ocrflow_core::ToolFailureError(error.what()));
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

}  // namespace ocrflow_api
