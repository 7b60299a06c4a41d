#include <curl/curl.h>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "ocrflow_api/config.hpp"
#include "ocrflow_api/routes.hpp"
#include "ocrflow_api/server.hpp"
#include "ocrflow_core/analysis/chunk_analyzer_factory.hpp"
#include "ocrflow_core/async/worker_pool.hpp"
#include "ocrflow_core/jobs/job_janitor.hpp"
#include "ocrflow_core/jobs/job_orchestrator.hpp"
#include "ocrflow_core/jobs/job_store.hpp"
#include "ocrflow_core/metrics/service_metrics.hpp"
#include "ocrflow_core/ocr/ocr_worker_pool.hpp"
#include "ocrflow_core/ocr/tesseract_ocr_engine.hpp"
#include "ocrflow_core/pdf/page_rasterizer.hpp"
#include "ocrflow_core/pdf/pdf_chunker.hpp"
#include "ocrflow_core/progress/progress_tracker.hpp"
#include "ocrflow_core/resilience/circuit_breaker_registry.hpp"
#include "ocrflow_core/services/extraction_service.hpp"
#include "ocrflow_core/services/upload_service.hpp"
#include "ocrflow_core/util/command_runner.hpp"
#include "ocrflow_core/util/temp_workspace.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main() {
  try {
    const char *config_env = std::getenv("OCRFLOW_CONFIG");
    std::string config_path = (config_env && *config_env) ? config_env : "ocrflowrc.json";
    ocrflow_api::Config config = std::filesystem::exists(config_path)
                                     ? ocrflow_api::Config::from_file(config_path)
                                     : ocrflow_api::Config::from_json(nlohmann::json::object());

    std::cout << "Starting ocrflow OCR service..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Work Directory: " << config.work_dir << std::endl;
    std::cout << "OCR Workers: " << config.ocr_workers << std::endl;
    std::cout << "Chunk Workers: " << config.chunk_workers << std::endl;
    std::cout << "Chunk Analyzer: " << config.chunk_analyzer << std::endl;

    std::filesystem::create_directories(config.work_dir);
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("Failed to initialize libcurl");
    }

    // Resilience
    ocrflow_core::CircuitBreakerSettings breaker_settings;
    breaker_settings.failure_threshold = config.breaker_failure_threshold;
    breaker_settings.reset_timeout = std::chrono::seconds(config.breaker_reset_timeout_s);
    breaker_settings.half_open_timeout = std::chrono::seconds(config.breaker_half_open_timeout_s);
    auto breakers = std::make_shared<ocrflow_core::CircuitBreakerRegistry>(breaker_settings);

    // PDF tooling
    auto runner = std::make_shared<ocrflow_core::PosixCommandRunner>();
    auto storage = std::make_shared<ocrflow_core::StorageGuard>(config.work_dir,
                                                                config.min_free_bytes);
    ocrflow_core::RasterizerSettings rasterizer_settings;
    rasterizer_settings.tool_timeout = std::chrono::milliseconds(config.tool_timeout_ms);
    rasterizer_settings.page_probe_timeout =
        std::chrono::milliseconds(config.page_probe_timeout_ms);
    rasterizer_settings.page_probe_max_pages = config.page_probe_max_pages;
    auto rasterizer = std::make_shared<ocrflow_core::PageRasterizer>(
        runner, breakers->get(ocrflow_core::RASTERIZER_BREAKER), rasterizer_settings);

    ocrflow_core::ChunkerSettings chunker_settings;
    chunker_settings.max_chunk_bytes = config.max_chunk_bytes;
    chunker_settings.tool_timeout = std::chrono::milliseconds(config.tool_timeout_ms);
    auto chunker =
        std::make_shared<ocrflow_core::PdfChunker>(runner, rasterizer, storage, chunker_settings);

    // OCR
    ocrflow_core::TesseractSettings tesseract_settings;
    tesseract_settings.language = config.tesseract_language;
    tesseract_settings.data_path = config.tesseract_data_path;
    tesseract_settings.page_segmentation_mode = config.tesseract_psm;
    auto engine = std::make_shared<ocrflow_core::TesseractOcrEngine>(tesseract_settings);

    // Pages and chunks run on separate pools so a chunk never waits on its own pool
    auto ocr_pool = std::make_shared<ocrflow_core::async::WorkerPool>(
        "ocr", config.ocr_workers, config.max_queue_size);
    auto chunk_pool = std::make_shared<ocrflow_core::async::WorkerPool>(
        "chunks", config.chunk_workers, config.max_queue_size);
    auto ocr = std::make_shared<ocrflow_core::OcrWorkerPool>(engine, ocr_pool);

    ocrflow_core::AnalyzerDependencies analyzer_deps;
    analyzer_deps.rasterizer = rasterizer;
    analyzer_deps.ocr = ocr;
    analyzer_deps.breakers = breakers;
    analyzer_deps.work_dir = config.work_dir;
    analyzer_deps.dpi = config.default_dpi;
    analyzer_deps.agent.base_url = config.processing_agent_url;
    analyzer_deps.agent.timeout = std::chrono::milliseconds(config.processing_agent_timeout_ms);
    analyzer_deps.agent.confidence_threshold = config.confidence_threshold;
    auto analyzer = ocrflow_core::ChunkAnalyzerFactory::create(
        ocrflow_core::analyzer_kind_from_string(config.chunk_analyzer), analyzer_deps);

    // Jobs, progress and metrics
    auto metrics = std::make_shared<ocrflow_core::ServiceMetrics>();
    auto jobs = std::make_shared<ocrflow_core::JobStore>();
    auto progress = std::make_shared<ocrflow_core::ProgressTracker>();
    auto orchestrator =
        std::make_shared<ocrflow_core::JobOrchestrator>(jobs, analyzer, chunk_pool, metrics);
    metrics->attach_pool(ocr_pool);
    metrics->attach_pool(chunk_pool);
    metrics->attach_breakers(breakers);
    metrics->attach_analyzer(analyzer);
    metrics->attach_jobs(jobs);
    metrics->attach_progress(progress);

    ocrflow_core::ExtractionSettings extraction_settings;
    extraction_settings.work_dir = config.work_dir;
    extraction_settings.default_dpi = config.default_dpi;
    extraction_settings.max_upload_bytes = config.max_upload_bytes;
    auto extraction_service = std::make_shared<ocrflow_core::ExtractionService>(
        rasterizer, ocr, progress, metrics, storage, extraction_settings);

    ocrflow_core::UploadSettings upload_settings;
    upload_settings.work_dir = config.work_dir;
    upload_settings.max_upload_bytes = config.max_upload_bytes;
    upload_settings.chunk_size_pages = config.chunk_size_pages;
    upload_settings.chunk_overlap_pages = config.chunk_overlap_pages;
    auto upload_service = std::make_shared<ocrflow_core::UploadService>(
        chunker, orchestrator, storage, upload_settings);

    ocrflow_core::JobJanitor janitor(jobs, progress, std::chrono::minutes(config.job_ttl_minutes));

    ocrflow_api::Server server(config.host(), config.port(), config.http_threads);
    ocrflow_api::Routes routes(extraction_service, upload_service, orchestrator, progress, metrics,
                               ocr_pool, chunk_pool);
    routes.register_routes(server);

    // --- START BACKGROUND SERVICES ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    ocr_pool->start();
    chunk_pool->start();
    janitor.start();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/4] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/4] Stopping job janitor..." << std::endl;
    janitor.stop();

    std::cout << "[3/4] Draining chunk pool..." << std::endl;
    chunk_pool->stop();

    std::cout << "[4/4] Draining OCR pool..." << std::endl;
    ocr_pool->stop();

    curl_global_cleanup();
    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
