// cpp/service/main.cpp
#include <cstdlib>
#include <exception>
#include <iostream>

#include "httplib.h"
#include <spdlog/spdlog.h>

#include "api.h"
#include "config.h"
#include "logging.h"
#include "service.h"

int main() {
  ServiceConfig cfg;
  try {
    cfg = load_config_from_environment();
  } catch (const std::exception& e) {
    std::cerr << "redline: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  init_logging(cfg.log_level);
  for (const auto& w : cfg.warnings) spdlog::warn("config: {}", w);

  RedlineService svc(cfg);

  httplib::Server app;
  const size_t threads = (size_t)cfg.server_threads;
  app.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  app.set_payload_max_length((size_t)cfg.max_file_size);

  register_routes(app, svc);

  spdlog::info("redline listening on {}:{} (sessions={}, max_file_size={}, max_ratio={})",
               cfg.host, cfg.port, cfg.max_document_concurrency, cfg.max_file_size, cfg.max_bomb_ratio);
  if (!app.listen(cfg.host, cfg.port)) {
    spdlog::error("cannot listen on {}:{}", cfg.host, cfg.port);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
