// cpp/service/config.cpp
#include "config.h"

#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "text_common.h"

namespace {

std::string env_str(const EnvLookup& env, const char* key) {
  const char* v = env(key);
  return v ? trim_copy(v) : std::string();
}

// positive integers only; anything else keeps the default
template <class T>
void read_positive(const EnvLookup& env, const char* key, T& out, ServiceConfig& cfg) {
  const std::string v = env_str(env, key);
  if (v.empty()) return;

  try {
    size_t used = 0;
    const long long n = std::stoll(v, &used);
    if (used == v.size() && n > 0 &&
        static_cast<unsigned long long>(n) <= static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
      out = static_cast<T>(n);
      return;
    }
  } catch (const std::exception&) {
    // reported below
  }
  cfg.warnings.push_back(std::string(key) + "=" + v + " is not a positive integer in range, using default");
}

} // namespace

ServiceConfig load_config(const EnvLookup& env) {
  ServiceConfig cfg;

  cfg.api_key = env_str(env, "API_KEY");
  if (cfg.api_key.empty()) {
    throw std::runtime_error("API_KEY environment variable is required");
  }

  const std::string host = env_str(env, "HOST");
  if (!host.empty()) cfg.host = host;

  read_positive(env, "PORT", cfg.port, cfg);
  if (cfg.port > 65535) {
    cfg.warnings.push_back("PORT out of range, using default");
    cfg.port = 3000;
  }
  read_positive(env, "MAX_DOCUMENT_CONCURRENCY", cfg.max_document_concurrency, cfg);
  read_positive(env, "MAX_FILE_SIZE", cfg.max_file_size, cfg);
  read_positive(env, "MAX_DECOMPRESSED_SIZE", cfg.max_decompressed_size, cfg);
  read_positive(env, "ADMISSION_TIMEOUT_MS", cfg.admission_timeout_ms, cfg);
  read_positive(env, "SERVER_THREADS", cfg.server_threads, cfg);

  const std::string ratio = env_str(env, "MAX_BOMB_RATIO");
  if (!ratio.empty()) {
    char* end = nullptr;
    const double r = std::strtod(ratio.c_str(), &end);
    if (end && *end == '\0' && r > 0) cfg.max_bomb_ratio = r;
    else cfg.warnings.push_back("MAX_BOMB_RATIO=" + ratio + " is not a positive number, using default");
  }

  const std::string level = to_lower_ascii(env_str(env, "LOG_LEVEL"));
  if (!level.empty()) {
    if (level == "trace" || level == "debug" || level == "info" || level == "warn" || level == "error") {
      cfg.log_level = level;
    } else {
      cfg.warnings.push_back("LOG_LEVEL=" + level + " is unknown, using info");
    }
  }
  return cfg;
}

ServiceConfig load_config_from_environment() {
  return load_config([](const char* key) -> const char* { return std::getenv(key); });
}
