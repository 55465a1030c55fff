// cpp/service/config.h
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

using EnvLookup = std::function<const char*(const char*)>;

struct ServiceConfig {
  std::string api_key;
  std::string host{"0.0.0.0"};
  int port{3000};

  size_t max_document_concurrency{4};
  uint64_t max_file_size{50ull * 1024 * 1024};
  double max_bomb_ratio{100.0};
  uint64_t max_decompressed_size{500ull * 1024 * 1024};
  int64_t admission_timeout_ms{30000};
  int server_threads{8};
  std::string log_level{"info"};

  // values that fell back to defaults, one message each
  std::vector<std::string> warnings;
};

// throws std::runtime_error if API_KEY is missing or empty
ServiceConfig load_config(const EnvLookup& env);

ServiceConfig load_config_from_environment();
