// cpp/service/logging.h
#pragma once

#include <memory>
#include <string>

#include <spdlog/formatter.h>

// Formatter producing one JSON object per line; the message is JSON-escaped.
std::unique_ptr<spdlog::formatter> make_json_formatter();

// Process-wide "redline" logger writing one JSON object per line to stdout.
void init_logging(const std::string& level);
