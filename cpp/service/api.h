// cpp/service/api.h
#pragma once

#include <string>

#include "httplib.h"
#include <nlohmann/json.hpp>

#include "redline/errors.h"
#include "service.h"

constexpr const char* kDocxContentType =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document";

// {"error":{"code":...,"message":...,"details":[...]}}
nlohmann::json build_error(const std::string& code, const std::string& message,
                           nlohmann::json details = nlohmann::json::array());

// "<base>-edited.docx", safe inside a quoted Content-Disposition filename
std::string sanitize_output_filename(const std::string& filename);

// Compares every byte regardless of where the first mismatch is.
bool constant_time_equals(const std::string& a, const std::string& b);

// "Bearer <token>" against the configured key
bool bearer_token_matches(const std::string& authorization, const std::string& api_key);

struct WireError {
  int status{500};
  std::string code;
  std::string message;
};

// Status, wire code and caller-safe message for a pipeline failure.
WireError to_wire_error(const redline::RedlineException& e, bool read_route);

void register_routes(httplib::Server& app, RedlineService& svc);
