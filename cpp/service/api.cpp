// cpp/service/api.cpp
#include "api.h"

#include <cctype>
#include <exception>
#include <optional>

#include <spdlog/spdlog.h>

#include "redline/edit.h"
#include "redline/ir.h"
#include "redline/orchestrator.h"
#include "redline/pipeline.h"
#include "text_common.h"

using json = nlohmann::json;

namespace {

constexpr size_t kMaxRequestIdLength = 128;

void reply_json(httplib::Response& res, int status, const json& j) {
  res.status = status;
  res.set_content(j.dump(), "application/json; charset=utf-8");
}

void reply_error(httplib::Response& res, int status, const std::string& code,
                 const std::string& message, json details = json::array()) {
  reply_json(res, status, build_error(code, message, std::move(details)));
}

std::string request_id(const httplib::Response& res) {
  return res.get_header_value("X-Request-Id");
}

bool usable_request_id(const std::string& v) {
  if (v.empty() || v.size() > kMaxRequestIdLength) return false;
  for (unsigned char c : v) {
    if (c < 0x21 || c > 0x7E || c == '"' || c == '\\') return false;
  }
  return true;
}

bool is_multipart(const httplib::Request& req) {
  const std::string ct = to_lower_ascii(req.get_header_value("Content-Type"));
  return ct.compare(0, 19, "multipart/form-data") == 0;
}

// text field of a multipart form, or a query parameter
std::optional<std::string> get_param_any(const httplib::Request& req, const char* key) {
  auto it = req.files.find(key);
  if (it != req.files.end() && it->second.filename.empty()) return it->second.content;
  if (req.has_param(key)) return req.get_param_value(key);
  return std::nullopt;
}

// query flag; false and a 400 already written if the value is not a boolean
bool read_flag(const httplib::Request& req, httplib::Response& res, const char* key, bool& out) {
  out = false;
  if (!req.has_param(key)) return true;
  if (parse_bool_str(req.get_param_value(key), out)) return true;
  reply_error(res, 400, "VALIDATION_ERROR", std::string("querystring/") + key + " must be boolean",
              json::array({{{"field", std::string("querystring/") + key}, {"message", "must be boolean"}}}));
  return false;
}

void reply_pipeline_error(httplib::Response& res, const redline::RedlineException& e, bool read_route) {
  const WireError w = to_wire_error(e, read_route);
  json details = json::array();
  if (auto* invalid = dynamic_cast<const redline::InvalidEditsException*>(&e)) {
    for (const auto& i : invalid->report().issues) details.push_back(redline::to_json(i));
  }

  if (w.status >= 500) {
    spdlog::error("request {}: {} ({})", request_id(res), e.what(), redline::error_code_name(e.code()));
  } else {
    spdlog::info("request {}: rejected {} ({})", request_id(res), w.code, e.what());
  }
  reply_error(res, w.status, w.code, w.message, std::move(details));
}

void reply_internal(httplib::Response& res, const std::exception& e) {
  spdlog::error("request {}: unhandled error: {}", request_id(res), e.what());
  reply_error(res, 500, "INTERNAL_ERROR", "An internal server error occurred");
}

const httplib::MultipartFormData* uploaded_file(const httplib::Request& req) {
  auto it = req.files.find("file");
  if (it == req.files.end()) return nullptr;
  return &it->second;
}

void handle_read(RedlineService& svc, const httplib::Request& req, httplib::Response& res) {
  const auto* file = uploaded_file(req);
  if (!file) {
    reply_error(res, 400, "MISSING_FILE", "No file uploaded");
    return;
  }
  const std::string filename = file->filename.empty() ? "document.docx" : file->filename;

  try {
    const redline::DocumentIR ir = svc.pipeline().read(filename, file->content);
    spdlog::info("request {}: read {} ({} blocks)", request_id(res), filename, ir.blocks.size());
    reply_json(res, 200, redline::to_json(ir));
  } catch (const redline::RedlineException& e) {
    reply_pipeline_error(res, e, true);
  } catch (const std::exception& e) {
    reply_internal(res, e);
  }
}

void handle_apply(RedlineService& svc, const httplib::Request& req, httplib::Response& res) {
  redline::ApplyRequest ar;
  if (!read_flag(req, res, "dry_run", ar.dry_run)) return;
  if (!read_flag(req, res, "strict", ar.strict)) return;

  const auto* file = uploaded_file(req);
  if (!file) {
    reply_error(res, 400, "MISSING_FILE", "No file uploaded");
    return;
  }
  ar.filename = file->filename.empty() ? "document.docx" : file->filename;

  const std::optional<std::string> raw = get_param_any(req, "edits");
  if (!raw || trim_copy(*raw).empty()) {
    reply_error(res, 400, "MISSING_EDITS", "Edits field is required and must be a JSON array");
    return;
  }

  json edits_json;
  try {
    edits_json = json::parse(*raw);
  } catch (const json::parse_error& e) {
    reply_error(res, 400, "INVALID_EDITS_JSON", "Edits field must be valid JSON",
                json::array({{{"field", "edits"}, {"reason", e.what()}}}));
    return;
  }

  try {
    ar.edits = redline::parse_edits(edits_json);
  } catch (const std::invalid_argument& e) {
    reply_error(res, 400, "MISSING_EDITS", e.what());
    return;
  }

  try {
    redline::ApplyResponse out = svc.pipeline().apply(ar, file->content);

    if (out.dry_run) {
      spdlog::info("request {}: dry run {} valid={}", request_id(res), ar.filename, out.validation.valid);
      reply_json(res, 200, redline::to_json(out.validation));
      return;
    }

    const std::string download = sanitize_output_filename(ar.filename);
    res.status = 200;
    res.set_header("Content-Disposition", "attachment; filename=\"" + download + "\"");
    res.set_header("X-Edits-Applied", std::to_string(out.summary.applied));
    res.set_header("X-Edits-Skipped", std::to_string(out.summary.skipped));
    res.set_header("X-Edits-Failed", std::to_string(out.summary.failed));
    res.set_header("X-Warnings", std::to_string(out.summary.warnings));
    res.set_content(out.archive, kDocxContentType);
  } catch (const redline::RedlineException& e) {
    reply_pipeline_error(res, e, false);
  } catch (const std::exception& e) {
    reply_internal(res, e);
  }
}

} // namespace

json build_error(const std::string& code, const std::string& message, json details) {
  return {{"error", {{"code", code}, {"message", message}, {"details", std::move(details)}}}};
}

std::string sanitize_output_filename(const std::string& filename) {
  std::string base = filename.empty() ? "document.docx" : filename;
  const std::string lower = to_lower_ascii(base);
  if (lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".docx") == 0) {
    base.resize(base.size() - 5);
  }

  std::string safe = ascii_fold(base, '_');
  for (auto& c : safe) {
    const unsigned char u = (unsigned char)c;
    const bool allowed = std::isalnum(u) || c == '.' || c == '_' || c == ' ' || c == '-';
    if (!allowed) c = '_';
  }
  safe = trim_copy(safe);

  std::string out;
  bool in_space = false;
  for (char c : safe) {
    if (c == ' ') {
      if (!in_space) out += '_';
      in_space = true;
    } else {
      out += c;
      in_space = false;
    }
  }
  if (out.empty()) out = "document";
  return out + "-edited.docx";
}

bool constant_time_equals(const std::string& a, const std::string& b) {
  const size_t n = a.size() > b.size() ? a.size() : b.size();
  unsigned char diff = a.size() == b.size() ? 0 : 1;
  for (size_t i = 0; i < n; ++i) {
    const unsigned char x = i < a.size() ? (unsigned char)a[i] : 0;
    const unsigned char y = i < b.size() ? (unsigned char)b[i] : 0;
    diff |= (unsigned char)(x ^ y);
  }
  return diff == 0;
}

bool bearer_token_matches(const std::string& authorization, const std::string& api_key) {
  if (api_key.empty()) return false;
  const std::string prefix = "bearer ";
  if (authorization.size() <= prefix.size()) return false;
  if (to_lower_ascii(authorization.substr(0, prefix.size())) != prefix) return false;
  return constant_time_equals(trim_copy(authorization.substr(prefix.size())), api_key);
}

WireError to_wire_error(const redline::RedlineException& e, bool read_route) {
  using redline::ErrorCode;
  switch (e.code()) {
    case ErrorCode::InvalidFormat:
      return {400, "INVALID_FILE_TYPE", e.what()};
    case ErrorCode::BombSuspected:
      return {400, "ZIP_BOMB_DETECTED", e.what()};
    case ErrorCode::CorruptArchive:
      return {400, "ZIP_BOMB_DETECTED", "Corrupted or invalid ZIP/DOCX file"};
    case ErrorCode::Overloaded:
      return {503, "SERVER_BUSY", "Server is busy processing other documents, retry later"};
    case ErrorCode::SessionFailed:
      if (read_route) return {422, "EXTRACTION_FAILED", "Unable to extract document structure"};
      return {422, "DOCUMENT_LOAD_FAILED", "Unable to load document"};
    case ErrorCode::ApplyFailed:
      return {422, "APPLY_FAILED", "Failed to apply edits to document"};
    case ErrorCode::InvalidEdits:
      return {400, "INVALID_EDITS", "One or more edits are invalid"};
    case ErrorCode::InvalidArgs:
      return {400, "VALIDATION_ERROR", e.what()};
    case ErrorCode::Ok:
    case ErrorCode::RepackFailed:
    case ErrorCode::Internal:
      break;
  }
  return {500, "INTERNAL_ERROR", "An internal server error occurred"};
}

void register_routes(httplib::Server& app, RedlineService& svc) {
  const std::string api_key = svc.config().api_key;

  // request id on every response, bearer auth for /v1/*
  app.set_pre_routing_handler([api_key](const httplib::Request& req, httplib::Response& res) {
    std::string rid = req.get_header_value("X-Request-Id");
    if (!usable_request_id(rid)) rid = gen_uuid_v4();
    res.set_header("X-Request-Id", rid);

    if (req.path.compare(0, 4, "/v1/") == 0 &&
        !bearer_token_matches(req.get_header_value("Authorization"), api_key)) {
      spdlog::info("request {}: unauthorized {} {}", rid, req.method, req.path);
      reply_error(res, 401, "UNAUTHORIZED", "Invalid or missing API key");
      return httplib::Server::HandlerResponse::Handled;
    }
    return httplib::Server::HandlerResponse::Unhandled;
  });

  app.set_error_handler([&svc](const httplib::Request& req, httplib::Response& res) {
    if (!res.has_header("X-Request-Id")) res.set_header("X-Request-Id", gen_uuid_v4());
    if (!res.body.empty()) return;

    if (res.status == 404) {
      reply_error(res, 404, "NOT_FOUND", "Route " + req.method + " " + req.path + " not found");
    } else if (res.status == 413) {
      reply_error(res, 413, "FILE_TOO_LARGE",
                  "Request body exceeds maximum of " + std::to_string(svc.config().max_file_size) + " bytes");
    } else if (res.status >= 500) {
      reply_error(res, res.status, "INTERNAL_ERROR", "An internal server error occurred");
    } else {
      reply_error(res, res.status, "BAD_REQUEST", "Request could not be processed");
    }
  });

  auto health = [](const httplib::Request&, httplib::Response& res) {
    reply_json(res, 200, {{"status", "ok"}});
  };
  app.Get("/health", health);
  app.Get("/v1/health", health);

  app.Post("/v1/read", [&svc](const httplib::Request& req, httplib::Response& res) {
    if (!is_multipart(req)) {
      reply_error(res, 400, "INVALID_CONTENT_TYPE", "Content-Type must be multipart/form-data");
      return;
    }
    handle_read(svc, req, res);
  });

  app.Post("/v1/apply", [&svc](const httplib::Request& req, httplib::Response& res) {
    if (!is_multipart(req)) {
      reply_error(res, 400, "INVALID_CONTENT_TYPE", "Content-Type must be multipart/form-data");
      return;
    }
    handle_apply(svc, req, res);
  });
}
