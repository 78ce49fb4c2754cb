#include "ArchivesGateway.hpp"
#include "core/errors/Errors.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using nlohmann::json;

namespace ssd {

ArchivesGateway::ArchivesGateway(ArchivesAppConfig cfg) : cfg_(std::move(cfg)) {
  std::string url = cfg_.url;
  if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) url = "https://" + url;

  const auto schemeEnd = url.find("://") + 3;
  const auto slash = url.find('/', schemeEnd);
  baseUrl_ = url.substr(0, slash);
  if (slash != std::string::npos) {
    pathPrefix_ = url.substr(slash);
    while (!pathPrefix_.empty() && pathPrefix_.back() == '/') pathPrefix_.pop_back();
  }
}

std::string gatewayRefFromResponse(int status, const std::string& body) {
  const std::string fallback = "HTTP " + std::to_string(status);
  if (body.empty()) return fallback;

  const json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (!j.is_object()) return fallback;
  for (const char* k : {"id", "task_id", "edit_id"}) {
    if (!j.contains(k)) continue;
    const auto& v = j[k];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
  }
  return fallback;
}

DeletionResult ArchivesGateway::requestDeletion(int64_t file_id, const std::string& instance_path) {
  httplib::Client cli(baseUrl_);
  if (!cli.is_valid()) throw GatewayFailure("no HTTP client available for " + baseUrl_);
  cli.set_connection_timeout(cfg_.timeoutSeconds, 0);
  cli.set_read_timeout(cfg_.timeoutSeconds, 0);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
  // Internal application with a self-signed certificate.
  cli.enable_server_certificate_verification(false);
#endif

  const httplib::Headers headers = {
    {"user", cfg_.user},
    {"password", cfg_.password},
  };
  const std::string target =
    pathPrefix_ + "/api/server_change?edit_type=DELETE&old_path=" +
    httplib::detail::encode_query_param(instance_path) + "&new_path=";

  spdlog::debug("DELETE edit for file {}: {}", file_id, instance_path);
  auto res = cli.Get(target, headers);

  DeletionResult out;
  if (!res) {
    out.error_message = "request to " + baseUrl_ + " failed: " + httplib::to_string(res.error());
    return out;
  }
  if (res->status < 200 || res->status >= 300) {
    out.error_message = "HTTP " + std::to_string(res->status) + " from server_change";
    if (!res->body.empty()) out.error_message += ": " + res->body.substr(0, 200);
    return out;
  }
  out.success = true;
  out.gateway_ref = gatewayRefFromResponse(res->status, res->body);
  return out;
}

} // namespace ssd
