/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/observability_test.cpp
 */
#include "gatekeeper/observability.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace gatekeeper {

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability() : Observability(LogLevel::kInfo, &std::cout) {}

Observability::Observability(LogLevel level, std::ostream* sink) : level_(level), sink_(sink) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementRedirect() { redirects_.fetch_add(1); }

void Observability::IncrementAuthErrorRedirect() { auth_error_redirects_.fetch_add(1); }

void Observability::IncrementRejectedCandidate() { rejected_candidates_.fetch_add(1); }

void Observability::IncrementStaticBypass() { static_bypass_.fetch_add(1); }

void Observability::IncrementRateLimitDenied() { rate_limit_denied_.fetch_add(1); }

void Observability::IncrementRateLimitStoreError() { rate_limit_store_errors_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.redirects = redirects_.load();
  snapshot.auth_error_redirects = auth_error_redirects_.load();
  snapshot.rejected_candidates = rejected_candidates_.load();
  snapshot.static_bypass = static_bypass_.load();
  snapshot.rate_limit_denied = rate_limit_denied_.load();
  snapshot.rate_limit_store_errors = rate_limit_store_errors_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(LogLevel::kDebug)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = std::string(ToString(LogLevel::kDebug));
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["path"] = ctx.path;
  log_json["status"] = ctx.status;
  log_json["latencyMs"] = ctx.latency_ms;
  Write(log_json);
}

void Observability::LogEvent(LogLevel level, std::string_view name, nlohmann::json fields,
                             const std::string& trace_id) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? std::move(fields) : nlohmann::json::object();
  log_json["level"] = std::string(ToString(level));
  log_json["eventName"] = std::string(name);
  if (!trace_id.empty()) {
    log_json["traceId"] = trace_id;
  }
  Write(log_json);
}

void Observability::Write(const nlohmann::json& line) const {
  if (!sink_) {
    return;
  }
  // 요청에서 온 값은 UTF-8이 아닐 수 있으므로 치환 모드로 직렬화한다.
  auto text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(sink_mutex_);
  *sink_ << text << std::endl;
}

}  // namespace gatekeeper
