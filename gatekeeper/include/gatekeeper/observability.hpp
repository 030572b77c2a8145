/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace gatekeeper {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// 알 수 없는 값은 info로 취급한다.
LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  std::string path;
  int status{0};
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t redirects{0};
  std::uint64_t auth_error_redirects{0};
  std::uint64_t rejected_candidates{0};
  std::uint64_t static_bypass{0};
  std::uint64_t rate_limit_denied{0};
  std::uint64_t rate_limit_store_errors{0};
};

class Observability {
 public:
  Observability();
  explicit Observability(LogLevel level, std::ostream* sink = &std::cout);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementRedirect();
  void IncrementAuthErrorRedirect();
  void IncrementRejectedCandidate();
  void IncrementStaticBypass();
  void IncrementRateLimitDenied();
  void IncrementRateLimitStoreError();
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= level_; }
  void Log(const LogContext& ctx) const;
  void LogEvent(LogLevel level, std::string_view name, nlohmann::json fields,
                const std::string& trace_id = std::string{}) const;

 private:
  void Write(const nlohmann::json& line) const;

  LogLevel level_;
  std::ostream* sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> redirects_{0};
  std::atomic<std::uint64_t> auth_error_redirects_{0};
  std::atomic<std::uint64_t> rejected_candidates_{0};
  std::atomic<std::uint64_t> static_bypass_{0};
  std::atomic<std::uint64_t> rate_limit_denied_{0};
  std::atomic<std::uint64_t> rate_limit_store_errors_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace gatekeeper
