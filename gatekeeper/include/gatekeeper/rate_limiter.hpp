/*
 * 설명: 자격 증명 로그인 실패 횟수를 식별자별로 제한한다.
 *       고정 윈도(첫 실패 시 시작, 만료 후 첫 실패에서 재시작)와 용량 제한 LRU 저장소를 사용한다.
 *       저장소 오류 시에는 가용성을 우선해 시도를 허용한다(fail open).
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/rate_limiter_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gatekeeper/observability.hpp"

namespace gatekeeper {

enum class RateLimitOutcome { kAllowed, kDenied, kAllowedDueToStoreError };

struct RateLimitDecision {
  RateLimitOutcome outcome{RateLimitOutcome::kAllowed};
  std::size_t remaining{0};

  bool allowed() const { return outcome != RateLimitOutcome::kDenied; }
};

struct RateLimiterConfig {
  std::size_t max_attempts{10};
  std::chrono::seconds window{std::chrono::seconds(60)};
  std::size_t capacity{1000};
};

// 공백을 제거하고 소문자로 바꾼 식별자(보통 이메일)를 돌려준다.
std::string NormalizeIdentity(std::string_view identity);

class LoginRateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  explicit LoginRateLimiter(const RateLimiterConfig& config,
                            std::shared_ptr<Observability> observability = nullptr);

  // 비밀번호 비교 직전에 호출한다. 결과가 거부이면 비교를 하지 않는다.
  RateLimitDecision CheckAndRecordFailure(const std::string& key);
  RateLimitDecision CheckAndRecordFailure(const std::string& key, Clock::time_point now);

  // 인증 성공 후 호출한다. 기록이 없어도 안전하다.
  void RecordSuccess(const std::string& key);

  std::size_t TrackedKeys() const;
  void Clear();
  const RateLimiterConfig& GetConfig() const { return config_; }

  // 테스트용 저장소 장애 주입. true를 돌려주면 해당 연산에서 저장소 오류가 발생한다.
  void SetStoreFaultInjector(const std::function<bool()>& injector);

 private:
  struct Record {
    std::string key;
    Clock::time_point window_start;
    std::size_t attempt_count{0};
  };
  using RecordList = std::list<Record>;

  RateLimitDecision Update(const std::string& key, Clock::time_point now);
  bool Expired(const Record& record, Clock::time_point now) const;
  void EvictExpiredTail(Clock::time_point now);
  void Touch(RecordList::iterator it);
  void ThrowIfFaultInjected() const;

  RateLimiterConfig config_;
  std::shared_ptr<Observability> observability_;
  mutable std::mutex mutex_;
  // front = 가장 최근 사용, back = 가장 오래전 사용
  RecordList records_;
  std::unordered_map<std::string, RecordList::iterator> index_;
  std::function<bool()> fault_injector_;
};

}  // namespace gatekeeper
