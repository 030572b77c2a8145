/*
 * 설명: 로그인 실패 레이트리밋과 용량 제한 LRU 저장소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/rate_limiter_test.cpp
 */
#include "gatekeeper/rate_limiter.hpp"

#include <algorithm>
#include <stdexcept>

namespace gatekeeper {

std::string NormalizeIdentity(std::string_view identity) {
  auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!identity.empty() && is_space(identity.front())) {
    identity.remove_prefix(1);
  }
  while (!identity.empty() && is_space(identity.back())) {
    identity.remove_suffix(1);
  }
  std::string normalized(identity);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
  });
  return normalized;
}

LoginRateLimiter::LoginRateLimiter(const RateLimiterConfig& config, std::shared_ptr<Observability> observability)
    : config_(config), observability_(std::move(observability)) {
  if (config_.max_attempts == 0) {
    config_.max_attempts = 1;
  }
  if (config_.capacity == 0) {
    config_.capacity = 1;
  }
}

RateLimitDecision LoginRateLimiter::CheckAndRecordFailure(const std::string& key) {
  return CheckAndRecordFailure(key, Clock::now());
}

RateLimitDecision LoginRateLimiter::CheckAndRecordFailure(const std::string& key, Clock::time_point now) {
  RateLimitDecision decision;
  try {
    std::lock_guard<std::mutex> lock(mutex_);
    decision = Update(key, now);
  } catch (const std::exception& ex) {
    // 저장소 오류로 모든 사용자를 잠그지 않도록 허용한다.
    if (observability_) {
      observability_->IncrementRateLimitStoreError();
      observability_->LogEvent(LogLevel::kWarn, "rate_limit_store_failure", {{"reason", ex.what()}});
    }
    return RateLimitDecision{RateLimitOutcome::kAllowedDueToStoreError, config_.max_attempts};
  }

  if (decision.outcome == RateLimitOutcome::kDenied && observability_) {
    observability_->IncrementRateLimitDenied();
    observability_->LogEvent(LogLevel::kInfo, "rate_limit_blocked", {{"maxAttempts", config_.max_attempts}});
  }
  return decision;
}

RateLimitDecision LoginRateLimiter::Update(const std::string& key, Clock::time_point now) {
  ThrowIfFaultInjected();
  EvictExpiredTail(now);

  auto found = index_.find(key);
  if (found == index_.end() || Expired(*found->second, now)) {
    if (found != index_.end()) {
      records_.erase(found->second);
      index_.erase(found);
    }
    if (records_.size() >= config_.capacity) {
      // 가장 오래전에 사용된 식별자를 내보낸다. 해당 식별자는 초기화된 것과 같다.
      index_.erase(records_.back().key);
      records_.pop_back();
    }
    records_.push_front(Record{key, now, 1});
    try {
      index_.emplace(key, records_.begin());
    } catch (const std::exception&) {
      records_.pop_front();
      throw;
    }
    return RateLimitDecision{RateLimitOutcome::kAllowed, config_.max_attempts - 1};
  }

  auto it = found->second;
  Touch(it);
  if (it->attempt_count <= config_.max_attempts) {
    ++it->attempt_count;
  }
  if (it->attempt_count > config_.max_attempts) {
    return RateLimitDecision{RateLimitOutcome::kDenied, 0};
  }
  return RateLimitDecision{RateLimitOutcome::kAllowed, config_.max_attempts - it->attempt_count};
}

void LoginRateLimiter::RecordSuccess(const std::string& key) {
  try {
    std::lock_guard<std::mutex> lock(mutex_);
    ThrowIfFaultInjected();
    auto found = index_.find(key);
    if (found == index_.end()) {
      return;
    }
    records_.erase(found->second);
    index_.erase(found);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->IncrementRateLimitStoreError();
      observability_->LogEvent(LogLevel::kWarn, "rate_limit_store_failure", {{"reason", ex.what()}});
    }
  }
}

std::size_t LoginRateLimiter::TrackedKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.size();
}

void LoginRateLimiter::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  index_.clear();
  records_.clear();
}

void LoginRateLimiter::SetStoreFaultInjector(const std::function<bool()>& injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  fault_injector_ = injector;
}

bool LoginRateLimiter::Expired(const Record& record, Clock::time_point now) const {
  return now - record.window_start > config_.window;
}

void LoginRateLimiter::EvictExpiredTail(Clock::time_point now) {
  while (!records_.empty() && Expired(records_.back(), now)) {
    index_.erase(records_.back().key);
    records_.pop_back();
  }
}

void LoginRateLimiter::Touch(RecordList::iterator it) { records_.splice(records_.begin(), records_, it); }

void LoginRateLimiter::ThrowIfFaultInjected() const {
  if (fault_injector_ && fault_injector_()) {
    throw std::runtime_error("주입된 저장소 오류");
  }
}

}  // namespace gatekeeper
