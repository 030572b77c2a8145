/*
 * 설명: 모든 게이트키퍼 응답에 보안 헤더, X-Locale, 로케일 쿠키를 붙인다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/response_decorator_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>

#include "gatekeeper/request.hpp"

namespace gatekeeper {

constexpr std::int64_t kDefaultLocaleCookieMaxAgeSeconds = 60LL * 60 * 24 * 365 * 2;

class ResponseDecorator {
 public:
  explicit ResponseDecorator(std::int64_t cookie_max_age_seconds = kDefaultLocaleCookieMaxAgeSeconds);

  // locale은 이미 허용 목록으로 검증된 값이어야 한다.
  void Decorate(ResponseDescriptor& res, const RequestDescriptor& req, const std::string& locale) const;

  std::string LocaleCookie(const std::string& locale) const;

 private:
  std::int64_t cookie_max_age_seconds_;
};

}  // namespace gatekeeper
