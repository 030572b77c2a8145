/*
 * 설명: 보안 헤더와 로케일 쿠키 부착을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/response_decorator_test.cpp
 */
#include "gatekeeper/response_decorator.hpp"

#include "gatekeeper/locale_resolver.hpp"

namespace gatekeeper {

ResponseDecorator::ResponseDecorator(std::int64_t cookie_max_age_seconds)
    : cookie_max_age_seconds_(cookie_max_age_seconds) {}

void ResponseDecorator::Decorate(ResponseDescriptor& res, const RequestDescriptor& req,
                                 const std::string& locale) const {
  res.SetHeader("X-Content-Type-Options", "nosniff");
  res.SetHeader("X-Frame-Options", "DENY");
  res.SetHeader("X-XSS-Protection", "1; mode=block");
  res.SetHeader("Referrer-Policy", "strict-origin-when-cross-origin");
  res.SetHeader("Permissions-Policy", "camera=(), microphone=(), geolocation=()");
  res.SetHeader("X-Locale", locale);

  auto cookie = req.Cookie(kLocaleCookieName);
  if (!cookie || *cookie != locale) {
    res.AddHeader("Set-Cookie", LocaleCookie(locale));
  }
}

std::string ResponseDecorator::LocaleCookie(const std::string& locale) const {
  return std::string(kLocaleCookieName) + "=" + locale + "; HttpOnly; SameSite=Lax; Path=/; Max-Age=" +
         std::to_string(cookie_max_age_seconds_);
}

}  // namespace gatekeeper
