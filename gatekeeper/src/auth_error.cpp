/*
 * 설명: 인증 오류 파라미터 감지와 오류 페이지 리다이렉트 대상 생성을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/auth_error_test.cpp
 */
#include "gatekeeper/auth_error.hpp"

#include <array>

#include "gatekeeper/sanitizer.hpp"
#include "gatekeeper/url_codec.hpp"

namespace gatekeeper {

namespace {
constexpr std::array<std::string_view, 3> kAuthPrefixes = {"/auth/signin", "/auth/callback", "/api/auth"};

bool HasSegmentPrefix(std::string_view path, std::string_view prefix) {
  if (path.size() < prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  return path.size() == prefix.size() || path[prefix.size()] == '/';
}
}  // namespace

AuthErrorDetector::AuthErrorDetector(LocaleResolver resolver) : resolver_(std::move(resolver)) {}

bool AuthErrorDetector::IsAuthPath(std::string_view path) const {
  auto cleaned = CleanRedirectPath(path, resolver_.Registry());
  std::string_view view = cleaned;
  if (auto locale = resolver_.PathLocale(view)) {
    view.remove_prefix(locale->size() + 1);
  }
  for (auto prefix : kAuthPrefixes) {
    if (prefix == "/api/auth") {
      // "/api/auth" 자체가 아니라 "/api/auth/" 이하만 해당한다.
      if (view.size() > prefix.size() && HasSegmentPrefix(view, prefix)) {
        return true;
      }
      continue;
    }
    if (HasSegmentPrefix(view, prefix)) {
      return true;
    }
  }
  return false;
}

std::optional<AuthErrorRedirect> AuthErrorDetector::Detect(const RequestDescriptor& req) const {
  auto error = req.QueryParam("error");
  if (!error || error->empty()) {
    return std::nullopt;
  }
  if (!IsAuthPath(req.path)) {
    return std::nullopt;
  }
  auto resolution = resolver_.Resolve(req);
  AuthErrorRedirect redirect;
  redirect.locale = resolution.locale;
  redirect.error = *error;
  redirect.path = req.path;
  // error 값은 불투명 토큰이며 URL 인코딩된 형태로만 대상에 들어간다.
  redirect.target = "/" + resolution.locale + "/auth/error?error=" + UrlEncodeComponent(*error);
  return redirect;
}

}  // namespace gatekeeper
