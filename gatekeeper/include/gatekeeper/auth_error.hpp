/*
 * 설명: 인증 경로의 error 쿼리 파라미터를 감지해 로케일별 오류 페이지로 보낼 대상을 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/auth_error_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "gatekeeper/locale_resolver.hpp"
#include "gatekeeper/request.hpp"

namespace gatekeeper {

struct AuthErrorRedirect {
  std::string target;
  std::string error;
  std::string locale;
  std::string path;
};

class AuthErrorDetector {
 public:
  explicit AuthErrorDetector(LocaleResolver resolver);

  // 인증 경로이고 error 값이 비어 있지 않을 때만 결과를 돌려준다.
  std::optional<AuthErrorRedirect> Detect(const RequestDescriptor& req) const;

  // "/auth/signin", "/auth/callback", "/api/auth/" 하위 경로인지 판단한다.
  // "."/".." 세그먼트를 해석한 뒤 앞쪽의 유효한 로케일 세그먼트는 무시한다.
  bool IsAuthPath(std::string_view path) const;

 private:
  LocaleResolver resolver_;
};

}  // namespace gatekeeper
