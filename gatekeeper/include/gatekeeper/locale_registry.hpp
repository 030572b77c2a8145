/*
 * 설명: 지원 로케일 허용 목록과 기본 로케일을 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/locale_registry_test.cpp
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gatekeeper {

class LocaleRegistry {
 public:
  // 기본 로케일이 허용 목록에 없거나 목록이 비어 있으면 std::invalid_argument를 던진다.
  LocaleRegistry(std::vector<std::string> allowed, std::string default_locale);

  bool IsValid(std::string_view code) const;
  const std::string& DefaultLocale() const { return default_locale_; }
  const std::vector<std::string>& Allowed() const { return allowed_; }

 private:
  std::vector<std::string> allowed_;
  std::string default_locale_;
};

}  // namespace gatekeeper
