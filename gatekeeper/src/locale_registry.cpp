/*
 * 설명: 로케일 허용 목록 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/locale_registry_test.cpp
 */
#include "gatekeeper/locale_registry.hpp"

#include <algorithm>
#include <stdexcept>

namespace gatekeeper {

LocaleRegistry::LocaleRegistry(std::vector<std::string> allowed, std::string default_locale)
    : allowed_(std::move(allowed)), default_locale_(std::move(default_locale)) {
  if (allowed_.empty()) {
    throw std::invalid_argument("로케일 허용 목록이 비어 있습니다");
  }
  if (!IsValid(default_locale_)) {
    throw std::invalid_argument("기본 로케일이 허용 목록에 없습니다: " + default_locale_);
  }
}

bool LocaleRegistry::IsValid(std::string_view code) const {
  return std::find(allowed_.begin(), allowed_.end(), code) != allowed_.end();
}

}  // namespace gatekeeper
